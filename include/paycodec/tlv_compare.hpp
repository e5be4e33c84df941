#pragma once

#include "paycodec/tlv.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace paycodec {

// ============================================================================
// TLV Comparison
// ============================================================================

enum class DiffStatus {
    Added,     // only in right
    Removed,   // only in left
    Modified,  // in both, value differs
    Unchanged
};

inline const char* diff_status_to_string(DiffStatus s) {
    switch (s) {
        case DiffStatus::Added: return "added";
        case DiffStatus::Removed: return "removed";
        case DiffStatus::Modified: return "modified";
        case DiffStatus::Unchanged: return "unchanged";
        default: return "unchanged";
    }
}

struct TlvDiffEntry {
    std::string path;  // "E0:9F26"
    DiffStatus status = DiffStatus::Unchanged;
    std::optional<TlvElement> left;
    std::optional<TlvElement> right;
};

struct TlvComparison {
    std::vector<TlvDiffEntry> entries;  // sorted by path
    size_t added = 0;
    size_t removed = 0;
    size_t modified = 0;
    size_t unchanged = 0;

    size_t differences_count() const { return added + removed + modified; }
    bool identical() const { return differences_count() == 0; }
};

struct CompareOptions {
    bool include_unknown_tags = true;
};

// Path -> element for the whole tree. The first occurrence of a path wins.
std::map<std::string, TlvElement> build_tag_path_map(const std::vector<TlvElement>& elements);

TlvComparison compare_tlv(const std::vector<TlvElement>& left,
                          const std::vector<TlvElement>& right,
                          const CompareOptions& options = {});

// Plain-text report with summary and per-category sections
std::string format_comparison_report(const TlvComparison& comparison,
                                     const std::string& left_label,
                                     const std::string& right_label);

// "E0:9F26" -> "E0 > 9F26"
std::string display_tag_path(const std::string& path);

} // namespace paycodec
