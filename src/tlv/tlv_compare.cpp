#include "paycodec/tlv_compare.hpp"

#include <sstream>

namespace paycodec {

namespace {

void collect_paths(const std::vector<TlvElement>& elements, const std::string& prefix,
                   std::map<std::string, TlvElement>& out) {
    for (const auto& e : elements) {
        std::string path = prefix.empty() ? e.tag : prefix + ":" + e.tag;
        out.emplace(path, e);  // keeps the first occurrence
        if (!e.children.empty()) {
            collect_paths(e.children, path, out);
        }
    }
}

std::string element_name(const std::optional<TlvElement>& e) {
    if (e && e->tag_info) return " (" + e->tag_info->name + ")";
    return "";
}

void write_section(std::ostringstream& out, const TlvComparison& cmp, DiffStatus status,
                   const char* heading) {
    bool any = false;
    for (const auto& entry : cmp.entries) {
        if (entry.status != status) continue;
        if (!any) {
            out << heading << "\n";
            any = true;
        }
        const auto& shown = entry.left ? entry.left : entry.right;
        out << "- " << display_tag_path(entry.path) << element_name(shown) << "\n";
        switch (status) {
            case DiffStatus::Added:
                out << "  Value: " << entry.right->value << "\n";
                break;
            case DiffStatus::Removed:
                out << "  Value: " << entry.left->value << "\n";
                break;
            case DiffStatus::Modified:
                out << "  Left:  " << entry.left->value << "\n";
                out << "  Right: " << entry.right->value << "\n";
                break;
            default:
                break;
        }
    }
    if (any) out << "\n";
}

} // namespace

std::map<std::string, TlvElement> build_tag_path_map(const std::vector<TlvElement>& elements) {
    std::map<std::string, TlvElement> out;
    collect_paths(elements, "", out);
    return out;
}

TlvComparison compare_tlv(const std::vector<TlvElement>& left,
                          const std::vector<TlvElement>& right,
                          const CompareOptions& options) {
    auto left_map = build_tag_path_map(left);
    auto right_map = build_tag_path_map(right);

    auto skipped = [&options](const TlvElement& e) {
        return !options.include_unknown_tags && e.is_unknown;
    };

    TlvComparison cmp;
    auto l = left_map.begin();
    auto r = right_map.begin();
    while (l != left_map.end() || r != right_map.end()) {
        TlvDiffEntry entry;
        if (r == right_map.end() || (l != left_map.end() && l->first < r->first)) {
            entry.path = l->first;
            entry.left = l->second;
            entry.status = DiffStatus::Removed;
            ++l;
        } else if (l == left_map.end() || r->first < l->first) {
            entry.path = r->first;
            entry.right = r->second;
            entry.status = DiffStatus::Added;
            ++r;
        } else {
            entry.path = l->first;
            entry.left = l->second;
            entry.right = r->second;
            entry.status = l->second.value == r->second.value ? DiffStatus::Unchanged
                                                               : DiffStatus::Modified;
            ++l;
            ++r;
        }

        if ((entry.left && skipped(*entry.left)) || (entry.right && skipped(*entry.right))) {
            continue;
        }

        switch (entry.status) {
            case DiffStatus::Added: ++cmp.added; break;
            case DiffStatus::Removed: ++cmp.removed; break;
            case DiffStatus::Modified: ++cmp.modified; break;
            case DiffStatus::Unchanged: ++cmp.unchanged; break;
        }
        cmp.entries.push_back(std::move(entry));
    }

    return cmp;
}

std::string display_tag_path(const std::string& path) {
    std::string out;
    for (char c : path) {
        if (c == ':') {
            out += " > ";
        } else {
            out += c;
        }
    }
    return out;
}

std::string format_comparison_report(const TlvComparison& comparison,
                                     const std::string& left_label,
                                     const std::string& right_label) {
    std::ostringstream out;
    out << "TLV Comparison Report\n";
    out << "===================\n\n";
    out << "Left side: " << left_label << "\n";
    out << "Right side: " << right_label << "\n\n";

    out << "Summary:\n";
    out << "- Total differences: " << comparison.differences_count() << "\n";
    out << "- Added tags: " << comparison.added << "\n";
    out << "- Removed tags: " << comparison.removed << "\n";
    out << "- Modified tags: " << comparison.modified << "\n\n";

    if (comparison.identical()) {
        out << "No differences found.\n";
        return out.str();
    }

    write_section(out, comparison, DiffStatus::Added, "Added Tags (present in right, not in left):");
    write_section(out, comparison, DiffStatus::Removed, "Removed Tags (present in left, not in right):");
    write_section(out, comparison, DiffStatus::Modified, "Modified Tags (different values):");

    return out.str();
}

} // namespace paycodec
