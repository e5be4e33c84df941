#pragma once

#include "paycodec/tag_registry.hpp"
#include "paycodec/types.hpp"

#include <string>
#include <vector>

namespace paycodec {

// Split "E0:9F33" into segments (uppercased, whitespace trimmed)
std::vector<std::string> split_tag_path(const std::string& path);

/**
 * @brief Replace the value of one primitive element and re-encode.
 *
 * The path lists tag ids from the outermost element down to the target;
 * at each level the first matching element is taken. The target's length
 * and every enclosing template's length are recomputed. Input that does not
 * decode cleanly is refused rather than re-encoded with bytes missing.
 */
Result<std::string> edit_tlv_value(const std::string& raw_hex,
                                   const std::vector<std::string>& path,
                                   const std::string& new_value_hex,
                                   const TagRegistry& registry);

// Path given as colon-separated tag ids, e.g. "E0:9F33"
Result<std::string> edit_tlv_value(const std::string& raw_hex,
                                   const std::string& path,
                                   const std::string& new_value_hex,
                                   const TagRegistry& registry);

} // namespace paycodec
