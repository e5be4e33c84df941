#pragma once

#include "paycodec/tlv.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace paycodec {

struct TlvFormatOptions {
    size_t indent_size = 2;
    bool show_tag_info = true;
    bool show_offset = true;
    bool show_raw_hex = false;
    size_t max_value_display_length = 64;  // hex chars
};

std::string format_tlv_text(const TlvParsingResult& result, const TlvFormatOptions& options = {});

nlohmann::json tlv_to_json(const TlvParsingResult& result);
nlohmann::json tlv_element_to_json(const TlvElement& element);

// Printable ASCII rendering of a hex value, or the hex unchanged
std::string tlv_value_to_ascii(const std::string& value_hex);

} // namespace paycodec
