#include "paycodec/tlv_format.hpp"

#include "paycodec/hex.hpp"

#include <sstream>

namespace paycodec {

namespace {

std::string hex_offset(size_t offset) {
    std::ostringstream out;
    out << "0x" << std::uppercase << std::hex << offset;
    return out.str();
}

bool is_text(const TlvElement& element) {
    return element.tag_info && element.tag_info->value_type == TagValueType::Text;
}

void format_element(std::ostringstream& out, const TlvElement& element, size_t depth,
                    const TlvFormatOptions& options) {
    out << std::string(depth * options.indent_size, ' ');

    if (options.show_offset) {
        out << "[" << hex_offset(element.offset) << "] ";
    }

    out << "Tag: " << element.tag;
    if (options.show_tag_info && element.tag_info) {
        out << " (" << element.tag_info->name << ")";
    }
    out << ", Length: " << element.length;

    if (element.length > 0) {
        if (element.value.size() > options.max_value_display_length) {
            out << ", Value: " << element.value.substr(0, options.max_value_display_length)
                << "... (" << element.value.size() / 2 << " bytes total)";
        } else {
            out << ", Value: " << element.value;
            if (is_text(element)) {
                std::string ascii = tlv_value_to_ascii(element.value);
                if (ascii != element.value) out << " (\"" << ascii << "\")";
            }
        }
    }
    out << "\n";

    for (const auto& child : element.children) {
        format_element(out, child, depth + 1, options);
    }
}

} // namespace

std::string format_tlv_text(const TlvParsingResult& result, const TlvFormatOptions& options) {
    std::ostringstream out;

    if (options.show_raw_hex) {
        out << "Raw Hex: " << result.raw_hex << "\n\n";
    }

    if (!result.errors.empty()) {
        out << "Parsing Errors:\n";
        for (size_t i = 0; i < result.errors.size(); ++i) {
            const auto& err = result.errors[i];
            out << "  " << (i + 1) << ". " << err.message;
            if (err.offset) {
                out << " (at offset " << hex_offset(*err.offset) << ")";
            }
            out << "\n";
        }
        out << "\n";
    }

    for (const auto& element : result.elements) {
        format_element(out, element, 0, options);
    }

    return out.str();
}

nlohmann::json tlv_element_to_json(const TlvElement& element) {
    nlohmann::json j;
    j["tag"] = element.tag;
    j["length"] = element.length;
    j["value"] = element.value;
    j["offset"] = element.offset;
    if (element.is_unknown) {
        j["unknown"] = true;
    }
    if (is_text(element)) {
        j["text"] = tlv_value_to_ascii(element.value);
    }
    if (element.tag_info) {
        j["tag_info"] = {
            {"name", element.tag_info->name},
            {"description", element.tag_info->description},
            {"format", tag_format_to_string(element.tag_info->format)},
            {"class", tag_class_to_string(element.tag_info->tag_class)},
        };
    }
    if (!element.children.empty()) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : element.children) {
            children.push_back(tlv_element_to_json(child));
        }
        j["children"] = children;
    }
    return j;
}

nlohmann::json tlv_to_json(const TlvParsingResult& result) {
    nlohmann::json j;
    j["raw_hex"] = result.raw_hex;

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& err : result.errors) {
        nlohmann::json e;
        e["code"] = error_code_to_string(err.code);
        e["message"] = err.message;
        if (err.offset) e["offset"] = *err.offset;
        if (err.tag_id) e["tag_id"] = *err.tag_id;
        errors.push_back(e);
    }
    j["errors"] = errors;

    nlohmann::json elements = nlohmann::json::array();
    for (const auto& element : result.elements) {
        elements.push_back(tlv_element_to_json(element));
    }
    j["elements"] = elements;
    return j;
}

std::string tlv_value_to_ascii(const std::string& value_hex) {
    auto bytes = hex_to_bytes(value_hex);
    if (!bytes) return value_hex;

    std::string ascii;
    for (uint8_t b : *bytes) {
        if (b < 32 || b > 126) return value_hex;
        ascii += static_cast<char>(b);
    }
    return ascii;
}

} // namespace paycodec
