#include "paycodec/tlv_edit.hpp"

#include "paycodec/hex.hpp"
#include "paycodec/tlv.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace paycodec {

namespace {

Result<std::string> fail(ErrorCode code, const std::string& message) {
    return Result<std::string>::err(Error(code, message));
}

std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (const auto& seg : path) {
        if (!out.empty()) out += ":";
        out += seg;
    }
    return out;
}

// Re-encodes an element whose value changed
Result<std::string> reencode(TlvElement& element, std::string value) {
    auto len = encode_length(static_cast<int64_t>(value.size() / 2));
    if (len.isErr()) return len;
    element.length = value.size() / 2;
    element.value = std::move(value);
    element.raw_hex = element.tag + len.value() + element.value;
    return Result<std::string>::ok(element.raw_hex);
}

} // namespace

std::vector<std::string> split_tag_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == ':') {
            if (!current.empty()) segments.push_back(normalize_hex(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!normalize_hex(current).empty()) segments.push_back(normalize_hex(current));
    return segments;
}

Result<std::string> edit_tlv_value(const std::string& raw_hex,
                                   const std::vector<std::string>& path,
                                   const std::string& new_value_hex,
                                   const TagRegistry& registry) {
    std::string value = normalize_hex(new_value_hex);
    if (!is_valid_hex(value)) {
        return fail(ErrorCode::MALFORMED_INPUT, "Invalid hex value (must be even length hex)");
    }
    if (path.empty()) {
        return fail(ErrorCode::MALFORMED_INPUT, "Empty path");
    }

    TlvParseOptions options;
    options.ignore_unknown_tags = true;
    options.parse_constructed = true;
    auto parsed = parse_tlv(raw_hex, registry, options);
    if (!parsed.ok()) {
        return fail(ErrorCode::MALFORMED_INPUT,
                    "Cannot edit TLV data that does not decode cleanly: " + parsed.errors.front().message);
    }

    // Walk down, remembering the chain of ancestors
    std::vector<TlvElement>* level = &parsed.elements;
    std::vector<TlvElement*> chain;
    for (const auto& raw_segment : path) {
        std::string segment = normalize_hex(raw_segment);
        TlvElement* match = nullptr;
        for (auto& e : *level) {
            if (e.tag == segment) {
                match = &e;
                break;
            }
        }
        if (!match) {
            return fail(ErrorCode::NOT_FOUND, "Path segment not found: " + segment);
        }
        chain.push_back(match);
        level = &match->children;
    }

    TlvElement* target = chain.back();
    if (target->constructed) {
        return fail(ErrorCode::UNSUPPORTED_OPERATION, "Editing constructed element value not supported");
    }

    auto leaf = reencode(*target, value);
    if (leaf.isErr()) return leaf;

    // Rebuild ancestors bottom-up from their children
    for (size_t i = chain.size() - 1; i > 0; --i) {
        TlvElement* parent = chain[i - 1];
        std::string children_hex;
        for (const auto& child : parent->children) {
            children_hex += child.raw_hex;
        }
        auto rebuilt = reencode(*parent, std::move(children_hex));
        if (rebuilt.isErr()) return rebuilt;
    }

    std::string out;
    for (const auto& e : parsed.elements) {
        out += e.raw_hex;
    }

    spdlog::debug("edit_tlv_value: {} set to {} bytes, output {} bytes", join_path(path),
                  value.size() / 2, out.size() / 2);
    return Result<std::string>::ok(out);
}

Result<std::string> edit_tlv_value(const std::string& raw_hex,
                                   const std::string& path,
                                   const std::string& new_value_hex,
                                   const TagRegistry& registry) {
    return edit_tlv_value(raw_hex, split_tag_path(path), new_value_hex, registry);
}

} // namespace paycodec
