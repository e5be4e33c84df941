#include "paycodec/hex.hpp"
#include "paycodec/tlv.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace paycodec {

namespace {

struct TagReadResult {
    bool ok = false;
    ErrorCode error_code = ErrorCode::TRUNCATED;
    std::string error;
    std::string tag;
    size_t tag_bytes = 0;
};

// Subsequent tag bytes follow when the low five bits of the first are all set,
// and continue while bit 8 is set.
TagReadResult read_tag(const std::vector<uint8_t>& data, size_t offset, size_t end) {
    TagReadResult result;

    size_t pos = offset;
    uint8_t first = data[pos++];
    if ((first & 0x1F) == 0x1F) {
        while (true) {
            if (pos >= end) {
                result.error = "Unexpected end of data during tag parsing";
                return result;
            }
            uint8_t next = data[pos++];
            if (pos - offset > TLV_MAX_TAG_BYTES) {
                result.error_code = ErrorCode::LIMIT_EXCEEDED;
                result.error = "Tag too long, possible malformed data";
                return result;
            }
            if ((next & 0x80) == 0) break;
        }
    }

    result.ok = true;
    result.tag_bytes = pos - offset;
    result.tag = bytes_to_hex(&data[offset], result.tag_bytes);
    return result;
}

TlvParsingError make_error(ErrorCode code, std::string message, size_t offset,
                           std::optional<std::string> tag_id = std::nullopt) {
    TlvParsingError err;
    err.code = code;
    err.message = std::move(message);
    err.offset = offset;
    err.tag_id = std::move(tag_id);
    return err;
}

class TlvDecoder {
public:
    TlvDecoder(const std::vector<uint8_t>& data, const TagRegistry& registry,
               const TlvParseOptions& options)
        : data_(data), registry_(registry), options_(options) {}

    // Decodes [begin, end). Returns true when decoding must stop.
    bool decode(size_t begin, size_t end, size_t depth,
                std::vector<TlvElement>& elements, std::vector<TlvParsingError>& errors) {
        size_t pos = begin;
        while (pos < end) {
            size_t start = pos;
            if (!decode_one(start, begin, end, depth, elements, errors, pos)) {
                if (options_.stop_on_error) return true;
                pos = start + 1;
                spdlog::trace("parse_tlv: resync at offset {}", pos);
            } else if (stop_) {
                return true;
            }
        }
        return false;
    }

private:
    // Returns false on an error that requires resynchronisation. On success
    // next is set past the element.
    bool decode_one(size_t start, size_t begin, size_t end, size_t depth,
                    std::vector<TlvElement>& elements, std::vector<TlvParsingError>& errors,
                    size_t& next) {
        auto tag = read_tag(data_, start, end);
        if (!tag.ok) {
            errors.push_back(make_error(tag.error_code, tag.error, start));
            return false;
        }

        auto info = registry_.get_tag_info(tag.tag);
        if (!info && !options_.ignore_unknown_tags) {
            errors.push_back(make_error(ErrorCode::UNKNOWN_IDENTIFIER,
                                        "Unknown tag: " + tag.tag, start, tag.tag));
            return false;
        }

        size_t length_offset = start + tag.tag_bytes;
        auto len = detail::decode_length_bounded(data_, length_offset, end);
        if (!len.ok) {
            errors.push_back(make_error(len.error_code, len.error, start, tag.tag));
            return false;
        }

        size_t value_offset = length_offset + len.length_bytes;
        if (len.length > end - value_offset) {
            errors.push_back(make_error(ErrorCode::TRUNCATED,
                                        "Unexpected end of data during value parsing for tag " + tag.tag,
                                        start, tag.tag));
            return false;
        }
        size_t value_end = value_offset + len.length;

        TlvElement element;
        element.tag = tag.tag;
        element.length = len.length;
        element.value = bytes_to_hex(data_.data() + value_offset, len.length);
        element.raw_hex = bytes_to_hex(data_.data() + start, value_end - start);
        element.offset = start - begin;
        element.tag_info = info;
        element.is_unknown = !info.has_value();

        if (info && info->is_constructed() && options_.parse_constructed) {
            if (depth + 1 > options_.max_depth) {
                errors.push_back(make_error(ErrorCode::LIMIT_EXCEEDED,
                                            "Maximum nesting depth " + std::to_string(options_.max_depth) +
                                                " exceeded at tag " + tag.tag,
                                            start, tag.tag));
                if (options_.stop_on_error) stop_ = true;
            } else {
                decode_children(element, value_offset, value_end, depth, errors);
            }
        }

        elements.push_back(std::move(element));
        next = value_end;
        return true;
    }

    void decode_children(TlvElement& element, size_t value_offset, size_t value_end, size_t depth,
                         std::vector<TlvParsingError>& errors) {
        std::vector<TlvParsingError> nested;
        bool stopped = decode(value_offset, value_end, depth + 1, element.children, nested);
        element.constructed = true;

        for (auto& err : nested) {
            err.message = "Error parsing constructed tag " + element.tag + ": " + err.message;
            if (!err.tag_id) err.tag_id = element.tag;
            errors.push_back(std::move(err));
        }

        if (stopped || (!nested.empty() && options_.stop_on_error)) stop_ = true;
    }

    const std::vector<uint8_t>& data_;
    const TagRegistry& registry_;
    const TlvParseOptions& options_;
    bool stop_ = false;
};

size_t count_recursive(const std::vector<TlvElement>& elements) {
    size_t n = 0;
    for (const auto& e : elements) {
        n += 1 + count_recursive(e.children);
    }
    return n;
}

} // namespace

TlvParsingResult parse_tlv(const std::string& hex, const TagRegistry& registry,
                           const TlvParseOptions& options) {
    TlvParsingResult result;
    result.raw_hex = normalize_hex(hex);

    std::optional<std::vector<uint8_t>> bytes;
    if (is_valid_hex(result.raw_hex)) bytes = hex_to_bytes(result.raw_hex);
    if (!bytes) {
        TlvParsingError err;
        err.code = ErrorCode::MALFORMED_INPUT;
        err.message = "Invalid hexadecimal string";
        result.errors.push_back(std::move(err));
        return result;
    }

    TlvDecoder decoder(*bytes, registry, options);
    decoder.decode(0, bytes->size(), 0, result.elements, result.errors);

    spdlog::debug("parse_tlv: {} bytes, {} elements, {} errors", bytes->size(),
                  count_recursive(result.elements), result.errors.size());
    return result;
}

const TlvElement* find_tlv_element(const std::vector<TlvElement>& elements, const std::string& tag) {
    std::string wanted = normalize_hex(tag);
    for (const auto& e : elements) {
        if (e.tag == wanted) return &e;
        if (const auto* found = find_tlv_element(e.children, wanted)) return found;
    }
    return nullptr;
}

size_t count_tlv_elements(const std::vector<TlvElement>& elements) {
    return count_recursive(elements);
}

} // namespace paycodec
