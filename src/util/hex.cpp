#include "paycodec/hex.hpp"

#include <cctype>

namespace paycodec {

namespace {

const char* HEX_DIGITS = "0123456789ABCDEF";

const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string strip_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}

} // namespace

std::string normalize_hex(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) continue;
        out += static_cast<char>(std::toupper(uc));
    }
    return out;
}

bool is_valid_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return false;
    for (char c : hex) {
        bool digit = c >= '0' && c <= '9';
        bool upper = c >= 'A' && c <= 'F';
        if (!digit && !upper) return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += HEX_DIGITS[data[i] >> 4];
        out += HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::string latin1_to_hex(const std::string& raw) {
    return bytes_to_hex(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

std::optional<std::string> hex_to_base64(const std::string& hex) {
    auto bytes = hex_to_bytes(normalize_hex(hex));
    if (!bytes) return std::nullopt;

    const auto& data = *bytes;
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

std::optional<std::string> base64_to_hex(const std::string& base64) {
    std::string encoded = strip_whitespace(base64);
    if (encoded.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> result;
    result.reserve(encoded.size() * 3 / 4);

    uint32_t n = 0;
    int bits = 0;
    size_t padding = 0;

    for (char c : encoded) {
        if (c == '=') {
            ++padding;
            continue;
        }
        // Data after padding
        if (padding > 0) return std::nullopt;

        int val = base64_value(static_cast<unsigned char>(c));
        if (val < 0) return std::nullopt;

        n = (n << 6) | static_cast<uint32_t>(val);
        bits += 6;

        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((n >> bits) & 0xFF));
        }
    }

    if (padding > 2) return std::nullopt;
    return bytes_to_hex(result);
}

bool is_likely_base64(const std::string& input) {
    std::string s = strip_whitespace(input);
    if (s.empty() || s.size() % 4 != 0) return false;

    size_t padding = 0;
    for (char c : s) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return false;
        if (base64_value(static_cast<unsigned char>(c)) < 0) return false;
    }
    return padding <= 2;
}

InputFormat detect_input_format(const std::string& input) {
    std::string hex = normalize_hex(input);
    if (hex.empty()) return InputFormat::Unknown;
    if (is_valid_hex(hex)) return InputFormat::Hex;
    if (is_likely_base64(input) && base64_to_hex(input)) return InputFormat::Base64;
    return InputFormat::Unknown;
}

std::optional<std::string> to_hex_input(const std::string& input) {
    switch (detect_input_format(input)) {
        case InputFormat::Hex: return normalize_hex(input);
        case InputFormat::Base64: return base64_to_hex(input);
        default: return std::nullopt;
    }
}

} // namespace paycodec
