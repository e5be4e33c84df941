#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace paycodec {

// ============================================================================
// Hex Strings
// ============================================================================

// Strip all whitespace and fold to uppercase
std::string normalize_hex(const std::string& input);

// True if the string is [0-9A-F]* with even length (call on normalized input)
bool is_valid_hex(const std::string& hex);

// Decode a valid uppercase/lowercase hex string. Returns nullopt on bad input.
std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

std::string bytes_to_hex(const uint8_t* data, size_t len);
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

// Each char of the input taken as one byte
std::string latin1_to_hex(const std::string& raw);

// ============================================================================
// Base64
// ============================================================================

std::optional<std::string> hex_to_base64(const std::string& hex);

// Returns uppercase hex, nullopt when the input is not valid Base64
std::optional<std::string> base64_to_hex(const std::string& base64);

// Alphabet, padding and length shape only
bool is_likely_base64(const std::string& input);

enum class InputFormat {
    Hex,
    Base64,
    Unknown
};

inline const char* input_format_to_string(InputFormat f) {
    switch (f) {
        case InputFormat::Hex: return "hex";
        case InputFormat::Base64: return "base64";
        case InputFormat::Unknown: return "unknown";
        default: return "unknown";
    }
}

InputFormat detect_input_format(const std::string& input);

// Hex input is normalized, Base64 is converted; nullopt when neither
std::optional<std::string> to_hex_input(const std::string& input);

} // namespace paycodec
