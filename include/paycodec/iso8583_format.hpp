#pragma once

#include "paycodec/iso8583.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace paycodec {

const char* mti_class_description(char code);
const char* mti_function_description(char code);
const char* mti_origin_description(char code);

struct IsoFormatOptions {
    bool show_field_details = true;
    bool show_raw_data = false;
    bool hide_empty_fields = true;
    bool verbose_mti = true;
};

std::string format_iso8583_text(const Iso8583ParseResult& result,
                                const IsoFormatOptions& options = {});

nlohmann::json iso8583_to_json(const Iso8583ParseResult& result);

} // namespace paycodec
