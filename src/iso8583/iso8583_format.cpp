#include "paycodec/iso8583_format.hpp"

#include <sstream>

namespace paycodec {

const char* mti_class_description(char code) {
    switch (code) {
        case '0': return "Authorization";
        case '1': return "Financial";
        case '2': return "File Actions";
        case '3': return "File Update";
        case '4': return "Reversal";
        case '5': return "Reconciliation";
        case '6': return "Administrative";
        case '7': return "Fee Collection";
        case '8': return "Network Management";
        case '9': return "Reserved for ISO use";
        default: return "Unknown";
    }
}

const char* mti_function_description(char code) {
    switch (code) {
        case '0': return "Request";
        case '1': return "Request Response";
        case '2': return "Advice";
        case '3': return "Advice Response";
        case '4': return "Notification";
        case '5': return "Notification Acknowledgement";
        case '6': return "Instruction";
        case '7': return "Instruction Acknowledgement";
        case '8':
        case '9': return "Reserved for ISO use";
        default: return "Unknown";
    }
}

const char* mti_origin_description(char code) {
    switch (code) {
        case '0': return "Acquirer";
        case '1': return "Acquirer Repeat";
        case '2': return "Issuer";
        case '3': return "Issuer Repeat";
        case '4': return "Other";
        case '5': return "Other Repeat";
        case '6':
        case '7':
        case '8':
        case '9': return "Reserved for ISO use";
        default: return "Unknown";
    }
}

namespace {

void format_mti(std::ostringstream& out, const MessageTypeIndicator& mti, bool verbose) {
    out << "Message Type Indicator (MTI): " << mti.raw << "\n";
    if (!verbose) return;
    out << "  Version: " << iso_version_to_string(mti.version) << "\n";
    out << "  Class: " << mti.mti_class << " - " << mti_class_description(mti.mti_class) << "\n";
    out << "  Function: " << mti.function << " - " << mti_function_description(mti.function) << "\n";
    out << "  Origin: " << mti.origin << " - " << mti_origin_description(mti.origin) << "\n";
}

void format_bitmap(std::ostringstream& out, const Bitmap& bitmap, bool show_raw) {
    out << "Bitmap:\n";
    if (show_raw) {
        out << "  Primary: " << bitmap.primary << "\n";
        if (bitmap.secondary) out << "  Secondary: " << *bitmap.secondary << "\n";
        if (bitmap.tertiary) out << "  Tertiary: " << *bitmap.tertiary << "\n";
        out << "\n";
    }
    out << "  Present Fields: ";
    for (size_t i = 0; i < bitmap.present_fields.size(); ++i) {
        if (i > 0) out << ", ";
        out << bitmap.present_fields[i];
    }
    out << "\n";
}

void format_field(std::ostringstream& out, const IsoField& field, bool show_details, bool show_raw) {
    out << "  Field " << field.id;
    if (field.definition) out << " - " << field.definition->name;
    out << "\n";

    if (show_details && field.definition) {
        const auto& def = *field.definition;
        out << "    Format: " << field_format_to_string(def.format)
            << ", Length Type: " << length_type_to_string(def.length_type);
        if (def.is_variable()) {
            out << ", Max Length: " << def.effective_max_length();
        } else {
            out << ", Length: " << def.length;
        }
        out << "\n";
        if (!def.description.empty()) {
            out << "    Description: " << def.description << "\n";
        }
    }

    out << "    Value: " << field.value << "\n";
    if (show_raw) out << "    Raw: " << field.raw << "\n";
}

} // namespace

std::string format_iso8583_text(const Iso8583ParseResult& result, const IsoFormatOptions& options) {
    std::ostringstream out;

    if (options.show_raw_data) {
        out << "Raw Message: " << result.raw_message << "\n\n";
    }

    if (!result.errors.empty()) {
        out << "Parsing Errors:\n";
        for (size_t i = 0; i < result.errors.size(); ++i) {
            const auto& err = result.errors[i];
            out << "  " << (i + 1) << ". " << err.message;
            if (err.field_id) out << " (Field " << *err.field_id << ")";
            if (err.position) out << " (at position " << *err.position << ")";
            out << "\n";
        }
        out << "\n";
    }

    format_mti(out, result.mti, options.verbose_mti);
    out << "\n";
    format_bitmap(out, result.bitmap, options.show_raw_data);
    out << "\n";

    out << "Data Elements:\n";
    size_t shown = 0;
    for (const auto& [id, field] : result.fields) {
        if (options.hide_empty_fields && field.value.empty()) continue;
        format_field(out, field, options.show_field_details, options.show_raw_data);
        ++shown;
    }
    if (shown == 0) {
        out << "  No data elements present\n";
    }

    return out.str();
}

nlohmann::json iso8583_to_json(const Iso8583ParseResult& result) {
    nlohmann::json j;

    j["mti"] = {
        {"raw", result.mti.raw},
        {"version", iso_version_to_string(result.mti.version)},
        {"class", std::string(1, result.mti.mti_class)},
        {"function", std::string(1, result.mti.function)},
        {"origin", std::string(1, result.mti.origin)},
    };

    nlohmann::json bitmap;
    bitmap["primary"] = result.bitmap.primary;
    if (result.bitmap.secondary) bitmap["secondary"] = *result.bitmap.secondary;
    if (result.bitmap.tertiary) bitmap["tertiary"] = *result.bitmap.tertiary;
    bitmap["present_fields"] = result.bitmap.present_fields;
    j["bitmap"] = bitmap;

    nlohmann::json fields = nlohmann::json::object();
    for (const auto& [id, field] : result.fields) {
        nlohmann::json f;
        f["id"] = field.id;
        f["value"] = field.value;
        f["raw"] = field.raw;
        if (field.length_indicator) f["length_indicator"] = *field.length_indicator;
        if (field.definition) {
            f["definition"] = {
                {"name", field.definition->name},
                {"format", field_format_to_string(field.definition->format)},
                {"length_type", length_type_to_string(field.definition->length_type)},
                {"length", field.definition->length},
                {"description", field.definition->description},
            };
        }
        fields[std::to_string(id)] = f;
    }
    j["fields"] = fields;

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& err : result.errors) {
        nlohmann::json e;
        e["code"] = error_code_to_string(err.code);
        e["message"] = err.message;
        if (err.field_id) e["field_id"] = *err.field_id;
        if (err.position) e["position"] = *err.position;
        errors.push_back(e);
    }
    j["errors"] = errors;
    j["raw_message"] = result.raw_message;
    return j;
}

} // namespace paycodec
