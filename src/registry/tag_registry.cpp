#include "paycodec/tag_registry.hpp"

#include <algorithm>
#include <cctype>

namespace paycodec {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string normalize_tag_id(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) continue;
        result += static_cast<char>(std::toupper(uc));
    }
    return result;
}

// Class bits of the first tag byte
TagClass class_from_id(const std::string& id) {
    if (id.size() < 2) return TagClass::Universal;
    int hi = std::isdigit(static_cast<unsigned char>(id[0])) ? id[0] - '0' : id[0] - 'A' + 10;
    switch ((hi >> 2) & 0x03) {
        case 0: return TagClass::Universal;
        case 1: return TagClass::Application;
        case 2: return TagClass::ContextSpecific;
        default: return TagClass::Private;
    }
}

constexpr int NONE = -1;

struct TagSeed {
    const char* id;
    const char* name;
    const char* description;
    TagFormat format;
    int min_length;
    int max_length;
    int fixed_length;
    TagValueType value_type;
    bool proprietary;
};

constexpr TagFormat P = TagFormat::Primitive;
constexpr TagFormat C = TagFormat::Constructed;
constexpr TagValueType BIN = TagValueType::Binary;
constexpr TagValueType NUM = TagValueType::Numeric;
constexpr TagValueType TXT = TagValueType::Text;

const TagSeed EMV_TAGS[] = {
    // Templates
    {"61", "Application Template", "Contains one or more data objects relevant to an application directory entry", C, NONE, 252, NONE, BIN, false},
    {"6F", "File Control Information (FCI) Template", "Set of file control parameters and file management data", C, NONE, 252, NONE, BIN, false},
    {"70", "READ RECORD Response Message Template", "Template containing the data objects returned by READ RECORD", C, NONE, 252, NONE, BIN, false},
    {"73", "Directory Discretionary Template", "Issuer discretionary part of the directory", C, NONE, 252, NONE, BIN, false},
    {"77", "Response Message Template Format 2", "Data objects returned in the response to a command", C, NONE, NONE, NONE, BIN, false},
    {"A5", "File Control Information (FCI) Proprietary Template", "Proprietary data elements of the FCI", C, NONE, NONE, NONE, BIN, false},
    {"BF0C", "File Control Information (FCI) Issuer Discretionary Data", "Issuer discretionary part of the FCI", C, NONE, 222, NONE, BIN, false},
    {"E0", "Proprietary Template", "Private constructed template used to group terminal data", C, NONE, NONE, NONE, BIN, true},
    {"E1", "Proprietary Template 2", "Private constructed template used to group terminal data", C, NONE, NONE, NONE, BIN, true},

    // Card data
    {"4F", "Application Identifier (AID) - card", "Identifies the application as described in ISO/IEC 7816-5", P, 5, 16, NONE, BIN, false},
    {"50", "Application Label", "Mnemonic associated with the AID according to ISO/IEC 7816-5", P, 1, 16, NONE, TXT, false},
    {"57", "Track 2 Equivalent Data", "Contains the data elements of track 2 according to ISO/IEC 7813", P, NONE, 19, NONE, BIN, false},
    {"5A", "Application Primary Account Number (PAN)", "Valid cardholder account number", P, NONE, 10, NONE, NUM, false},
    {"5F20", "Cardholder Name", "Indicates cardholder name according to ISO 7813", P, 2, 26, NONE, TXT, false},
    {"5F24", "Application Expiration Date", "Date after which application expires (YYMMDD)", P, NONE, NONE, 3, NUM, false},
    {"5F25", "Application Effective Date", "Date from which the application may be used (YYMMDD)", P, NONE, NONE, 3, NUM, false},
    {"5F28", "Issuer Country Code", "Country of the issuer according to ISO 3166", P, NONE, NONE, 2, NUM, false},
    {"5F2A", "Transaction Currency Code", "Currency code of the transaction according to ISO 4217", P, NONE, NONE, 2, NUM, false},
    {"5F34", "Application PAN Sequence Number", "Identifies and differentiates cards with the same PAN", P, NONE, NONE, 1, NUM, false},
    {"80", "Response Message Template Format 1", "Data objects returned without tags in the response to a command", P, NONE, NONE, NONE, BIN, false},
    {"82", "Application Interchange Profile", "Capabilities of the card to support specific functions in the application", P, NONE, NONE, 2, BIN, false},
    {"84", "Dedicated File (DF) Name", "Identifies the name of the DF as described in ISO/IEC 7816-4", P, 5, 16, NONE, BIN, false},
    {"87", "Application Priority Indicator", "Priority of an application in a directory", P, NONE, NONE, 1, BIN, false},
    {"88", "Short File Identifier (SFI)", "Identifies the AEF referenced in commands", P, NONE, NONE, 1, BIN, false},
    {"8C", "Card Risk Management Data Object List 1 (CDOL1)", "Data objects to be passed with the first GENERATE AC", P, NONE, 252, NONE, BIN, false},
    {"8D", "Card Risk Management Data Object List 2 (CDOL2)", "Data objects to be passed with the second GENERATE AC", P, NONE, 252, NONE, BIN, false},
    {"8E", "Cardholder Verification Method (CVM) List", "Methods of cardholder verification supported by the application", P, 10, 252, NONE, BIN, false},
    {"91", "Issuer Authentication Data", "Data sent to the ICC for online issuer authentication", P, 8, 16, NONE, BIN, false},
    {"94", "Application File Locator (AFL)", "Location and range of records related to an application", P, NONE, 252, NONE, BIN, false},
    {"95", "Terminal Verification Results", "Status of the different functions as seen from the terminal", P, NONE, NONE, 5, BIN, false},
    {"9A", "Transaction Date", "Local date that the transaction was authorised (YYMMDD)", P, NONE, NONE, 3, NUM, false},
    {"9B", "Transaction Status Information", "Functions performed in a transaction", P, NONE, NONE, 2, BIN, false},
    {"9C", "Transaction Type", "Type of financial transaction, first two digits of ISO 8583 processing code", P, NONE, NONE, 1, NUM, false},

    // Terminal and transaction data
    {"9F02", "Amount, Authorised (Numeric)", "Authorised amount of the transaction (excluding adjustments)", P, NONE, NONE, 6, NUM, false},
    {"9F03", "Amount, Other (Numeric)", "Secondary amount associated with the transaction representing a cashback amount", P, NONE, NONE, 6, NUM, false},
    {"9F06", "Application Identifier (AID) - terminal", "Identifies the application as described in ISO/IEC 7816-5", P, 5, 16, NONE, BIN, false},
    {"9F07", "Application Usage Control", "Issuer's specified restrictions on the geographic usage and services allowed", P, NONE, NONE, 2, BIN, false},
    {"9F08", "Application Version Number (card)", "Version number assigned by the payment system for the application", P, NONE, NONE, 2, BIN, false},
    {"9F09", "Application Version Number (terminal)", "Version number assigned by the payment system for the application", P, NONE, NONE, 2, BIN, false},
    {"9F0D", "Issuer Action Code - Default", "Conditions that cause a transaction to be rejected if it might have been approved online", P, NONE, NONE, 5, BIN, false},
    {"9F0E", "Issuer Action Code - Denial", "Conditions that cause the denial of a transaction without attempt to go online", P, NONE, NONE, 5, BIN, false},
    {"9F0F", "Issuer Action Code - Online", "Conditions that cause a transaction to be transmitted online", P, NONE, NONE, 5, BIN, false},
    {"9F10", "Issuer Application Data", "Contains proprietary application data for transmission to the issuer", P, 0, 32, NONE, BIN, false},
    {"9F15", "Merchant Category Code", "Classifies the type of business being done by the merchant", P, NONE, NONE, 2, NUM, false},
    {"9F1A", "Terminal Country Code", "Country where the terminal is located according to ISO 3166", P, NONE, NONE, 2, NUM, false},
    {"9F1E", "Interface Device (IFD) Serial Number", "Unique and permanent serial number assigned to the IFD by the manufacturer", P, NONE, NONE, 8, TXT, false},
    {"9F21", "Transaction Time", "Local time that the transaction was authorised (HHMMSS)", P, NONE, NONE, 3, NUM, false},
    {"9F26", "Application Cryptogram", "Cryptogram returned by the ICC in response of the GENERATE AC command", P, NONE, NONE, 8, BIN, false},
    {"9F27", "Cryptogram Information Data", "Type of cryptogram and the actions to be performed by the terminal", P, NONE, NONE, 1, BIN, false},
    {"9F33", "Terminal Capabilities", "Card data input, CVM, and security capabilities of the terminal", P, NONE, NONE, 3, BIN, false},
    {"9F34", "Cardholder Verification Method (CVM) Results", "Results of the last CVM performed", P, NONE, NONE, 3, BIN, false},
    {"9F35", "Terminal Type", "Environment of the terminal, its communications capability, and its operational control", P, NONE, NONE, 1, NUM, false},
    {"9F36", "Application Transaction Counter (ATC)", "Counter maintained by the application in the ICC", P, NONE, NONE, 2, BIN, false},
    {"9F37", "Unpredictable Number", "Value to provide variability and uniqueness to the generation of a cryptogram", P, NONE, NONE, 4, BIN, false},
    {"9F38", "Processing Options Data Object List (PDOL)", "Terminal data objects required by the ICC for GET PROCESSING OPTIONS", P, NONE, 252, NONE, BIN, false},
    {"9F39", "Point-of-Service (POS) Entry Mode", "Method by which the PAN was entered", P, NONE, NONE, 1, NUM, false},
    {"9F40", "Additional Terminal Capabilities", "Data input and output capabilities of the terminal", P, NONE, NONE, 5, BIN, false},
    {"9F41", "Transaction Sequence Counter", "Counter maintained by the terminal, incremented by one for each transaction", P, 2, 4, NONE, NUM, false},
    {"9F6E", "Form Factor Indicator", "Form factor of the consumer payment device", P, NONE, NONE, 4, BIN, true},
};

TagInfo from_seed(const TagSeed& seed) {
    TagInfo info;
    info.id = seed.id;
    info.name = seed.name;
    info.description = seed.description;
    info.format = seed.format;
    info.tag_class = class_from_id(info.id);
    if (seed.min_length != NONE) info.min_length = static_cast<size_t>(seed.min_length);
    if (seed.max_length != NONE) info.max_length = static_cast<size_t>(seed.max_length);
    if (seed.fixed_length != NONE) info.fixed_length = static_cast<size_t>(seed.fixed_length);
    info.value_type = seed.value_type;
    info.is_proprietary = seed.proprietary;
    return info;
}

} // namespace

// ============================================================================
// Enum Parsing
// ============================================================================

std::optional<TagFormat> parse_tag_format(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "primitive") return TagFormat::Primitive;
    if (lower == "constructed") return TagFormat::Constructed;
    return std::nullopt;
}

std::optional<TagClass> parse_tag_class(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "universal") return TagClass::Universal;
    if (lower == "application") return TagClass::Application;
    if (lower == "context-specific" || lower == "context_specific") return TagClass::ContextSpecific;
    if (lower == "private") return TagClass::Private;
    return std::nullopt;
}

std::optional<TagValueType> parse_tag_value_type(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "binary") return TagValueType::Binary;
    if (lower == "numeric") return TagValueType::Numeric;
    if (lower == "text") return TagValueType::Text;
    if (lower == "mixed") return TagValueType::Mixed;
    return std::nullopt;
}

// ============================================================================
// StaticTagRegistry
// ============================================================================

std::optional<TagInfo> StaticTagRegistry::get_tag_info(const std::string& tag_id) const {
    auto it = tags_.find(normalize_tag_id(tag_id));
    if (it == tags_.end()) return std::nullopt;
    return it->second;
}

bool StaticTagRegistry::register_tag(TagInfo info) {
    info.id = normalize_tag_id(info.id);
    if (tags_.count(info.id) > 0) return false;
    std::string key = info.id;
    tags_.emplace(std::move(key), std::move(info));
    return true;
}

bool StaticTagRegistry::upsert_tag(TagInfo info) {
    info.id = normalize_tag_id(info.id);
    bool replaced = tags_.count(info.id) > 0;
    std::string key = info.id;
    tags_[key] = std::move(info);
    return replaced;
}

bool StaticTagRegistry::is_registered(const std::string& tag_id) const {
    return tags_.count(normalize_tag_id(tag_id)) > 0;
}

std::vector<TagInfo> StaticTagRegistry::all_tags() const {
    std::vector<TagInfo> out;
    out.reserve(tags_.size());
    for (const auto& [id, info] : tags_) {
        out.push_back(info);
    }
    return out;
}

StaticTagRegistry builtin_emv_tags() {
    StaticTagRegistry registry;
    for (const auto& seed : EMV_TAGS) {
        registry.register_tag(from_seed(seed));
    }
    return registry;
}

} // namespace paycodec
