#include "paycodec/field_registry.hpp"

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

struct FieldSeed {
    int id;
    const char* name;
    FieldFormat format;
    size_t length;
    LengthType length_type;
    const char* description;
    const char* content_format;  // nullptr when none
};

constexpr LengthType FIXED = LengthType::Fixed;
constexpr LengthType VAR = LengthType::Variable;

const FieldSeed ISO8583_1987_FIELDS[] = {
    {2, "Primary Account Number (PAN)", FieldFormat::Numeric, 19, VAR, "Card number", nullptr},
    {3, "Processing Code", FieldFormat::Numeric, 6, FIXED, "Transaction type and account types affected", nullptr},
    {4, "Amount, Transaction", FieldFormat::Numeric, 12, FIXED, "Transaction amount in minor units of the transaction currency", nullptr},
    {5, "Amount, Settlement", FieldFormat::Numeric, 12, FIXED, "Transaction amount in the settlement currency", nullptr},
    {6, "Amount, Cardholder Billing", FieldFormat::Numeric, 12, FIXED, "Transaction amount in the cardholder billing currency", nullptr},
    {7, "Transmission Date and Time", FieldFormat::Numeric, 10, FIXED, "Date and time the message was sent, in GMT", "MMDDhhmmss"},
    {9, "Conversion Rate, Settlement", FieldFormat::Numeric, 8, FIXED, "Factor used to convert the transaction amount to the settlement amount", nullptr},
    {10, "Conversion Rate, Cardholder Billing", FieldFormat::Numeric, 8, FIXED, "Factor used to convert the transaction amount to the billing amount", nullptr},
    {11, "System Trace Audit Number (STAN)", FieldFormat::Numeric, 6, FIXED, "Number assigned by the message initiator to identify a transaction", nullptr},
    {12, "Time, Local Transaction", FieldFormat::Numeric, 6, FIXED, "Local time of the transaction at the card acceptor", "hhmmss"},
    {13, "Date, Local Transaction", FieldFormat::Numeric, 4, FIXED, "Local date of the transaction at the card acceptor", "MMDD"},
    {14, "Date, Expiration", FieldFormat::Numeric, 4, FIXED, "Card expiry date", "YYMM"},
    {15, "Date, Settlement", FieldFormat::Numeric, 4, FIXED, "Date the funds are settled", "MMDD"},
    {18, "Merchant Type", FieldFormat::Numeric, 4, FIXED, "Merchant category code", nullptr},
    {19, "Acquiring Institution Country Code", FieldFormat::Numeric, 3, FIXED, "ISO 3166 country code of the acquirer", nullptr},
    {22, "Point of Service Entry Mode", FieldFormat::Numeric, 3, FIXED, "Method used to capture the PAN and the PIN entry capability", nullptr},
    {23, "Card Sequence Number", FieldFormat::Numeric, 3, FIXED, "Distinguishes cards with the same PAN", nullptr},
    {24, "Network International Identifier (NII)", FieldFormat::Numeric, 3, FIXED, "Identifies the network of the acquirer or issuer", nullptr},
    {25, "Point of Service Condition Code", FieldFormat::Numeric, 2, FIXED, "Condition under which the transaction takes place", nullptr},
    {26, "Point of Service PIN Capture Code", FieldFormat::Numeric, 2, FIXED, "Maximum number of PIN characters the terminal accepts", nullptr},
    {28, "Amount, Transaction Fee", FieldFormat::BinaryNumeric, 9, FIXED, "Fee charged for the transaction, prefixed with C or D", nullptr},
    {32, "Acquiring Institution Identification Code", FieldFormat::Numeric, 11, VAR, "Identifies the acquiring institution", nullptr},
    {33, "Forwarding Institution Identification Code", FieldFormat::Numeric, 11, VAR, "Identifies the institution forwarding the request", nullptr},
    {35, "Track 2 Data", FieldFormat::TrackData, 37, VAR, "Magnetic stripe track 2 contents", nullptr},
    {36, "Track 3 Data", FieldFormat::Numeric, 104, VAR, "Magnetic stripe track 3 contents", nullptr},
    {37, "Retrieval Reference Number", FieldFormat::AlphaNumeric, 12, FIXED, "Reference assigned by the acquirer to identify the transaction", nullptr},
    {38, "Authorization Identification Response", FieldFormat::AlphaNumeric, 6, FIXED, "Approval code assigned by the authorizing institution", nullptr},
    {39, "Response Code", FieldFormat::AlphaNumeric, 2, FIXED, "Disposition of the message", nullptr},
    {41, "Card Acceptor Terminal Identification", FieldFormat::AlphaNumeric, 8, FIXED, "Identifies the terminal at the card acceptor location", nullptr},
    {42, "Card Acceptor Identification Code", FieldFormat::AlphaNumeric, 15, FIXED, "Identifies the card acceptor", nullptr},
    {43, "Card Acceptor Name/Location", FieldFormat::AlphaNumericSpecial, 40, FIXED, "Name and location of the card acceptor", nullptr},
    {44, "Additional Response Data", FieldFormat::AlphaNumericSpecial, 25, VAR, "Additional data returned with the response", nullptr},
    {45, "Track 1 Data", FieldFormat::AlphaNumericSpecial, 76, VAR, "Magnetic stripe track 1 contents", nullptr},
    {48, "Additional Data - Private", FieldFormat::AlphaNumericSpecial, 999, VAR, "Private use additional data", nullptr},
    {49, "Currency Code, Transaction", FieldFormat::Numeric, 3, FIXED, "ISO 4217 currency of the transaction amount", nullptr},
    {52, "Personal Identification Number (PIN) Data", FieldFormat::Binary, 16, FIXED, "Encrypted PIN block as hex", nullptr},
    {53, "Security Related Control Information", FieldFormat::Numeric, 16, FIXED, "Security data such as key indexes", nullptr},
    {54, "Additional Amounts", FieldFormat::AlphaNumericSpecial, 120, VAR, "Additional amounts such as cash back or balances", nullptr},
    {55, "ICC System Related Data", FieldFormat::Binary, 999, VAR, "EMV chip data as BER-TLV hex", nullptr},
    {60, "Reserved National", FieldFormat::AlphaNumericSpecial, 999, VAR, "Reserved for national use", nullptr},
    {61, "Reserved Private", FieldFormat::AlphaNumericSpecial, 999, VAR, "Reserved for private use", nullptr},
    {62, "Reserved Private", FieldFormat::AlphaNumericSpecial, 999, VAR, "Reserved for private use", nullptr},
    {63, "Reserved Private", FieldFormat::AlphaNumericSpecial, 999, VAR, "Reserved for private use", nullptr},
    {64, "Message Authentication Code (MAC)", FieldFormat::Binary, 16, FIXED, "MAC over the primary bitmap fields, as hex", nullptr},
    {70, "Network Management Information Code", FieldFormat::Numeric, 3, FIXED, "Purpose of a network management message", nullptr},
    {90, "Original Data Elements", FieldFormat::Numeric, 42, FIXED, "Key data elements of the original message", nullptr},
    {95, "Replacement Amounts", FieldFormat::AlphaNumeric, 42, FIXED, "Corrected amounts for a partial reversal", nullptr},
    {128, "Message Authentication Code (MAC)", FieldFormat::Binary, 16, FIXED, "MAC over the full message, as hex", nullptr},
};

FieldDefinition from_seed(const FieldSeed& seed) {
    FieldDefinition def;
    def.id = seed.id;
    def.name = seed.name;
    def.format = seed.format;
    def.length = seed.length;
    def.length_type = seed.length_type;
    def.description = seed.description;
    if (seed.content_format) def.content_format = std::string(seed.content_format);
    return def;
}

} // namespace

std::optional<IsoVersion> parse_iso_version(const std::string& s) {
    if (s == "1987") return IsoVersion::V1987;
    if (s == "1993") return IsoVersion::V1993;
    if (s == "2003") return IsoVersion::V2003;
    return std::nullopt;
}

std::optional<FieldFormat> parse_field_format(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "a") return FieldFormat::Alpha;
    if (lower == "n") return FieldFormat::Numeric;
    if (lower == "b") return FieldFormat::Binary;
    if (lower == "s") return FieldFormat::Special;
    if (lower == "an") return FieldFormat::AlphaNumeric;
    if (lower == "ans") return FieldFormat::AlphaNumericSpecial;
    if (lower == "as") return FieldFormat::AlphaSpecial;
    if (lower == "ns") return FieldFormat::NumericSpecial;
    if (lower == "z") return FieldFormat::TrackData;
    if (lower == "xn" || lower == "x+n") return FieldFormat::BinaryNumeric;
    return std::nullopt;
}

std::optional<LengthType> parse_length_type(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "fixed") return LengthType::Fixed;
    if (lower == "variable") return LengthType::Variable;
    return std::nullopt;
}

size_t FieldDefinition::length_digits() const {
    size_t digits = 1;
    for (size_t n = length; n >= 10; n /= 10) ++digits;
    return digits;
}

// ============================================================================
// StaticFieldRegistry
// ============================================================================

std::optional<FieldDefinition> StaticFieldRegistry::get_field_definition(int field_id,
                                                                         IsoVersion /* version */) const {
    auto it = fields_.find(field_id);
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

bool StaticFieldRegistry::register_field(FieldDefinition def) {
    if (fields_.count(def.id) > 0) return false;
    int id = def.id;
    fields_.emplace(id, std::move(def));
    return true;
}

bool StaticFieldRegistry::upsert_field(FieldDefinition def) {
    bool replaced = fields_.count(def.id) > 0;
    int id = def.id;
    fields_[id] = std::move(def);
    return replaced;
}

std::vector<FieldDefinition> StaticFieldRegistry::all_fields() const {
    std::vector<FieldDefinition> out;
    out.reserve(fields_.size());
    for (const auto& [id, def] : fields_) {
        out.push_back(def);
    }
    return out;
}

StaticFieldRegistry builtin_iso8583_fields() {
    StaticFieldRegistry registry;
    for (const auto& seed : ISO8583_1987_FIELDS) {
        registry.register_field(from_seed(seed));
    }
    return registry;
}

} // namespace paycodec
