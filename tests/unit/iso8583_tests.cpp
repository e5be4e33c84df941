#include <doctest/doctest.h>
#include <paycodec/hex.hpp>
#include <paycodec/iso8583.hpp>

#include <algorithm>
#include <random>

using namespace paycodec;

namespace {

// 0100 with fields 2, 3, 4, 7 and 11
const std::string AUTH_REQUEST = std::string("0100") + "7220000000000000" + "16" + "4111111111111111" +
                                 "000000" + "000000001000" + "0101123045" + "123456";

} // namespace

// ============================================================================
// MTI
// ============================================================================

TEST_CASE("parse_mti splits the four positions") {
    auto r = parse_mti("0100", IsoVersion::V1987);
    REQUIRE(r.ok);
    CHECK(r.mti.raw == "0100");
    CHECK(r.mti.version == IsoVersion::V1987);
    CHECK(r.mti.mti_class == '1');
    CHECK(r.mti.function == '0');
    CHECK(r.mti.origin == '0');
}

TEST_CASE("parse_mti derives the version from the first digit") {
    CHECK(parse_mti("1200", IsoVersion::V1987).mti.version == IsoVersion::V1993);
    CHECK(parse_mti("2200", IsoVersion::V1987).mti.version == IsoVersion::V2003);
    CHECK(parse_mti("9200", IsoVersion::V1993).mti.version == IsoVersion::V1993);
}

TEST_CASE("parse_mti rejects anything but four digits") {
    CHECK_FALSE(parse_mti("01A0", IsoVersion::V1987).ok);
    CHECK_FALSE(parse_mti("010", IsoVersion::V1987).ok);
    CHECK(parse_mti("01000", IsoVersion::V1987).error == "Invalid MTI format");
}

// ============================================================================
// Bitmap
// ============================================================================

TEST_CASE("bitmap_fields numbers bits from one") {
    CHECK(bitmap_fields("7220000000000000", 0) == std::vector<int>{2, 3, 4, 7, 11});
    CHECK(bitmap_fields("0000000000000001", 64) == std::vector<int>{128});
    CHECK(bitmap_fields("zz", 0).empty());
}

TEST_CASE("encode_bitmap_segment inverts bitmap_fields") {
    CHECK(encode_bitmap_segment({2, 3, 4, 7, 11}, 0) == "7220000000000000");
    CHECK(encode_bitmap_segment({1, 70, 128}, 64) == "0400000000000001");

    std::vector<std::vector<int>> sets = {{}, {1}, {64}, {2, 33, 63}, {1, 2, 3, 4, 5, 6, 7, 8, 9, 64}};
    for (const auto& fields : sets) {
        CHECK(bitmap_fields(encode_bitmap_segment(fields, 0), 0) == fields);
    }
}

TEST_CASE("parse_bitmap primary only") {
    auto r = parse_bitmap(AUTH_REQUEST, 4, Iso8583ParseOptions{});
    REQUIRE(r.ok);
    CHECK(r.bitmap.primary == "7220000000000000");
    CHECK_FALSE(r.bitmap.secondary.has_value());
    CHECK(r.bitmap.present_fields == std::vector<int>{2, 3, 4, 7, 11});
    CHECK(r.next_position == 20);
}

TEST_CASE("parse_bitmap follows secondary and tertiary indicators") {
    std::string message = std::string("0100") + "8000000000000000" + "8000000000000000" + "4000000000000000";

    SUBCASE("tertiary disabled") {
        auto r = parse_bitmap(message, 4, Iso8583ParseOptions{});
        REQUIRE(r.ok);
        CHECK(r.bitmap.secondary == std::string("8000000000000000"));
        CHECK_FALSE(r.bitmap.tertiary.has_value());
        CHECK(r.bitmap.present_fields.empty());
        CHECK(r.next_position == 36);
    }

    SUBCASE("tertiary enabled") {
        Iso8583ParseOptions options;
        options.include_tertiary_bitmap = true;
        auto r = parse_bitmap(message, 4, options);
        REQUIRE(r.ok);
        CHECK(r.bitmap.tertiary == std::string("4000000000000000"));
        CHECK(r.bitmap.present_fields == std::vector<int>{130});
        CHECK(r.next_position == 52);
    }

    SUBCASE("secondary disabled") {
        Iso8583ParseOptions options;
        options.include_secondary_bitmap = false;
        auto r = parse_bitmap(message, 4, options);
        REQUIRE(r.ok);
        CHECK_FALSE(r.bitmap.secondary.has_value());
        CHECK(r.next_position == 20);
    }
}

TEST_CASE("parse_bitmap errors") {
    SUBCASE("missing secondary") {
        auto r = parse_bitmap("0100C000000000000000", 4, Iso8583ParseOptions{});
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ErrorCode::TRUNCATED);
        CHECK(r.error == "Message too short for secondary bitmap");
    }

    SUBCASE("not hex") {
        auto r = parse_bitmap("010072200000000000ZZ", 4, Iso8583ParseOptions{});
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ErrorCode::MALFORMED_INPUT);
        CHECK(r.error == "Invalid primary bitmap: 72200000000000ZZ");
    }
}

TEST_CASE("parse_bitmap reports exactly the set bits") {
    SUBCASE("every single bit from 2 to 64") {
        for (int bit = 2; bit <= 64; ++bit) {
            CAPTURE(bit);
            std::vector<uint8_t> bytes(8, 0);
            bytes[(bit - 1) / 8] = static_cast<uint8_t>(0x80 >> ((bit - 1) % 8));
            auto r = parse_bitmap("0100" + bytes_to_hex(bytes), 4, Iso8583ParseOptions{});
            REQUIRE(r.ok);
            CHECK(r.bitmap.present_fields == std::vector<int>{bit});
            CHECK(r.next_position == 20);
        }
    }

    SUBCASE("random patterns without a secondary bitmap") {
        std::mt19937 rng(8583);
        std::uniform_int_distribution<int> byte_dist(0, 255);
        for (int round = 0; round < 500; ++round) {
            std::vector<uint8_t> bytes(8);
            for (auto& b : bytes) b = static_cast<uint8_t>(byte_dist(rng));
            bytes[0] &= 0x7F;

            std::vector<int> expected;
            for (int bit = 1; bit <= 64; ++bit) {
                if (bytes[(bit - 1) / 8] & (0x80 >> ((bit - 1) % 8))) expected.push_back(bit);
            }

            std::string hex = bytes_to_hex(bytes);
            CAPTURE(hex);
            auto r = parse_bitmap("0100" + hex, 4, Iso8583ParseOptions{});
            REQUIRE(r.ok);
            CHECK(r.bitmap.primary == hex);
            CHECK_FALSE(r.bitmap.secondary.has_value());
            CHECK(r.bitmap.present_fields == expected);
        }
    }
}

TEST_CASE("parse_bitmap binary mode") {
    Iso8583ParseOptions options;
    options.binary_bitmap = true;
    std::string message = std::string("0100") + std::string("\x72\x20\x00\x00\x00\x00\x00\x00", 8);
    auto r = parse_bitmap(message, 4, options);
    REQUIRE(r.ok);
    CHECK(r.bitmap.primary.size() == 8);
    CHECK(r.bitmap.present_fields == std::vector<int>{2, 3, 4, 7, 11});
    CHECK(r.next_position == 12);
}

// ============================================================================
// Message
// ============================================================================

TEST_CASE("authorization request decodes every present field") {
    auto registry = builtin_iso8583_fields();
    auto r = parse_iso8583(AUTH_REQUEST, registry);
    CHECK(r.ok());
    CHECK(r.mti.raw == "0100");
    CHECK(r.bitmap.present_fields == std::vector<int>{2, 3, 4, 7, 11});
    REQUIRE(r.fields.size() == 5);

    CHECK(r.fields[2].value == "4111111111111111");
    CHECK(r.fields[2].length_indicator == size_t{16});
    CHECK(r.fields[2].raw == "164111111111111111");
    REQUIRE(r.fields[2].definition.has_value());
    CHECK(r.fields[2].definition->name == "Primary Account Number (PAN)");

    CHECK(r.fields[3].value == "000000");
    CHECK(r.fields[4].value == "000000001000");
    CHECK_FALSE(r.fields[4].length_indicator.has_value());
    CHECK(r.fields[7].value == "0101123045");
    CHECK(r.fields[11].value == "123456");
}

TEST_CASE("field 3 is present when the second bit is set") {
    auto r = parse_iso8583(AUTH_REQUEST, builtin_iso8583_fields());
    const auto& present = r.bitmap.present_fields;
    CHECK(std::find(present.begin(), present.end(), 3) != present.end());
    CHECK(std::find(present.begin(), present.end(), 1) == present.end());
    CHECK_FALSE(r.bitmap.secondary.has_value());
}

TEST_CASE("secondary bitmap fields") {
    std::string message = std::string("0200") + "F000000000000000" + "0000000000000001" + "16" +
                          "4111111111111111" + "000000" + "000000001000" + "0123456789ABCDEF";
    auto r = parse_iso8583(message, builtin_iso8583_fields());
    CHECK(r.ok());
    CHECK(r.bitmap.present_fields == std::vector<int>{2, 3, 4, 128});
    CHECK(r.fields[128].value == "0123456789ABCDEF");
}

TEST_CASE("version follows the MTI") {
    std::string message = std::string("1100") + "2000000000000000" + "000000";
    auto r = parse_iso8583(message, builtin_iso8583_fields());
    CHECK(r.ok());
    CHECK(r.mti.version == IsoVersion::V1993);
}

TEST_CASE("message level errors") {
    auto registry = builtin_iso8583_fields();

    SUBCASE("too short") {
        auto r = parse_iso8583("0100722000", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].code == ErrorCode::MALFORMED_INPUT);
        CHECK(r.errors[0].message == "Message too short or invalid");
    }

    SUBCASE("bad MTI") {
        auto r = parse_iso8583("01X07220000000000000", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].message == "Invalid MTI format");
        CHECK(r.errors[0].position == size_t{0});
    }

    SUBCASE("bad bitmap") {
        auto r = parse_iso8583("010072200000000000ZZ", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].message == "Invalid primary bitmap: 72200000000000ZZ");
        CHECK(r.fields.empty());
    }
}

TEST_CASE("fields missing from the dictionary") {
    auto registry = builtin_iso8583_fields();
    // field 17 only
    std::string message = std::string("0100") + "0000800000000000" + "1234";

    SUBCASE("are errors when validating") {
        auto r = parse_iso8583(message, registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].code == ErrorCode::UNKNOWN_IDENTIFIER);
        CHECK(r.errors[0].message == "Unknown field definition for field 17");
        CHECK(r.errors[0].field_id == 17);
        CHECK(r.fields.empty());
    }

    SUBCASE("take one character when lenient") {
        Iso8583ParseOptions options;
        options.validate_fields = false;
        auto r = parse_iso8583(message, registry, options);
        CHECK(r.ok());
        REQUIRE(r.fields.count(17) == 1);
        CHECK(r.fields[17].value == "1");
        CHECK_FALSE(r.fields[17].definition.has_value());
    }
}

TEST_CASE("a one character undefined field shifts the fields after it") {
    // fields 17 and 18; 17 carries "1231" and 18 carries "5411" on the wire
    std::string message = std::string("0100") + "0000C00000000000" + "1231" + "5411";
    Iso8583ParseOptions options;
    options.validate_fields = false;
    auto r = parse_iso8583(message, builtin_iso8583_fields(), options);
    CHECK(r.ok());
    CHECK(r.bitmap.present_fields == std::vector<int>{17, 18});
    CHECK(r.fields[17].value == "1");
    REQUIRE(r.fields[18].definition.has_value());
    CHECK(r.fields[18].value == "2315");
}

TEST_CASE("PIN data is sixteen hex characters") {
    auto registry = builtin_iso8583_fields();
    auto definition = registry.get_field_definition(52, IsoVersion::V1987);
    REQUIRE(definition.has_value());
    CHECK(definition->length == 16);

    std::string message = std::string("0200") + "0000000000001000" + "0123456789ABCDEF";
    auto r = parse_iso8583(message, registry);
    CHECK(r.ok());
    CHECK(r.bitmap.present_fields == std::vector<int>{52});
    CHECK(r.fields[52].value == "0123456789ABCDEF");
}

TEST_CASE("private fields 102 to 125 are read as LLLVAR when undefined") {
    std::string message = std::string("0100") + "8000000000000000" + "0000000004000000" + "005" + "ABCDE";
    Iso8583ParseOptions options;
    options.validate_fields = false;
    auto r = parse_iso8583(message, builtin_iso8583_fields(), options);
    CHECK(r.ok());
    CHECK(r.bitmap.present_fields == std::vector<int>{102});
    CHECK(r.fields[102].value == "ABCDE");
    CHECK(r.fields[102].length_indicator == size_t{5});
    CHECK(r.fields[102].raw == "005ABCDE");
}

TEST_CASE("field overruns") {
    auto registry = builtin_iso8583_fields();

    SUBCASE("fixed field cut short") {
        auto r = parse_iso8583(std::string("0100") + "3000000000000000" + "000000" + "0000", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].code == ErrorCode::TRUNCATED);
        CHECK(r.errors[0].message == "Message too short for field 4 value");
        CHECK(r.errors[0].field_id == 4);
        CHECK(r.fields.count(3) == 1);
        CHECK(r.fields.count(4) == 0);
    }

    SUBCASE("variable value shorter than its indicator") {
        auto r = parse_iso8583(std::string("0100") + "4000000000000000" + "99" + "4111", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].message == "Message too short for field 2 value");
    }

    SUBCASE("indicator cut short") {
        auto r = parse_iso8583(std::string("0100") + "4000000000000000" + "1", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].message == "Message too short for field 2 length indicator");
    }

    SUBCASE("indicator not numeric") {
        auto r = parse_iso8583(std::string("0100") + "4000000000000000" + "1X" + "4111", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].code == ErrorCode::MALFORMED_INPUT);
        CHECK(r.errors[0].message == "Invalid length indicator for field 2: 1X");
    }

    SUBCASE("value above the field maximum is kept and flagged") {
        auto r = parse_iso8583(std::string("0100") + "4000000000000000" + "20" + "41111111111111111111", registry);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].code == ErrorCode::LIMIT_EXCEEDED);
        CHECK(r.errors[0].message == "Field 2 length 20 exceeds maximum 19");
        CHECK(r.fields[2].value == "41111111111111111111");
    }
}
