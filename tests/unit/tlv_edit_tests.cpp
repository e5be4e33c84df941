#include <doctest/doctest.h>
#include <paycodec/tlv.hpp>
#include <paycodec/tlv_edit.hpp>

using namespace paycodec;

TEST_CASE("split_tag_path") {
    CHECK(split_tag_path("e0: 9f33") == std::vector<std::string>{"E0", "9F33"});
    CHECK(split_tag_path("E0::9F33:") == std::vector<std::string>{"E0", "9F33"});
    CHECK(split_tag_path("").empty());
}

TEST_CASE("edit a top-level primitive") {
    auto registry = builtin_emv_tags();
    auto r = edit_tlv_value("9F3303E0F8C8", "9F33", "010203", registry);
    REQUIRE(r.isOk());
    CHECK(r.value() == "9F3303010203");
}

TEST_CASE("siblings are copied unchanged") {
    auto registry = builtin_emv_tags();
    auto r = edit_tlv_value("9F02060000000010009F1A020840", "9F1A", "0978", registry);
    REQUIRE(r.isOk());
    CHECK(r.value() == "9F02060000000010009F1A020978");
}

TEST_CASE("edit inside a template re-encodes the parent length") {
    auto registry = builtin_emv_tags();

    SUBCASE("same length") {
        auto r = edit_tlv_value("E0069F3303AABBCC", std::vector<std::string>{"E0", "9F33"}, "010203",
                                registry);
        REQUIRE(r.isOk());
        CHECK(r.value() == "E0069F3303010203");
    }

    SUBCASE("longer value") {
        auto r = edit_tlv_value("E0069F3303AABBCC", "E0:9F33", "01020304", registry);
        REQUIRE(r.isOk());
        CHECK(r.value() == "E0079F330401020304");
    }

    SUBCASE("two levels deep") {
        auto r = edit_tlv_value("E008E1069F3303AABBCC", "E0:E1:9F33", "01", registry);
        REQUIRE(r.isOk());
        CHECK(r.value() == "E006E1049F330101");
    }
}

TEST_CASE("edited output decodes to the new value") {
    auto registry = builtin_emv_tags();
    std::string big(256, 'A');  // 128 bytes
    auto r = edit_tlv_value("E0069F3303AABBCC", "E0:9F33", big, registry);
    REQUIRE(r.isOk());

    auto parsed = parse_tlv(r.value(), registry);
    CHECK(parsed.ok());
    const auto* e = find_tlv_element(parsed.elements, "9F33");
    REQUIRE(e != nullptr);
    CHECK(e->length == 128);
    CHECK(e->raw_hex.substr(0, 8) == "9F338180");
}

TEST_CASE("editing twice with the same value is stable") {
    auto registry = builtin_emv_tags();
    auto once = edit_tlv_value("E0069F3303AABBCC", "E0:9F33", "010203", registry);
    REQUIRE(once.isOk());
    auto twice = edit_tlv_value(once.value(), "E0:9F33", "010203", registry);
    REQUIRE(twice.isOk());
    CHECK(once.value() == twice.value());
}

TEST_CASE("tags missing from the dictionary can be edited") {
    auto registry = builtin_emv_tags();
    auto r = edit_tlv_value("DF0101FF", "DF01", "00", registry);
    REQUIRE(r.isOk());
    CHECK(r.value() == "DF010100");
}

TEST_CASE("edit errors") {
    auto registry = builtin_emv_tags();
    const std::string input = "E0069F3303AABBCC";

    SUBCASE("constructed target") {
        auto r = edit_tlv_value(input, "E0", "00", registry);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::UNSUPPORTED_OPERATION);
        CHECK(r.error().message() == "Editing constructed element value not supported");
        CHECK(input == "E0069F3303AABBCC");
    }

    SUBCASE("missing path segment") {
        auto r = edit_tlv_value(input, "E0:9F02", "00", registry);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NOT_FOUND);
        CHECK(r.error().message() == "Path segment not found: 9F02");
    }

    SUBCASE("invalid value") {
        auto odd = edit_tlv_value(input, "E0:9F33", "123", registry);
        REQUIRE(odd.isErr());
        CHECK(odd.error().code() == ErrorCode::MALFORMED_INPUT);

        auto bad = edit_tlv_value(input, "E0:9F33", "0G", registry);
        REQUIRE(bad.isErr());
        CHECK(bad.error().message() == "Invalid hex value (must be even length hex)");
    }

    SUBCASE("empty path") {
        auto r = edit_tlv_value(input, std::vector<std::string>{}, "00", registry);
        REQUIRE(r.isErr());
        CHECK(r.error().message() == "Empty path");
    }

    SUBCASE("input that does not decode cleanly") {
        auto r = edit_tlv_value("9F020600", "9F02", "00", registry);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::MALFORMED_INPUT);
        CHECK(r.error().message().find("Cannot edit TLV data") == 0);
    }
}
