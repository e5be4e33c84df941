#include <doctest/doctest.h>
#include <paycodec/tlv_compare.hpp>

using namespace paycodec;

namespace {

std::vector<TlvElement> decode(const std::string& hex) {
    TlvParseOptions options;
    options.ignore_unknown_tags = true;
    return parse_tlv(hex, builtin_emv_tags(), options).elements;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("build_tag_path_map joins nested tags with colons") {
    auto map = build_tag_path_map(decode("E0069F3303E0F8C8"));
    REQUIRE(map.size() == 2);
    CHECK(map.count("E0") == 1);
    CHECK(map.count("E0:9F33") == 1);
    CHECK(map["E0:9F33"].value == "E0F8C8");
}

TEST_CASE("build_tag_path_map keeps the first of duplicate paths") {
    auto map = build_tag_path_map(decode("9F1A0208409F1A020978"));
    REQUIRE(map.size() == 1);
    CHECK(map["9F1A"].value == "0840");
}

TEST_CASE("compare classifies each path") {
    auto left = decode("9F02060000000010009F1A020840");
    auto right = decode("9F02060000000020009F3303E0F8C8");
    auto cmp = compare_tlv(left, right);

    CHECK(cmp.added == 1);
    CHECK(cmp.removed == 1);
    CHECK(cmp.modified == 1);
    CHECK(cmp.unchanged == 0);
    CHECK(cmp.differences_count() == 3);
    CHECK_FALSE(cmp.identical());

    REQUIRE(cmp.entries.size() == 3);
    CHECK(cmp.entries[0].path == "9F02");
    CHECK(cmp.entries[0].status == DiffStatus::Modified);
    CHECK(cmp.entries[0].left->value == "000000001000");
    CHECK(cmp.entries[0].right->value == "000000002000");
    CHECK(cmp.entries[1].path == "9F1A");
    CHECK(cmp.entries[1].status == DiffStatus::Removed);
    CHECK_FALSE(cmp.entries[1].right.has_value());
    CHECK(cmp.entries[2].path == "9F33");
    CHECK(cmp.entries[2].status == DiffStatus::Added);
}

TEST_CASE("identical streams") {
    auto left = decode("E0069F3303E0F8C8");
    auto cmp = compare_tlv(left, left);
    CHECK(cmp.identical());
    CHECK(cmp.unchanged == 2);
}

TEST_CASE("nested changes are reported at their full path") {
    auto cmp = compare_tlv(decode("E0069F3303E0F8C8"), decode("E0069F3303E0B8C8"));
    // the template value changes along with its child
    CHECK(cmp.modified == 2);
    CHECK(cmp.entries[1].path == "E0:9F33");
    CHECK(cmp.entries[1].status == DiffStatus::Modified);
}

TEST_CASE("unknown tags can be left out") {
    auto left = decode("DF0101FF9F1A020840");
    auto right = decode("DF0101009F1A020840");

    CHECK(compare_tlv(left, right).modified == 1);

    CompareOptions options;
    options.include_unknown_tags = false;
    auto cmp = compare_tlv(left, right, options);
    CHECK(cmp.identical());
    CHECK(cmp.entries.size() == 1);
}

TEST_CASE("comparison report") {
    SUBCASE("no differences") {
        auto cmp = compare_tlv(decode("9F1A020840"), decode("9F1A020840"));
        auto report = format_comparison_report(cmp, "a.hex", "b.hex");
        CHECK(report.find("TLV Comparison Report\n") == 0);
        CHECK(contains(report, "Left side: a.hex\n"));
        CHECK(contains(report, "- Total differences: 0\n"));
        CHECK(contains(report, "No differences found.\n"));
    }

    SUBCASE("with differences") {
        auto cmp = compare_tlv(decode("9F02060000000010009F1A020840"),
                               decode("9F02060000000020009F3303E0F8C8"));
        auto report = format_comparison_report(cmp, "left", "right");
        CHECK(contains(report, "- Total differences: 3\n"));
        CHECK(contains(report, "Added Tags (present in right, not in left):\n- 9F33 (Terminal Capabilities)\n"));
        CHECK(contains(report, "Removed Tags (present in left, not in right):\n- 9F1A"));
        CHECK(contains(report, "Modified Tags (different values):\n- 9F02 (Amount, Authorised (Numeric))\n"
                               "  Left:  000000001000\n  Right: 000000002000\n"));
        CHECK_FALSE(contains(report, "No differences found."));
    }
}

TEST_CASE("display_tag_path") {
    CHECK(display_tag_path("E0:9F33") == "E0 > 9F33");
    CHECK(display_tag_path("9F02") == "9F02");
}
