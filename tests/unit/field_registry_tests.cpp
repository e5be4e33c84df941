#include <doctest/doctest.h>
#include <paycodec/field_registry.hpp>

using namespace paycodec;

TEST_CASE("builtin field definitions") {
    auto registry = builtin_iso8583_fields();

    auto pan = registry.get_field_definition(2, IsoVersion::V1987);
    REQUIRE(pan.has_value());
    CHECK(pan->format == FieldFormat::Numeric);
    CHECK(pan->is_variable());
    CHECK(pan->length == 19);
    CHECK(pan->length_digits() == 2);

    auto code = registry.get_field_definition(3, IsoVersion::V1987);
    REQUIRE(code.has_value());
    CHECK_FALSE(code->is_variable());
    CHECK(code->length == 6);

    auto icc = registry.get_field_definition(55, IsoVersion::V1987);
    REQUIRE(icc.has_value());
    CHECK(icc->length_digits() == 3);
}

TEST_CASE("the same definitions serve every version") {
    auto registry = builtin_iso8583_fields();
    auto a = registry.get_field_definition(4, IsoVersion::V1987);
    auto b = registry.get_field_definition(4, IsoVersion::V2003);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->name == b->name);
}

TEST_CASE("private use fields are not predefined") {
    auto registry = builtin_iso8583_fields();
    CHECK_FALSE(registry.get_field_definition(102, IsoVersion::V1987).has_value());
    CHECK_FALSE(registry.get_field_definition(1, IsoVersion::V1987).has_value());
}

TEST_CASE("effective_max_length prefers an explicit maximum") {
    FieldDefinition def;
    def.length = 99;
    def.length_type = LengthType::Variable;
    CHECK(def.effective_max_length() == 99);
    def.max_length = 40;
    CHECK(def.effective_max_length() == 40);
}

TEST_CASE("register_field and upsert_field") {
    StaticFieldRegistry registry;
    FieldDefinition def;
    def.id = 120;
    def.name = "Private Data";
    def.length = 999;
    def.length_type = LengthType::Variable;
    CHECK(registry.register_field(def));
    CHECK_FALSE(registry.register_field(def));

    def.length = 255;
    CHECK(registry.upsert_field(def));
    CHECK(registry.get_field_definition(120, IsoVersion::V1993)->length == 255);
    CHECK(registry.all_fields().size() == 1);
}

TEST_CASE("field enum parsing") {
    CHECK(parse_iso_version("1993") == IsoVersion::V1993);
    CHECK_FALSE(parse_iso_version("2021").has_value());
    CHECK(parse_field_format("ANS") == FieldFormat::AlphaNumericSpecial);
    CHECK(parse_field_format("x+n") == FieldFormat::BinaryNumeric);
    CHECK(parse_length_type("variable") == LengthType::Variable);
    CHECK(std::string(field_format_to_string(FieldFormat::TrackData)) == "z");
}
