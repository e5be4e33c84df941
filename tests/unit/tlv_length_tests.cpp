#include <doctest/doctest.h>
#include <paycodec/hex.hpp>
#include <paycodec/tlv.hpp>

using namespace paycodec;

TEST_CASE("encode_length short form") {
    CHECK(encode_length(0).value() == "00");
    CHECK(encode_length(6).value() == "06");
    CHECK(encode_length(0x7F).value() == "7F");
}

TEST_CASE("encode_length long form uses the minimum number of bytes") {
    CHECK(encode_length(0x80).value() == "8180");
    CHECK(encode_length(0xFF).value() == "81FF");
    CHECK(encode_length(0x100).value() == "820100");
    CHECK(encode_length(0x1234).value() == "821234");
    CHECK(encode_length(0x10000).value() == "83010000");
}

TEST_CASE("encode_length rejects negative lengths") {
    auto r = encode_length(-1);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::MALFORMED_INPUT);
}

TEST_CASE("decode_length short and long forms") {
    auto short_form = decode_length({0x05}, 0);
    CHECK(short_form.ok);
    CHECK(short_form.length == 5);
    CHECK(short_form.length_bytes == 1);

    auto one = decode_length({0x81, 0x80}, 0);
    CHECK(one.ok);
    CHECK(one.length == 128);
    CHECK(one.length_bytes == 2);

    auto two = decode_length({0xAA, 0x82, 0x01, 0x00}, 1);
    CHECK(two.ok);
    CHECK(two.length == 256);
    CHECK(two.length_bytes == 3);
}

TEST_CASE("decode_length inverts encode_length") {
    for (int64_t n : {0, 1, 127, 128, 255, 256, 65535, 65536, 16777216}) {
        auto encoded = encode_length(n);
        REQUIRE(encoded.isOk());
        auto bytes = *hex_to_bytes(encoded.value());
        auto decoded = decode_length(bytes, 0);
        REQUIRE(decoded.ok);
        CHECK(decoded.length == static_cast<size_t>(n));
        CHECK(decoded.length_bytes == bytes.size());
    }
}

TEST_CASE("decode_length errors") {
    SUBCASE("indefinite form") {
        auto r = decode_length({0x80, 0x00}, 0);
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ErrorCode::UNSUPPORTED_OPERATION);
    }

    SUBCASE("more than four length bytes") {
        auto r = decode_length({0x85, 0x00, 0x00, 0x00, 0x00, 0x01}, 0);
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ErrorCode::LIMIT_EXCEEDED);
    }

    SUBCASE("missing subsequent bytes") {
        auto r = decode_length({0x82, 0x01}, 0);
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ErrorCode::TRUNCATED);
    }

    SUBCASE("offset at end of data") {
        auto r = decode_length({0x01}, 1);
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ErrorCode::TRUNCATED);
    }
}
