#include <doctest/doctest.h>
#include <paycodec/iso8583.hpp>
#include <paycodec/tlv.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace paycodec;

TEST_CASE("registries can be shared across decoding threads") {
    const auto tags = builtin_emv_tags();
    const auto fields = builtin_iso8583_fields();
    const std::string tlv = "E0069F3303E0F8C89F0206000000001000";
    const std::string iso = std::string("0100") + "7220000000000000" + "16" + "4111111111111111" +
                            "000000" + "000000001000" + "0101123045" + "123456";

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto tr = parse_tlv(tlv, tags);
                if (!tr.ok() || count_tlv_elements(tr.elements) != 3) ++failures;

                auto ir = parse_iso8583(iso, fields);
                if (!ir.ok() || ir.fields.size() != 5) ++failures;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(failures.load() == 0);
}
