#include <catch2/catch_test_macros.hpp>

#include "chatwarden/core/utils.hpp"

using namespace chatwarden;

TEST_CASE("trim strips surrounding whitespace", "[utils]") {
    CHECK(utils::trim("  hello  ") == "hello");
    CHECK(utils::trim("\t{\"a\":1}\r\n") == "{\"a\":1}");
    CHECK(utils::trim("   ") == "");
    CHECK(utils::trim("") == "");
}

TEST_CASE("split on a delimiter", "[utils]") {
    auto parts = utils::split("a,b,,c", ',');
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "a");
    CHECK(parts[2] == "");
    CHECK(parts[3] == "c");

    CHECK(utils::split("", ',').empty());
    CHECK(utils::split("single", ',').size() == 1);
}

TEST_CASE("to_lower folds ASCII", "[utils]") {
    CHECK(utils::to_lower("HeLLo World") == "hello world");
    CHECK(utils::to_lower("123!") == "123!");
}

TEST_CASE("address_local_part strips the domain", "[utils]") {
    CHECK(utils::address_local_part("15551234567@s.whatsapp.net") == "15551234567");
    CHECK(utils::address_local_part("12036302@g.us") == "12036302");
    CHECK(utils::address_local_part("no-domain") == "no-domain");
}

TEST_CASE("format_iso renders UTC", "[utils]") {
    auto ts = from_epoch_ms(0);
    CHECK(utils::format_iso(ts) == "1970-01-01T00:00:00Z");

    auto later = from_epoch_ms(1'700'000'000'000);
    CHECK(utils::format_iso(later) == "2023-11-14T22:13:20Z");
}

TEST_CASE("epoch millisecond conversion", "[utils]") {
    CHECK(to_epoch_ms(from_epoch_ms(1234567)) == 1234567);
}
