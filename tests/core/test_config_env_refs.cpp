#include <catch2/catch_test_macros.hpp>

#include "chatwarden/core/config.hpp"

#include <cstdlib>

using namespace chatwarden;

TEST_CASE("Config ${VAR} resolution", "[core][config]") {
    SECTION("Resolves existing env var") {
        setenv("TEST_CHATWARDEN_VAR", "hello_world", 1);
        auto result = resolve_env_refs("prefix_${TEST_CHATWARDEN_VAR}_suffix");
        CHECK(result == "prefix_hello_world_suffix");
    }

    SECTION("Preserves unresolved vars") {
        auto result = resolve_env_refs("value=${NONEXISTENT_VAR_12345}");
        CHECK(result == "value=${NONEXISTENT_VAR_12345}");
    }

    SECTION("Handles multiple refs") {
        setenv("TEST_CW_A", "aaa", 1);
        setenv("TEST_CW_B", "bbb", 1);
        CHECK(resolve_env_refs("${TEST_CW_A}:${TEST_CW_B}") == "aaa:bbb");
    }

    SECTION("No refs returns input unchanged") {
        CHECK(resolve_env_refs("no refs here") == "no refs here");
        CHECK(resolve_env_refs("").empty());
    }
}

TEST_CASE("Config $${VAR} escaping", "[core][config]") {
    SECTION("Double dollar escapes to literal") {
        CHECK(resolve_env_refs("value=$${LITERAL}") == "value=${LITERAL}");
    }

    SECTION("Mixed escaping and resolution") {
        setenv("TEST_CW_REAL", "resolved", 1);
        CHECK(resolve_env_refs("$${ESCAPED} and ${TEST_CW_REAL}") == "${ESCAPED} and resolved");
    }
}
