#include <catch2/catch_test_macros.hpp>

#include "chatwarden/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        chatwarden::Error err(chatwarden::ErrorCode::NotFound, "trigger not found");
        CHECK(err.code() == chatwarden::ErrorCode::NotFound);
        CHECK(err.message() == "trigger not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "trigger not found");
    }

    SECTION("error with detail") {
        chatwarden::Error err(chatwarden::ErrorCode::DatabaseError,
                              "query failed", "database is locked");
        CHECK(err.code() == chatwarden::ErrorCode::DatabaseError);
        CHECK(err.detail() == "database is locked");
        CHECK(err.what() == "query failed: database is locked");
    }
}

TEST_CASE("Transient errors are the I/O boundary codes", "[error]") {
    using chatwarden::ErrorCode;
    CHECK(chatwarden::make_error(ErrorCode::DatabaseError, "x").is_transient());
    CHECK(chatwarden::make_error(ErrorCode::ChannelError, "x").is_transient());
    CHECK(chatwarden::make_error(ErrorCode::IoError, "x").is_transient());
    CHECK_FALSE(chatwarden::make_error(ErrorCode::DuplicateKeyword, "x").is_transient());
    CHECK_FALSE(chatwarden::make_error(ErrorCode::InvalidConfig, "x").is_transient());
}

TEST_CASE("Result type error case", "[error]") {
    chatwarden::Result<int> result = std::unexpected(
        chatwarden::make_error(chatwarden::ErrorCode::InvalidArgument, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == chatwarden::ErrorCode::InvalidArgument);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("make_fail converts to any Result", "[error]") {
    chatwarden::Result<std::string> as_string =
        chatwarden::make_fail(chatwarden::make_error(chatwarden::ErrorCode::QueueClosed, "closed"));
    REQUIRE_FALSE(as_string.has_value());
    CHECK(as_string.error().code() == chatwarden::ErrorCode::QueueClosed);

    chatwarden::Result<void> as_void =
        chatwarden::make_fail(chatwarden::make_error(chatwarden::ErrorCode::NotFound, "gone"));
    CHECK_FALSE(as_void.has_value());

    CHECK(chatwarden::ok_result().has_value());
}

TEST_CASE("error_code_to_string", "[error]") {
    using chatwarden::ErrorCode;
    CHECK(chatwarden::error_code_to_string(ErrorCode::DuplicateKeyword) == "DUPLICATE_KEYWORD");
    CHECK(chatwarden::error_code_to_string(ErrorCode::QueueClosed) == "QUEUE_CLOSED");
    CHECK(chatwarden::error_code_to_string(ErrorCode::InvalidPattern) == "INVALID_PATTERN");
}
