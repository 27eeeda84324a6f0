#include <catch2/catch_test_macros.hpp>

#include "chatwarden/rate_limit/spam.hpp"
#include "test_helpers.hpp"

using namespace chatwarden;
using namespace chatwarden::rate_limit;
using namespace std::chrono_literals;

TEST_CASE("Sixth message inside the window is flagged", "[rate_limit][spam]") {
    test::FakeClock clock;
    SpamEscalator spam(ModerationConfig{}, clock.fn());

    for (int i = 1; i <= 5; ++i) {
        auto v = spam.observe("1555@s.whatsapp.net");
        CHECK_FALSE(v.flagged);
        CHECK(v.count == i);
        clock.advance(10s);
    }

    auto sixth = spam.observe("1555@s.whatsapp.net");
    CHECK(sixth.flagged);
    CHECK(sixth.count == 6);

    // Every further message in the window stays flagged.
    CHECK(spam.observe("1555@s.whatsapp.net").flagged);
}

TEST_CASE("Spam window slides", "[rate_limit][spam]") {
    test::FakeClock clock;
    ModerationConfig cfg;
    cfg.spam_threshold = 2;
    cfg.spam_window_seconds = 60;
    SpamEscalator spam(cfg, clock.fn());

    (void)spam.observe("s");
    (void)spam.observe("s");
    clock.advance(61s);
    auto v = spam.observe("s");
    CHECK_FALSE(v.flagged);
    CHECK(v.count == 1);
    CHECK(spam.count("s") == 1);
    CHECK(spam.count("unknown") == 0);
}

TEST_CASE("Senders are tracked independently", "[rate_limit][spam]") {
    test::FakeClock clock;
    ModerationConfig cfg;
    cfg.spam_threshold = 1;
    SpamEscalator spam(cfg, clock.fn());

    (void)spam.observe("a");
    CHECK_FALSE(spam.observe("b").flagged);
    CHECK(spam.observe("a").flagged);

    spam.clear_sender("a");
    CHECK(spam.count("a") == 0);
}

TEST_CASE("sweep drops idle senders", "[rate_limit][spam]") {
    test::FakeClock clock;
    SpamEscalator spam(ModerationConfig{}, clock.fn());

    (void)spam.observe("old");
    clock.advance(4min);
    (void)spam.observe("recent");
    clock.advance(2min);

    CHECK(spam.sweep() == 1);
    CHECK(spam.count("recent") == 1);
}

TEST_CASE("Spam warning mentions the local part", "[rate_limit][spam]") {
    CHECK(SpamEscalator::warning_text("15551234567@s.whatsapp.net") ==
          "⚠️ @15551234567, please slow down your messages to avoid being flagged as spam.");
}
