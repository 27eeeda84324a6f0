#include <catch2/catch_test_macros.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "chatwarden/service/bot_service.hpp"
#include "test_fakes.hpp"
#include "test_helpers.hpp"

using namespace chatwarden;
using namespace chatwarden::service;
using boost::asio::awaitable;
using chatwarden::test::raw_text_event;

namespace {

/// Runs `body` against the service on the fixture's io_context.
template <typename Body>
void run_on(boost::asio::io_context& ioc, Body body) {
    boost::asio::co_spawn(ioc, std::move(body), boost::asio::detached);
    ioc.run();
    ioc.restart();
}

struct Fixture {
    boost::asio::io_context ioc;
    test::FakeChannel channel;
    test::FakeStore* store = nullptr;
    std::unique_ptr<BotService> service;

    explicit Fixture(std::vector<triggers::TriggerRule> stored = {}) {
        auto owned = std::make_unique<test::FakeStore>();
        owned->trigger_rules = std::move(stored);
        store = owned.get();
        service = std::make_unique<BotService>(Config{}, std::move(owned), channel, ioc);
    }
};

} // anonymous namespace

TEST_CASE("initialize loads active triggers from the store", "[service]") {
    Fixture f({
        triggers::TriggerRule{.keyword = "help", .response = "Hi"},
        triggers::TriggerRule{.keyword = "off", .response = "x", .active = false},
    });

    Result<void> loaded;
    run_on(f.ioc, [&]() -> awaitable<void> { loaded = co_await f.service->initialize(); });

    REQUIRE(loaded.has_value());
    CHECK(f.service->triggers().size() == 1);
    CHECK(f.service->triggers().contains("help"));
}

TEST_CASE("Trigger administration keeps engine and store in step", "[service]") {
    Fixture f;

    SECTION("add then remove") {
        Result<void> added, removed;
        run_on(f.ioc, [&]() -> awaitable<void> {
            added = co_await f.service->add_trigger_rule("menu", "Pizza",
                                                         triggers::MatchKind::Contains);
        });
        REQUIRE(added.has_value());
        CHECK(f.service->triggers().contains("menu"));
        REQUIRE(f.store->trigger_rules.size() == 1);
        CHECK(f.store->trigger_rules[0].match_kind == triggers::MatchKind::Contains);

        run_on(f.ioc, [&]() -> awaitable<void> {
            removed = co_await f.service->remove_trigger_rule("menu");
        });
        REQUIRE(removed.has_value());
        CHECK_FALSE(f.service->triggers().contains("menu"));
        CHECK(f.store->trigger_rules.empty());
    }

    SECTION("store failure rolls the engine back") {
        f.store->fail_add_trigger = true;
        Result<void> added;
        run_on(f.ioc, [&]() -> awaitable<void> {
            added = co_await f.service->add_trigger_rule("menu", "Pizza");
        });
        REQUIRE_FALSE(added.has_value());
        CHECK(added.error().code() == ErrorCode::DatabaseError);
        CHECK_FALSE(f.service->triggers().contains("menu"));
    }

    SECTION("store failure on remove restores the rule") {
        Result<void> first, second, removed;
        run_on(f.ioc, [&]() -> awaitable<void> {
            first = co_await f.service->add_trigger_rule("menu", "Pizza");
            second = co_await f.service->add_trigger_rule("hours", "9-5");
        });
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());

        f.store->fail_remove_trigger = true;
        run_on(f.ioc, [&]() -> awaitable<void> {
            removed = co_await f.service->remove_trigger_rule("menu");
        });
        REQUIRE_FALSE(removed.has_value());
        CHECK(removed.error().code() == ErrorCode::DatabaseError);

        auto rules = f.service->triggers().rules();
        REQUIRE(rules.size() == 2);
        CHECK(rules[0].keyword == "menu");
        CHECK(rules[1].keyword == "hours");
        CHECK(f.store->trigger_rules.size() == 2);
    }

    SECTION("duplicates never reach the store") {
        Result<void> first, second;
        run_on(f.ioc, [&]() -> awaitable<void> {
            first = co_await f.service->add_trigger_rule("hours", "9-5");
            second = co_await f.service->add_trigger_rule("hours", "10-6");
        });
        REQUIRE(first.has_value());
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error().code() == ErrorCode::DuplicateKeyword);
        REQUIRE(f.store->trigger_rules.size() == 1);
        CHECK(f.store->trigger_rules[0].response == "9-5");
    }

    SECTION("removing an unknown keyword") {
        Result<void> removed;
        run_on(f.ioc, [&]() -> awaitable<void> {
            removed = co_await f.service->remove_trigger_rule("ghost");
        });
        REQUIRE_FALSE(removed.has_value());
        CHECK(removed.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("send_message delivers and audits", "[service]") {
    Fixture f;

    Result<void> sent;
    run_on(f.ioc, [&]() -> awaitable<void> {
        sent = co_await f.service->send_message("c@s.whatsapp.net", "hello");
    });
    REQUIRE(sent.has_value());
    REQUIRE(f.channel.sent.size() == 1);
    CHECK(f.channel.sent[0].text == "hello");
    CHECK(f.store->has_log("Message sent"));

    f.channel.fail_sends = true;
    run_on(f.ioc, [&]() -> awaitable<void> {
        sent = co_await f.service->send_message("c@s.whatsapp.net", "again");
    });
    REQUIRE_FALSE(sent.has_value());
    CHECK(sent.error().code() == ErrorCode::ChannelError);
}

TEST_CASE("run processes queued events until the queue closes", "[service]") {
    Fixture f;
    REQUIRE(f.service->triggers().add("ping", "pong").has_value());

    REQUIRE(f.service->queue().try_push(raw_text_event("E1", "a@s.whatsapp.net", "ping")));
    REQUIRE(f.service->queue().try_push(raw_text_event("E2", "b@s.whatsapp.net", "other")));
    f.service->queue().close();

    run_on(f.ioc, [&]() -> awaitable<void> { co_await f.service->run(); });

    CHECK_FALSE(f.service->is_running());
    CHECK(f.store->messages.size() == 2);
    REQUIRE(f.channel.sent.size() == 1);
    CHECK(f.channel.sent[0].text == "pong");
    CHECK(f.service->coordinator().processed_count() == 2);
}

TEST_CASE("stop ends a running service", "[service]") {
    Fixture f;

    bool finished = false;
    boost::asio::co_spawn(f.ioc, [&]() -> awaitable<void> {
        co_await f.service->run();
        finished = true;
    }, boost::asio::detached);
    boost::asio::post(f.ioc, [&] { f.service->stop(); });
    f.ioc.run();

    CHECK(finished);
}

TEST_CASE("Status and statistics documents", "[service]") {
    Fixture f;
    REQUIRE(f.service->triggers().add("help", "Hi").has_value());

    auto status = f.service->get_status();
    CHECK(status["running"] == false);
    CHECK(status["bot"]["name"] == "chatwarden");
    CHECK(status["channel"]["name"] == "fake");
    CHECK(status["triggers"] == 1);
    CHECK(status["pipeline"]["queue_capacity"] == 256);
    CHECK(status["rate_limit"]["messages"]["per_minute"] == 20);
    CHECK(status.contains("timestamp"));

    Result<nlohmann::json> stats;
    run_on(f.ioc, [&]() -> awaitable<void> { stats = co_await f.service->get_stats(); });
    REQUIRE(stats.has_value());
    CHECK((*stats)["totals"]["messages"] == 0);
    CHECK((*stats)["rate_limiter"]["total_senders"] == 0);
    CHECK((*stats)["blocked_senders"].empty());
}

TEST_CASE("clear_sender resets limiter and spam state", "[service]") {
    Fixture f;
    for (int i = 0; i < 3; ++i) {
        (void)f.service->limiter().admit("s@s.whatsapp.net", rate_limit::Category::Message);
    }
    REQUIRE(f.service->sender_stats("s@s.whatsapp.net").has_value());

    f.service->clear_sender("s@s.whatsapp.net");
    CHECK_FALSE(f.service->sender_stats("s@s.whatsapp.net").has_value());
    CHECK(f.service->blocked_senders().empty());
}
