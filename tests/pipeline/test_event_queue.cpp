#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "chatwarden/pipeline/event_queue.hpp"

using namespace chatwarden;
using namespace chatwarden::pipeline;
using boost::asio::awaitable;

TEST_CASE("Events come out in push order and drain after close", "[pipeline][queue]") {
    boost::asio::io_context ioc;
    EventQueue queue(ioc.get_executor(), 8);

    REQUIRE(queue.try_push(nlohmann::json{{"n", 1}}));
    REQUIRE(queue.try_push(nlohmann::json{{"n", 2}}));
    queue.close();
    CHECK(queue.is_closed());
    CHECK_FALSE(queue.try_push(nlohmann::json{{"n", 3}}));

    std::vector<int> seen;
    bool ended = false;
    bool ended_again = false;
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        while (auto event = co_await queue.pop()) {
            seen.push_back((*event)["n"].get<int>());
        }
        ended = true;
        ended_again = !(co_await queue.pop()).has_value();
    }, boost::asio::detached);
    ioc.run();

    CHECK(seen == std::vector<int>{1, 2});
    CHECK(ended);
    CHECK(ended_again);
}

TEST_CASE("try_push fails when the queue is full", "[pipeline][queue]") {
    boost::asio::io_context ioc;
    EventQueue queue(ioc.get_executor(), 2);

    CHECK(queue.try_push(nlohmann::json::object()));
    CHECK(queue.try_push(nlohmann::json::object()));
    CHECK_FALSE(queue.try_push(nlohmann::json::object()));
    CHECK(queue.capacity() == 2);
}

TEST_CASE("push after close reports QueueClosed", "[pipeline][queue]") {
    boost::asio::io_context ioc;
    EventQueue queue(ioc.get_executor(), 2);
    queue.close();

    Result<void> result;
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        result = co_await queue.push(nlohmann::json::object());
    }, boost::asio::detached);
    ioc.run();

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::QueueClosed);

    auto blocking = queue.push_blocking(nlohmann::json::object());
    REQUIRE_FALSE(blocking.has_value());
    CHECK(blocking.error().code() == ErrorCode::QueueClosed);
}

TEST_CASE("push_blocking waits for the consumer", "[pipeline][queue]") {
    boost::asio::io_context ioc;
    auto guard = boost::asio::make_work_guard(ioc);
    EventQueue queue(ioc.get_executor(), 1);

    int received = 0;
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        while (auto event = co_await queue.pop()) {
            ++received;
        }
        guard.reset();
    }, boost::asio::detached);

    std::thread io_thread([&] { ioc.run(); });

    for (int i = 0; i < 20; ++i) {
        REQUIRE(queue.push_blocking(nlohmann::json{{"n", i}}).has_value());
    }
    queue.close();
    io_thread.join();

    CHECK(received == 20);
}

TEST_CASE("Every accepted event is delivered when close races producers", "[pipeline][queue]") {
    boost::asio::io_context ioc;
    auto guard = boost::asio::make_work_guard(ioc);
    EventQueue queue(ioc.get_executor(), 4);

    std::atomic<int> received{0};
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        while (auto event = co_await queue.pop()) {
            ++received;
        }
        guard.reset();
    }, boost::asio::detached);
    std::thread io_thread([&] { ioc.run(); });

    std::atomic<int> accepted{0};
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < 200; ++i) {
                if (queue.push_blocking(nlohmann::json{{"p", p}, {"n", i}}).has_value()) {
                    ++accepted;
                } else {
                    break;
                }
            }
        });
    }

    while (accepted.load() < 100) {
        std::this_thread::yield();
    }
    queue.close();

    for (auto& t : producers) t.join();
    io_thread.join();

    CHECK(accepted.load() >= 100);
    CHECK(received.load() == accepted.load());
    CHECK_FALSE(queue.try_push(nlohmann::json::object()));
}
