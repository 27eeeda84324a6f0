#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include "chatwarden/channels/jsonl.hpp"
#include "chatwarden/pipeline/event_queue.hpp"
#include "test_helpers.hpp"

using namespace chatwarden;
using namespace chatwarden::channels;
using boost::asio::awaitable;
using chatwarden::test::run_sync;

TEST_CASE("send writes one JSON line per message", "[channels][jsonl]") {
    std::ostringstream out;
    JsonlChannel channel(TransportConfig{}, out);

    auto sent = run_sync(channel.send(OutgoingMessage{
        .conversation_id = "g@g.us",
        .text = "hello",
        .mentions = {"a@s.whatsapp.net"},
    }));
    REQUIRE(sent.has_value());

    auto line = out.str();
    REQUIRE_FALSE(line.empty());
    CHECK(line.back() == '\n');
    auto j = nlohmann::json::parse(line);
    CHECK(j["to"] == "g@g.us");
    CHECK(j["text"] == "hello");
    CHECK(j["mentions"][0] == "a@s.whatsapp.net");
    CHECK(j.contains("timestamp"));
}

TEST_CASE("send rejects a message without a conversation", "[channels][jsonl]") {
    std::ostringstream out;
    JsonlChannel channel(TransportConfig{}, out);

    auto sent = run_sync(channel.send(OutgoingMessage{.text = "orphan"}));
    REQUIRE_FALSE(sent.has_value());
    CHECK(sent.error().code() == ErrorCode::InvalidArgument);
    CHECK(out.str().empty());
}

TEST_CASE("ingest_line accepts objects only", "[channels][jsonl]") {
    boost::asio::io_context ioc;
    pipeline::EventQueue queue(ioc.get_executor(), 8);
    std::ostringstream out;
    JsonlChannel channel(TransportConfig{}, out);
    channel.attach(queue);

    CHECK(channel.ingest_line(R"({"key":{"id":"A"}})"));
    CHECK_FALSE(channel.ingest_line("   "));
    CHECK_FALSE(channel.ingest_line("{broken"));
    CHECK_FALSE(channel.ingest_line("[1,2,3]"));
    CHECK(channel.ingest_line("  {\"key\":{\"id\":\"B\"}}\r"));

    CHECK(channel.events_read() == 2);
    CHECK(channel.lines_rejected() == 2);

    queue.close();
    std::vector<std::string> ids;
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        while (auto event = co_await queue.pop()) {
            ids.push_back((*event)["key"]["id"].get<std::string>());
        }
    }, boost::asio::detached);
    ioc.run();

    CHECK(ids == std::vector<std::string>{"A", "B"});
}

TEST_CASE("Reading a file delivers every line and closes the queue", "[channels][jsonl]") {
    namespace fs = std::filesystem;
    auto input = fs::temp_directory_path() / "chatwarden_test_input.jsonl";
    {
        std::ofstream f(input);
        f << R"({"key":{"id":"1"}})" << "\n";
        f << "not json\n";
        f << "\n";
        f << R"({"key":{"id":"2"}})" << "\n";
        f << R"({"key":{"id":"3"}})";   // no trailing newline
    }

    boost::asio::io_context ioc;
    pipeline::EventQueue queue(ioc.get_executor(), 16);
    std::ostringstream out;
    TransportConfig cfg;
    cfg.input = input.string();
    JsonlChannel channel(cfg, out);
    channel.attach(queue);

    std::vector<std::string> ids;
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        co_await channel.start();
        while (auto event = co_await queue.pop()) {
            ids.push_back((*event)["key"]["id"].get<std::string>());
        }
        co_await channel.stop();
    }, boost::asio::detached);
    ioc.run();

    CHECK(ids == std::vector<std::string>{"1", "2", "3"});
    CHECK(channel.lines_rejected() == 1);
    CHECK_FALSE(channel.is_running());
    CHECK(queue.is_closed());

    fs::remove(input);
}

TEST_CASE("A missing input file closes the queue immediately", "[channels][jsonl]") {
    boost::asio::io_context ioc;
    pipeline::EventQueue queue(ioc.get_executor(), 4);
    std::ostringstream out;
    TransportConfig cfg;
    cfg.input = "/nonexistent/chatwarden/input.jsonl";
    JsonlChannel channel(cfg, out);
    channel.attach(queue);

    bool ended = false;
    boost::asio::co_spawn(ioc, [&]() -> awaitable<void> {
        co_await channel.start();
        ended = !(co_await queue.pop()).has_value();
    }, boost::asio::detached);
    ioc.run();

    CHECK(ended);
    CHECK_FALSE(channel.is_running());
}
