#include <catch2/catch_test_macros.hpp>

#include "chatwarden/channels/channel.hpp"
#include "test_fakes.hpp"

using namespace chatwarden;
using namespace chatwarden::channels;

TEST_CASE("Conversation ids map to chat types", "[channels]") {
    CHECK(infer_chat_type("120363000000@g.us") == ChatType::Group);
    CHECK(infer_chat_type("status@broadcast") == ChatType::Broadcast);
    CHECK(infer_chat_type("15551234567@s.whatsapp.net") == ChatType::Direct);
    CHECK(infer_chat_type("15551234567@c.us") == ChatType::Direct);
    CHECK(infer_chat_type("someone") == ChatType::Unknown);
    CHECK(chat_type_to_string(ChatType::Group) == "group");
}

TEST_CASE("OutgoingMessage JSON", "[channels]") {
    OutgoingMessage plain{.conversation_id = "c@s.whatsapp.net", .text = "hi"};
    nlohmann::json j = plain;
    CHECK(j["to"] == "c@s.whatsapp.net");
    CHECK(j["text"] == "hi");
    CHECK_FALSE(j.contains("mentions"));

    OutgoingMessage mention{.conversation_id = "g@g.us", .text = "@a", .mentions = {"a@s.whatsapp.net"}};
    nlohmann::json m = mention;
    REQUIRE(m.contains("mentions"));
    CHECK(m["mentions"][0] == "a@s.whatsapp.net");

    auto back = m.get<OutgoingMessage>();
    CHECK(back.mentions == mention.mentions);
}

TEST_CASE("Publishing without a queue drops the event", "[channels]") {
    test::FakeChannel channel;
    CHECK_FALSE(channel.deliver(nlohmann::json::object()));
}
