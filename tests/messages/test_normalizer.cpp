#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "chatwarden/messages/normalizer.hpp"

using namespace chatwarden;
using namespace chatwarden::messages;

namespace {

auto fixed_now() -> Timestamp {
    return from_epoch_ms(1'700'000'000'000);
}

} // anonymous namespace

TEST_CASE("Plain conversation text in a direct chat", "[messages][normalizer]") {
    json raw = {
        {"key", {{"id", "ABC"}, {"remoteJid", "15551234567@s.whatsapp.net"}, {"fromMe", false}}},
        {"message", {{"conversation", "hello"}}},
        {"messageTimestamp", 1700000100},
    };

    auto msg = normalize(raw, fixed_now);
    REQUIRE(msg.has_value());
    CHECK(msg->id == "ABC");
    CHECK(msg->conversation_id == "15551234567@s.whatsapp.net");
    CHECK(msg->sender_id == "15551234567@s.whatsapp.net");
    CHECK(msg->content_kind == ContentKind::Text);
    CHECK(msg->text == "hello");
    CHECK_FALSE(msg->is_group);
    CHECK_FALSE(msg->media.has_value());
    CHECK(to_epoch_ms(msg->timestamp) == 1'700'000'100'000);
}

TEST_CASE("Group messages take the participant as sender", "[messages][normalizer]") {
    json raw = {
        {"key", {{"id", "G1"}, {"remoteJid", "120363@g.us"}, {"participant", "1555@s.whatsapp.net"}}},
        {"message", {{"extendedTextMessage", {
            {"text", "replying"},
            {"contextInfo", {{"stanzaId", "ORIG"}, {"isForwarded", true}}},
        }}}},
    };

    auto msg = normalize(raw, fixed_now);
    REQUIRE(msg.has_value());
    CHECK(msg->is_group);
    CHECK(msg->sender_id == "1555@s.whatsapp.net");
    CHECK(msg->conversation_id == "120363@g.us");
    CHECK(msg->text == "replying");
    REQUIRE(msg->reply_to_id.has_value());
    CHECK(*msg->reply_to_id == "ORIG");
    CHECK(msg->is_forwarded);
}

TEST_CASE("Self-originated events are skipped", "[messages][normalizer]") {
    json raw = {
        {"key", {{"id", "ME"}, {"remoteJid", "1555@s.whatsapp.net"}, {"fromMe", true}}},
        {"message", {{"conversation", "echo"}}},
    };
    CHECK_FALSE(normalize(raw, fixed_now).has_value());
}

TEST_CASE("Media payloads carry caption and reference", "[messages][normalizer]") {
    SECTION("image with caption") {
        json raw = {
            {"key", {{"id", "I1"}, {"remoteJid", "1555@s.whatsapp.net"}}},
            {"message", {{"imageMessage", {
                {"caption", "look"}, {"url", "https://cdn/x.jpg"}, {"mimetype", "image/jpeg"},
            }}}},
        };
        auto msg = normalize(raw, fixed_now);
        REQUIRE(msg.has_value());
        CHECK(msg->content_kind == ContentKind::Image);
        CHECK(msg->text == "look");
        REQUIRE(msg->media.has_value());
        CHECK(msg->media->url == "https://cdn/x.jpg");
        CHECK(msg->media->mime_type == "image/jpeg");
        CHECK(is_media(msg->content_kind));
    }

    SECTION("audio has no caption") {
        json raw = {
            {"key", {{"id", "A1"}, {"remoteJid", "1555@s.whatsapp.net"}}},
            {"message", {{"audioMessage", {{"caption", "ignored"}, {"url", "u"}}}}},
        };
        auto msg = normalize(raw, fixed_now);
        REQUIRE(msg.has_value());
        CHECK(msg->content_kind == ContentKind::Audio);
        CHECK(msg->text.empty());
    }

    SECTION("text payload wins over media") {
        json raw = {
            {"key", {{"id", "P1"}, {"remoteJid", "1555@s.whatsapp.net"}}},
            {"message", {{"conversation", "text"}, {"stickerMessage", {{"url", "s"}}}}},
        };
        auto msg = normalize(raw, fixed_now);
        REQUIRE(msg.has_value());
        CHECK(msg->content_kind == ContentKind::Text);
        CHECK(msg->text == "text");
    }
}

TEST_CASE("Malformed events degrade to empty fields", "[messages][normalizer]") {
    SECTION("missing key and body") {
        auto msg = normalize(json::object(), fixed_now);
        REQUIRE(msg.has_value());
        CHECK(msg->id.empty());
        CHECK(msg->text.empty());
        CHECK(msg->timestamp == fixed_now());
    }

    SECTION("mistyped fields") {
        json raw = {
            {"key", {{"id", 42}, {"remoteJid", nullptr}}},
            {"message", {{"conversation", 7}}},
            {"messageTimestamp", "not-a-number"},
        };
        auto msg = normalize(raw, fixed_now);
        REQUIRE(msg.has_value());
        CHECK(msg->id.empty());
        CHECK(msg->conversation_id.empty());
        CHECK(msg->text.empty());
        CHECK(msg->timestamp == fixed_now());
    }

    SECTION("non-object event") {
        auto msg = normalize(json::array({1, 2}), fixed_now);
        REQUIRE(msg.has_value());
        CHECK(msg->sender_id.empty());
    }

    SECTION("string timestamp is accepted") {
        json raw = {{"key", {{"id", "T"}}}, {"messageTimestamp", "1700000200"}};
        auto msg = normalize(raw, fixed_now);
        REQUIRE(msg.has_value());
        CHECK(to_epoch_ms(msg->timestamp) == 1'700'000'200'000);
    }

    SECTION("out-of-range messageTimestamp falls back to now") {
        json raw = {{"key", {{"id", "T"}}}};

        raw["messageTimestamp"] = 1'700'000'000'000'000'000LL;
        CHECK(normalize(raw, fixed_now)->timestamp == fixed_now());

        raw["messageTimestamp"] = 18'446'744'073'709'551'615ULL;
        CHECK(normalize(raw, fixed_now)->timestamp == fixed_now());

        raw["messageTimestamp"] = -5;
        CHECK(normalize(raw, fixed_now)->timestamp == fixed_now());

        raw["messageTimestamp"] = 1e300;
        CHECK(normalize(raw, fixed_now)->timestamp == fixed_now());

        raw["messageTimestamp"] = "99999999999999999";
        CHECK(normalize(raw, fixed_now)->timestamp == fixed_now());
    }

    SECTION("fractional seconds are truncated") {
        json raw = {{"key", {{"id", "T"}}}, {"messageTimestamp", 1700000200.75}};
        auto msg = normalize(raw, fixed_now);
        REQUIRE(msg.has_value());
        CHECK(to_epoch_ms(msg->timestamp) == 1'700'000'200'000);
    }
}

TEST_CASE("NormalizedMessage JSON keeps optional fields optional", "[messages]") {
    NormalizedMessage msg;
    msg.id = "X";
    msg.conversation_id = "c";
    msg.sender_id = "s";
    msg.timestamp = from_epoch_ms(1000);

    json j = msg;
    CHECK(j["content_kind"] == "text");
    CHECK(j["timestamp_ms"] == 1000);
    CHECK_FALSE(j.contains("media"));
    CHECK_FALSE(j.contains("reply_to_id"));

    auto back = j.get<NormalizedMessage>();
    CHECK(back.timestamp == msg.timestamp);
}
