#include "chatwarden/messages/normalizer.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "chatwarden/core/logger.hpp"

namespace chatwarden::messages {

namespace {

struct MediaPayload {
    const char* field;
    ContentKind kind;
    bool has_caption;
};

// Order is the detection precedence after the two text payloads.
constexpr std::array<MediaPayload, 5> kMediaPayloads = {{
    {"imageMessage", ContentKind::Image, true},
    {"videoMessage", ContentKind::Video, true},
    {"audioMessage", ContentKind::Audio, false},
    {"documentMessage", ContentKind::Document, true},
    {"stickerMessage", ContentKind::Sticker, false},
}};

auto object_field(const json& obj, const char* key) -> const json* {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return nullptr;
    return &*it;
}

auto string_field(const json& obj, const char* key) -> std::string {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto bool_field(const json& obj, const char* key) -> bool {
    if (!obj.is_object()) return false;
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

constexpr auto kMaxEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Timestamp::max().time_since_epoch()).count();

auto seconds_to_timestamp(int64_t secs) -> std::optional<Timestamp> {
    if (secs < 0 || secs > kMaxEpochSeconds) return std::nullopt;
    return Timestamp{std::chrono::seconds{secs}};
}

auto seconds_to_timestamp(double secs) -> std::optional<Timestamp> {
    if (!std::isfinite(secs) || secs < 0.0 || secs > static_cast<double>(kMaxEpochSeconds)) {
        return std::nullopt;
    }
    return seconds_to_timestamp(static_cast<int64_t>(secs));
}

/// messageTimestamp arrives as epoch seconds, either numeric or as a
/// numeric string. Anything else, including values outside the clock's
/// range, falls back to the receive time.
auto parse_timestamp(const json& event, const NowFn& now) -> Timestamp {
    if (!event.is_object()) return now();
    auto it = event.find("messageTimestamp");
    if (it == event.end()) return now();

    std::optional<Timestamp> parsed;
    if (it->is_number_unsigned()) {
        auto secs = it->get<uint64_t>();
        if (secs <= static_cast<uint64_t>(kMaxEpochSeconds)) {
            parsed = seconds_to_timestamp(static_cast<int64_t>(secs));
        }
    } else if (it->is_number_integer()) {
        parsed = seconds_to_timestamp(it->get<int64_t>());
    } else if (it->is_number_float()) {
        parsed = seconds_to_timestamp(it->get<double>());
    } else if (it->is_string()) {
        try {
            parsed = seconds_to_timestamp(static_cast<int64_t>(std::stoll(it->get<std::string>())));
        } catch (const std::exception&) {
            LOG_DEBUG("Unparseable messageTimestamp '{}'", it->get<std::string>());
            return now();
        }
    }

    if (!parsed) {
        LOG_DEBUG("messageTimestamp {} out of range, using receive time", it->dump());
        return now();
    }
    return *parsed;
}

void apply_context_info(const json& payload, NormalizedMessage& msg) {
    const auto* context = object_field(payload, "contextInfo");
    if (!context) return;

    auto stanza = string_field(*context, "stanzaId");
    if (!stanza.empty()) {
        msg.reply_to_id = std::move(stanza);
    }
    msg.is_forwarded = bool_field(*context, "isForwarded");
}

} // anonymous namespace

auto is_group_conversation(std::string_view conversation_id) -> bool {
    return conversation_id.ends_with(kGroupSuffix);
}

auto normalize(const json& raw_event, const NowFn& now) -> std::optional<NormalizedMessage> {
    static const json kEmpty = json::object();

    const auto* key = object_field(raw_event, "key");
    const json& k = key ? *key : kEmpty;

    if (bool_field(k, "fromMe")) {
        LOG_TRACE("Skipping self-originated event {}", string_field(k, "id"));
        return std::nullopt;
    }

    NormalizedMessage msg;
    msg.id = string_field(k, "id");
    msg.conversation_id = string_field(k, "remoteJid");

    auto participant = string_field(k, "participant");
    msg.sender_id = participant.empty() ? msg.conversation_id : std::move(participant);
    msg.is_group = is_group_conversation(msg.conversation_id);
    msg.timestamp = parse_timestamp(raw_event, now);

    const auto* body = object_field(raw_event, "message");
    if (!body) {
        LOG_DEBUG("Event {} has no message body", msg.id);
        return msg;
    }

    if (auto conversation = string_field(*body, "conversation"); !conversation.empty()) {
        msg.content_kind = ContentKind::Text;
        msg.text = std::move(conversation);
        return msg;
    }

    if (const auto* extended = object_field(*body, "extendedTextMessage")) {
        msg.content_kind = ContentKind::Text;
        msg.text = string_field(*extended, "text");
        apply_context_info(*extended, msg);
        return msg;
    }

    for (const auto& payload : kMediaPayloads) {
        const auto* media = object_field(*body, payload.field);
        if (!media) continue;

        msg.content_kind = payload.kind;
        if (payload.has_caption) {
            msg.text = string_field(*media, "caption");
        }
        msg.media = MediaRef{
            .url = string_field(*media, "url"),
            .mime_type = string_field(*media, "mimetype"),
        };
        apply_context_info(*media, msg);
        return msg;
    }

    LOG_DEBUG("Event {} carries no recognised payload", msg.id);
    return msg;
}

} // namespace chatwarden::messages
