#include "chatwarden/messages/message.hpp"

#include "chatwarden/core/utils.hpp"

namespace chatwarden::messages {

auto content_kind_to_string(ContentKind kind) -> std::string_view {
    switch (kind) {
        case ContentKind::Text:     return "text";
        case ContentKind::Image:    return "image";
        case ContentKind::Video:    return "video";
        case ContentKind::Audio:    return "audio";
        case ContentKind::Document: return "document";
        case ContentKind::Sticker:  return "sticker";
    }
    return "text";
}

// ---------------------------------------------------------------------------
// MediaRef JSON serialization
// ---------------------------------------------------------------------------

void to_json(json& j, const MediaRef& m) {
    j = json{
        {"url", m.url},
        {"mime_type", m.mime_type},
    };
}

void from_json(const json& j, MediaRef& m) {
    j.at("url").get_to(m.url);
    if (j.contains("mime_type")) j.at("mime_type").get_to(m.mime_type);
}

// ---------------------------------------------------------------------------
// NormalizedMessage JSON serialization
// ---------------------------------------------------------------------------

void to_json(json& j, const NormalizedMessage& m) {
    j = json{
        {"id", m.id},
        {"conversation_id", m.conversation_id},
        {"sender_id", m.sender_id},
        {"content_kind", m.content_kind},
        {"text", m.text},
        {"timestamp", utils::format_iso(m.timestamp)},
        {"timestamp_ms", to_epoch_ms(m.timestamp)},
        {"is_group", m.is_group},
        {"is_forwarded", m.is_forwarded},
    };
    if (m.media) j["media"] = *m.media;
    if (m.reply_to_id) j["reply_to_id"] = *m.reply_to_id;
}

void from_json(const json& j, NormalizedMessage& m) {
    j.at("id").get_to(m.id);
    j.at("conversation_id").get_to(m.conversation_id);
    j.at("sender_id").get_to(m.sender_id);
    if (j.contains("content_kind")) j.at("content_kind").get_to(m.content_kind);
    if (j.contains("text")) j.at("text").get_to(m.text);
    if (j.contains("timestamp_ms")) m.timestamp = from_epoch_ms(j.at("timestamp_ms").get<int64_t>());
    if (j.contains("is_group")) j.at("is_group").get_to(m.is_group);
    if (j.contains("is_forwarded")) j.at("is_forwarded").get_to(m.is_forwarded);
    if (j.contains("media")) m.media = j.at("media").get<MediaRef>();
    if (j.contains("reply_to_id")) m.reply_to_id = j.at("reply_to_id").get<std::string>();
}

} // namespace chatwarden::messages
