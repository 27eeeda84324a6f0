#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatwarden/core/types.hpp"

namespace chatwarden::messages {

using json = nlohmann::json;

enum class ContentKind {
    Text,
    Image,
    Video,
    Audio,
    Document,
    Sticker,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ContentKind, {
    {ContentKind::Text, "text"},
    {ContentKind::Image, "image"},
    {ContentKind::Video, "video"},
    {ContentKind::Audio, "audio"},
    {ContentKind::Document, "document"},
    {ContentKind::Sticker, "sticker"},
})

auto content_kind_to_string(ContentKind kind) -> std::string_view;

/// True for every kind that carries a media payload.
[[nodiscard]] constexpr auto is_media(ContentKind kind) noexcept -> bool {
    return kind != ContentKind::Text;
}

/// Reference to downloadable media attached to a message.
struct MediaRef {
    std::string url;
    std::string mime_type;
};

/// Canonical form of one inbound chat event. Built once by the normalizer
/// and treated as immutable afterwards.
struct NormalizedMessage {
    std::string id;
    std::string conversation_id;
    std::string sender_id;
    ContentKind content_kind = ContentKind::Text;
    std::string text;
    std::optional<MediaRef> media;
    Timestamp timestamp;
    bool is_group = false;
    std::optional<std::string> reply_to_id;
    bool is_forwarded = false;
};

void to_json(json& j, const MediaRef& m);
void from_json(const json& j, MediaRef& m);

void to_json(json& j, const NormalizedMessage& m);
void from_json(const json& j, NormalizedMessage& m);

} // namespace chatwarden::messages
