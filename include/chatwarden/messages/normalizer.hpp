#pragma once

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatwarden/core/types.hpp"
#include "chatwarden/messages/message.hpp"

namespace chatwarden::messages {

/// Group conversations are addressed with this JID suffix.
inline constexpr std::string_view kGroupSuffix = "@g.us";

/// Converts a raw inbound event into a NormalizedMessage.
///
/// Returns nullopt only for events the account sent itself (`key.fromMe`).
/// Everything else produces a best-effort record: missing or mistyped
/// fields become empty values, and the function never throws.
///
/// Payload precedence: conversation, extendedTextMessage, imageMessage,
/// videoMessage, audioMessage, documentMessage, stickerMessage.
auto normalize(const json& raw_event, const NowFn& now = system_now)
    -> std::optional<NormalizedMessage>;

[[nodiscard]] auto is_group_conversation(std::string_view conversation_id) -> bool;

} // namespace chatwarden::messages
