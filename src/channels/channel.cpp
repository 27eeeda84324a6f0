#include "chatwarden/channels/channel.hpp"

#include "chatwarden/core/logger.hpp"
#include "chatwarden/pipeline/event_queue.hpp"

namespace chatwarden::channels {

// ---------------------------------------------------------------------------
// OutgoingMessage JSON serialization
// ---------------------------------------------------------------------------

void to_json(json& j, const OutgoingMessage& m) {
    j = json{
        {"to", m.conversation_id},
        {"text", m.text},
    };
    if (!m.mentions.empty()) j["mentions"] = m.mentions;
}

void from_json(const json& j, OutgoingMessage& m) {
    j.at("to").get_to(m.conversation_id);
    if (j.contains("text")) j.at("text").get_to(m.text);
    if (j.contains("mentions")) j.at("mentions").get_to(m.mentions);
}

// ---------------------------------------------------------------------------
// Conversation classification
// ---------------------------------------------------------------------------

auto chat_type_to_string(ChatType t) -> std::string_view {
    switch (t) {
        case ChatType::Direct:    return "direct";
        case ChatType::Group:     return "group";
        case ChatType::Broadcast: return "broadcast";
        case ChatType::Unknown:   return "unknown";
    }
    return "unknown";
}

auto infer_chat_type(std::string_view conversation_id) -> ChatType {
    if (conversation_id.ends_with("@g.us")) return ChatType::Group;
    if (conversation_id.ends_with("@broadcast")) return ChatType::Broadcast;
    if (conversation_id.ends_with("@s.whatsapp.net") ||
        conversation_id.ends_with("@c.us")) {
        return ChatType::Direct;
    }
    return ChatType::Unknown;
}

// ---------------------------------------------------------------------------
// Channel
// ---------------------------------------------------------------------------

auto Channel::publish(json raw_event) -> bool {
    if (!queue_) {
        LOG_WARN("Channel '{}' has no event queue attached, dropping event", name());
        return false;
    }

    auto pushed = queue_->push_blocking(std::move(raw_event));
    if (!pushed) {
        LOG_DEBUG("Channel '{}' could not publish: {}", name(), pushed.error().what());
        return false;
    }
    return true;
}

} // namespace chatwarden::channels
