#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "chatwarden/core/error.hpp"
#include "chatwarden/core/types.hpp"

namespace chatwarden::pipeline {
class EventQueue;
}

namespace chatwarden::channels {

/// Message sent back into a conversation (bot -> network).
struct OutgoingMessage {
    std::string conversation_id;
    std::string text;
    std::vector<std::string> mentions;
};

void to_json(json& j, const OutgoingMessage& m);
void from_json(const json& j, OutgoingMessage& m);

enum class ChatType {
    Direct,
    Group,
    Broadcast,
    Unknown,
};

auto chat_type_to_string(ChatType t) -> std::string_view;

/// Classifies a conversation id by its address suffix.
auto infer_chat_type(std::string_view conversation_id) -> ChatType;

/// Abstract transport. Implementations deliver raw inbound events into the
/// attached EventQueue and expose send() for outbound messages.
class Channel {
public:
    virtual ~Channel() = default;

    /// Starts delivering events into the attached queue in the background.
    virtual auto start() -> boost::asio::awaitable<void> = 0;

    virtual auto stop() -> boost::asio::awaitable<void> = 0;

    /// Sends a message. Connectivity problems come back as ChannelError.
    virtual auto send(OutgoingMessage msg) -> boost::asio::awaitable<Result<void>> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /// Routes inbound events into `queue`. The queue must outlive the channel.
    void attach(pipeline::EventQueue& queue) { queue_ = &queue; }

protected:
    /// Hands one raw event to the attached queue, blocking the calling
    /// transport thread while the queue is full. Returns false when no
    /// queue is attached or the queue is closed.
    auto publish(json raw_event) -> bool;

    pipeline::EventQueue* queue_ = nullptr;
};

} // namespace chatwarden::channels
