#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include "chatwarden/core/error.hpp"
#include "chatwarden/core/types.hpp"

namespace chatwarden::pipeline {

using boost::asio::awaitable;

/// Bounded FIFO of raw inbound events between a transport and the
/// coordinator. Producers may live on any thread; events come out in the
/// order they went in.
class EventQueue {
public:
    EventQueue(boost::asio::any_io_executor executor, size_t capacity);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// Non-blocking enqueue. Returns false when full or closed.
    auto try_push(json event) -> bool;

    /// Waits for free capacity. Fails with QueueClosed after close().
    auto push(json event) -> awaitable<Result<void>>;

    /// Blocking variant of push() for producer threads outside the
    /// io_context. The io_context must be running on another thread.
    auto push_blocking(json event) -> Result<void>;

    /// Next event, or nullopt once the queue is closed and drained.
    /// Single consumer.
    auto pop() -> awaitable<std::optional<json>>;

    /// Stops accepting events. Events already queued are still delivered.
    void close();

    [[nodiscard]] auto is_closed() const noexcept -> bool;
    [[nodiscard]] auto capacity() const noexcept -> size_t { return capacity_; }

private:
    auto take_pending() -> std::optional<json>;

    using channel_t = boost::asio::experimental::concurrent_channel<void(
        boost::system::error_code, json)>;

    size_t capacity_;
    channel_t channel_;
    std::atomic<bool> closed_{false};
    bool marker_seen_ = false;   // consumer side only
    std::mutex mutex_;
};

} // namespace chatwarden::pipeline
