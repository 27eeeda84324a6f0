#include "chatwarden/pipeline/event_queue.hpp"

#include <future>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "chatwarden/core/logger.hpp"

namespace chatwarden::pipeline {

using boost::asio::use_awaitable;

EventQueue::EventQueue(boost::asio::any_io_executor executor, size_t capacity)
    : capacity_(capacity)
    , channel_(std::move(executor), capacity) {}

auto EventQueue::try_push(json event) -> bool {
    std::lock_guard lock(mutex_);
    if (closed_.load(std::memory_order_acquire)) {
        return false;
    }
    if (!channel_.try_send(boost::system::error_code{}, std::move(event))) {
        LOG_WARN("Event queue full ({} pending), dropping event", capacity_);
        return false;
    }
    return true;
}

auto EventQueue::push(json event) -> awaitable<Result<void>> {
    {
        std::lock_guard lock(mutex_);
        if (closed_.load(std::memory_order_acquire)) {
            co_return make_fail(make_error(ErrorCode::QueueClosed, "Event queue is closed"));
        }
        if (channel_.try_send(boost::system::error_code{}, event)) {
            co_return ok_result();
        }
    }

    // Full: wait for capacity. A send that lands behind the end marker is
    // still handed out by pop().
    auto [ec] = co_await channel_.async_send(
        boost::system::error_code{}, std::move(event),
        boost::asio::as_tuple(use_awaitable));
    if (ec) {
        co_return make_fail(make_error(ErrorCode::QueueClosed,
            "Event queue is closed", ec.message()));
    }
    co_return ok_result();
}

auto EventQueue::push_blocking(json event) -> Result<void> {
    std::future<void> sent;
    {
        std::lock_guard lock(mutex_);
        if (closed_.load(std::memory_order_acquire)) {
            return std::unexpected(make_error(ErrorCode::QueueClosed, "Event queue is closed"));
        }
        if (channel_.try_send(boost::system::error_code{}, event)) {
            return {};
        }
        // Initiated under the lock so the send is queued ahead of any marker.
        sent = channel_.async_send(boost::system::error_code{}, std::move(event),
                                   boost::asio::use_future);
    }

    try {
        sent.get();
    } catch (const boost::system::system_error& e) {
        return std::unexpected(make_error(ErrorCode::QueueClosed,
            "Event queue is closed", e.what()));
    }
    return {};
}

auto EventQueue::pop() -> awaitable<std::optional<json>> {
    if (!marker_seen_) {
        auto [ec, event] = co_await channel_.async_receive(
            boost::asio::as_tuple(use_awaitable));
        if (!ec) {
            co_return std::move(event);
        }
        marker_seen_ = true;
    }

    std::lock_guard lock(mutex_);
    if (auto leftover = take_pending()) {
        co_return leftover;
    }
    // Past this point every send fails, so producers see QueueClosed.
    channel_.close();
    size_t dropped = 0;
    while (take_pending()) ++dropped;
    if (dropped > 0) {
        LOG_WARN("Event queue dropped {} events sent after close", dropped);
    }
    co_return std::nullopt;
}

auto EventQueue::take_pending() -> std::optional<json> {
    std::optional<json> out;
    channel_.try_receive([&out](boost::system::error_code ec, json event) {
        if (!ec) out = std::move(event);
    });
    return out;
}

void EventQueue::close() {
    std::lock_guard lock(mutex_);
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    // End-of-stream marker queued behind pending events, so consumers
    // drain everything accepted before close() and then see nullopt.
    channel_.async_send(boost::asio::error::eof, json{},
        [](boost::system::error_code ec) {
            if (ec) {
                LOG_DEBUG("Event queue close marker not delivered: {}", ec.message());
            }
        });
    LOG_DEBUG("Event queue closed");
}

auto EventQueue::is_closed() const noexcept -> bool {
    return closed_.load(std::memory_order_acquire);
}

} // namespace chatwarden::pipeline
