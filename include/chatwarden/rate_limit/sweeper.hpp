#pragma once

#include <atomic>
#include <chrono>
#include <functional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace chatwarden::rate_limit {

using boost::asio::awaitable;

/// Runs a cleanup callback on a fixed interval inside an io_context.
///
/// Used to sweep expired block records and spam windows; the lazy expiry
/// checks in the limiter stay authoritative, the sweeper only bounds memory.
class BlockSweeper {
public:
    using SweepFn = std::function<void()>;

    BlockSweeper(boost::asio::io_context& ioc, std::chrono::milliseconds interval, SweepFn sweep);
    ~BlockSweeper();

    BlockSweeper(const BlockSweeper&) = delete;
    BlockSweeper& operator=(const BlockSweeper&) = delete;

    /// Ticks every interval until stop() is called.
    auto start() -> awaitable<void>;

    /// Cancels the pending wait and ends start(), also when start() has
    /// not begun yet. Call from the thread running the io_context.
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;

    [[nodiscard]] auto sweep_count() const noexcept -> size_t;

private:
    std::chrono::milliseconds interval_;
    SweepFn sweep_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> sweeps_{0};
};

} // namespace chatwarden::rate_limit
