#include "chatwarden/rate_limit/sweeper.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatwarden/core/logger.hpp"

namespace chatwarden::rate_limit {

using boost::asio::use_awaitable;

BlockSweeper::BlockSweeper(boost::asio::io_context& ioc,
                           std::chrono::milliseconds interval, SweepFn sweep)
    : interval_(interval)
    , sweep_(std::move(sweep))
    , timer_(ioc) {}

BlockSweeper::~BlockSweeper() {
    stop();
}

auto BlockSweeper::start() -> awaitable<void> {
    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }
    running_.store(true, std::memory_order_release);
    LOG_INFO("Block sweeper started (every {}s)",
             std::chrono::duration_cast<std::chrono::seconds>(interval_).count());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        timer_.expires_after(interval_);
        auto [ec] = co_await timer_.async_wait(boost::asio::as_tuple(use_awaitable));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                break;
            }
            LOG_WARN("Sweeper timer error: {}", ec.message());
            continue;
        }

        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        try {
            sweep_();
            sweeps_.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            LOG_ERROR("Sweep failed: {}", e.what());
        }
    }

    running_.store(false, std::memory_order_release);
    LOG_INFO("Block sweeper stopped");
    co_return;
}

void BlockSweeper::stop() {
    stop_requested_.store(true, std::memory_order_release);
    timer_.cancel();
}

auto BlockSweeper::is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
}

auto BlockSweeper::sweep_count() const noexcept -> size_t {
    return sweeps_.load(std::memory_order_relaxed);
}

} // namespace chatwarden::rate_limit
