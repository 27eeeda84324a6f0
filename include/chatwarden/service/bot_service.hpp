#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "chatwarden/channels/channel.hpp"
#include "chatwarden/core/config.hpp"
#include "chatwarden/core/error.hpp"
#include "chatwarden/pipeline/coordinator.hpp"
#include "chatwarden/pipeline/event_queue.hpp"
#include "chatwarden/rate_limit/limiter.hpp"
#include "chatwarden/rate_limit/spam.hpp"
#include "chatwarden/rate_limit/sweeper.hpp"
#include "chatwarden/store/store.hpp"
#include "chatwarden/triggers/engine.hpp"

namespace chatwarden::service {

using boost::asio::awaitable;

/// Owns the pipeline components and exposes the administrative surface
/// used by the CLI: trigger management, sending, status and statistics.
class BotService {
public:
    BotService(Config config,
               std::unique_ptr<store::Store> store,
               channels::Channel& channel,
               boost::asio::io_context& ioc,
               NowFn now = system_now);

    BotService(const BotService&) = delete;
    BotService& operator=(const BotService&) = delete;

    /// Loads the active triggers from the store into the engine.
    auto initialize() -> awaitable<Result<void>>;

    /// Adds the rule to the engine and then the store. A store failure
    /// rolls the engine back so both stay in agreement.
    auto add_trigger_rule(std::string keyword, std::string response,
                          triggers::MatchKind match_kind = triggers::MatchKind::Exact,
                          bool case_sensitive = false) -> awaitable<Result<void>>;

    auto remove_trigger_rule(std::string keyword) -> awaitable<Result<void>>;

    auto send_message(std::string conversation_id, std::string text)
        -> awaitable<Result<void>>;

    [[nodiscard]] auto get_status() const -> json;

    /// Store totals, rate-limiter figures and the status document.
    auto get_stats() -> awaitable<Result<json>>;

    [[nodiscard]] auto sender_stats(std::string_view sender,
                                    rate_limit::Category category = rate_limit::Category::Message)
        -> std::optional<rate_limit::SenderStats>;

    [[nodiscard]] auto blocked_senders() const -> std::vector<rate_limit::BlockedSender>;

    /// Administrative reset of all limiter and spam state for a sender.
    void clear_sender(std::string_view sender);

    /// Starts the transport, the sweeper and the coordinator, and returns
    /// once the event stream ends or stop() is called.
    auto run() -> awaitable<void>;

    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool { return running_.load(); }

    [[nodiscard]] auto triggers() -> triggers::TriggerEngine& { return triggers_; }
    [[nodiscard]] auto limiter() -> rate_limit::RateLimiter& { return limiter_; }
    [[nodiscard]] auto coordinator() -> pipeline::Coordinator& { return coordinator_; }
    [[nodiscard]] auto queue() -> pipeline::EventQueue& { return queue_; }
    [[nodiscard]] auto store() -> store::Store& { return *store_; }

private:
    Config config_;
    std::unique_ptr<store::Store> store_;
    channels::Channel& channel_;
    boost::asio::io_context& ioc_;

    triggers::TriggerEngine triggers_;
    rate_limit::RateLimiter limiter_;
    rate_limit::SpamEscalator spam_;
    pipeline::EventQueue queue_;
    pipeline::Coordinator coordinator_;
    rate_limit::BlockSweeper sweeper_;

    std::atomic<bool> running_{false};
};

} // namespace chatwarden::service
