#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "chatwarden/channels/channel.hpp"
#include "chatwarden/core/config.hpp"
#include "chatwarden/core/error.hpp"
#include "chatwarden/messages/message.hpp"
#include "chatwarden/pipeline/event_queue.hpp"
#include "chatwarden/rate_limit/limiter.hpp"
#include "chatwarden/rate_limit/spam.hpp"
#include "chatwarden/store/store.hpp"
#include "chatwarden/triggers/engine.hpp"

namespace chatwarden::pipeline {

using boost::asio::awaitable;

enum class ProcessStatus {
    Skipped,       // self-originated or unusable event
    Blocked,       // admission denied by the rate limiter
    Processed,
    GroupUpdate,   // membership change, not a message
};

auto process_status_to_string(ProcessStatus s) -> std::string_view;

/// What happened to one inbound event.
struct ProcessOutcome {
    ProcessStatus status = ProcessStatus::Skipped;
    std::optional<messages::NormalizedMessage> message;
    std::optional<rate_limit::Decision> decision;
    std::vector<std::string> fired_triggers;
    bool warning_sent = false;
    bool spam_flagged = false;
    size_t data_points = 0;
    std::vector<std::string> failures;   // names of the stages that failed

    [[nodiscard]] auto ok() const noexcept -> bool { return failures.empty(); }
};

/// Drives raw events through normalize, admission, trigger dispatch,
/// persistence, data collection and spam escalation.
///
/// Every stage after normalization is isolated: an error result or an
/// exception is logged, noted in ProcessOutcome::failures, and the
/// remaining stages still run. process() never throws.
class Coordinator {
public:
    Coordinator(store::Store& store,
                triggers::TriggerEngine& triggers,
                rate_limit::RateLimiter& limiter,
                rate_limit::SpamEscalator& spam,
                channels::Channel& channel,
                DataCollectionConfig collection,
                NowFn now = system_now);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    auto process(const json& raw_event) -> awaitable<ProcessOutcome>;

    /// Consumes `queue` one event at a time until it is closed and drained
    /// or stop() is called.
    auto run(EventQueue& queue) -> awaitable<void>;

    /// Finishes the event in progress, then leaves run().
    void stop();

    [[nodiscard]] auto processed_count() const noexcept -> size_t { return processed_.load(); }
    [[nodiscard]] auto blocked_count() const noexcept -> size_t { return blocked_.load(); }
    [[nodiscard]] auto failure_count() const noexcept -> size_t { return failed_.load(); }

private:
    auto guarded(std::string_view stage, awaitable<Result<void>> op, ProcessOutcome& outcome)
        -> awaitable<bool>;

    auto process_group_update(const json& raw_event) -> awaitable<ProcessOutcome>;

    auto dispatch_warning(const messages::NormalizedMessage& msg, std::string text)
        -> awaitable<Result<void>>;
    auto dispatch_trigger(const messages::NormalizedMessage& msg,
                          const triggers::TriggerRule& rule) -> awaitable<Result<void>>;
    auto persist_message(const messages::NormalizedMessage& msg) -> awaitable<Result<void>>;
    auto update_activity(const messages::NormalizedMessage& msg) -> awaitable<Result<void>>;
    auto collect_data(const messages::NormalizedMessage& msg, ProcessOutcome& outcome)
        -> awaitable<Result<void>>;
    auto check_spam(const messages::NormalizedMessage& msg, ProcessOutcome& outcome)
        -> awaitable<Result<void>>;
    auto audit(std::string_view level, std::string_view message, json context)
        -> awaitable<Result<void>>;

    store::Store& store_;
    triggers::TriggerEngine& triggers_;
    rate_limit::RateLimiter& limiter_;
    rate_limit::SpamEscalator& spam_;
    channels::Channel& channel_;
    DataCollectionConfig collection_;
    NowFn now_;

    std::atomic<bool> stopping_{false};
    std::atomic<size_t> processed_{0};
    std::atomic<size_t> blocked_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<uint64_t> local_ids_{0};
};

} // namespace chatwarden::pipeline
