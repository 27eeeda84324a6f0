#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "chatwarden/core/config.hpp"
#include "chatwarden/core/types.hpp"

namespace chatwarden::rate_limit {

inline constexpr std::string_view kSpamReason = "High message frequency";
inline constexpr std::string_view kSpamSeverity = "medium";
inline constexpr std::string_view kSpamAction = "flagged";

struct SpamVerdict {
    bool flagged = false;
    int count = 0;    // messages in the trailing window, this one included
};

/// Coarse, category-agnostic burst detector.
///
/// Every observed message is appended to the sender's trailing window
/// before counting; the sender is flagged when the count exceeds the
/// configured threshold. Each flagged message is reported separately.
class SpamEscalator {
public:
    explicit SpamEscalator(ModerationConfig config, NowFn now = system_now);

    SpamEscalator(const SpamEscalator&) = delete;
    SpamEscalator& operator=(const SpamEscalator&) = delete;

    auto observe(std::string_view sender) -> SpamVerdict;

    /// Count in the current window without recording anything.
    [[nodiscard]] auto count(std::string_view sender) -> int;

    void clear_sender(std::string_view sender);

    /// Drops timestamps older than the window and empty senders.
    auto sweep() -> size_t;

    [[nodiscard]] auto threshold() const noexcept -> int { return config_.spam_threshold; }

    /// Group reply mentioning the sender by the local part of their id.
    [[nodiscard]] static auto warning_text(std::string_view sender_id) -> std::string;

private:
    void purge(std::deque<Timestamp>& window, Timestamp now) const;

    ModerationConfig config_;
    NowFn now_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Timestamp>> windows_;
};

} // namespace chatwarden::rate_limit
