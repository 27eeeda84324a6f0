#include "chatwarden/rate_limit/spam.hpp"

#include <fmt/format.h>

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"

namespace chatwarden::rate_limit {

SpamEscalator::SpamEscalator(ModerationConfig config, NowFn now)
    : config_(std::move(config))
    , now_(std::move(now)) {}

auto SpamEscalator::observe(std::string_view sender) -> SpamVerdict {
    std::lock_guard lock(mutex_);
    auto now = now_();

    auto& window = windows_[std::string(sender)];
    purge(window, now);
    window.push_back(now);

    SpamVerdict verdict{
        .flagged = static_cast<int>(window.size()) > config_.spam_threshold,
        .count = static_cast<int>(window.size()),
    };
    if (verdict.flagged) {
        LOG_INFO("Spam detected from {}: {} messages in {}s",
                 sender, verdict.count, config_.spam_window_seconds);
    }
    return verdict;
}

auto SpamEscalator::count(std::string_view sender) -> int {
    std::lock_guard lock(mutex_);
    auto it = windows_.find(std::string(sender));
    if (it == windows_.end()) return 0;
    purge(it->second, now_());
    return static_cast<int>(it->second.size());
}

void SpamEscalator::clear_sender(std::string_view sender) {
    std::lock_guard lock(mutex_);
    windows_.erase(std::string(sender));
}

auto SpamEscalator::sweep() -> size_t {
    std::lock_guard lock(mutex_);
    auto now = now_();
    for (auto& [_, window] : windows_) {
        purge(window, now);
    }
    return std::erase_if(windows_, [](const auto& entry) { return entry.second.empty(); });
}

auto SpamEscalator::warning_text(std::string_view sender_id) -> std::string {
    return fmt::format("⚠️ @{}, please slow down your messages to avoid being flagged as spam.",
                       utils::address_local_part(sender_id));
}

void SpamEscalator::purge(std::deque<Timestamp>& window, Timestamp now) const {
    auto cutoff = now - std::chrono::seconds(config_.spam_window_seconds);
    while (!window.empty() && window.front() <= cutoff) {
        window.pop_front();
    }
}

} // namespace chatwarden::rate_limit
