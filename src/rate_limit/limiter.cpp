#include "chatwarden/rate_limit/limiter.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"

namespace chatwarden::rate_limit {

namespace {

constexpr auto kHorizon = std::chrono::hours(24);

auto ms_until(Timestamp deadline, Timestamp now) -> std::chrono::milliseconds {
    if (deadline <= now) return std::chrono::milliseconds{0};
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

} // anonymous namespace

auto category_to_string(Category c) -> std::string_view {
    switch (c) {
        case Category::Message: return "message";
        case Category::Media:   return "media";
        case Category::Command: return "command";
    }
    return "message";
}

auto window_kind_to_string(WindowKind w) -> std::string_view {
    switch (w) {
        case WindowKind::Minute: return "per_minute";
        case WindowKind::Hour:   return "per_hour";
        case WindowKind::Day:    return "per_day";
    }
    return "per_minute";
}

auto severity_to_string(Severity s) -> std::string_view {
    switch (s) {
        case Severity::Warning: return "warning";
        case Severity::Soft:    return "soft";
        case Severity::Hard:    return "hard";
        case Severity::Severe:  return "severe";
    }
    return "warning";
}

auto severity_for(int observed, int limit) -> Severity {
    if (limit <= 0) return Severity::Severe;
    double ratio = static_cast<double>(observed) / static_cast<double>(limit);
    if (ratio >= 2.0) return Severity::Severe;
    if (ratio >= 1.5) return Severity::Hard;
    if (ratio >= 1.0) return Severity::Soft;
    return Severity::Warning;
}

// -- JSON --

void to_json(json& j, const Violation& v) {
    j = json{{"window", v.window}, {"observed", v.observed}, {"limit", v.limit}};
}

void to_json(json& j, const Decision& d) {
    j = json{
        {"allowed", d.allowed},
        {"reason", d.reason},
        {"remaining_ms", d.remaining.count()},
        {"violations", d.violations},
    };
    if (d.warning) j["warning"] = *d.warning;
    if (d.severity) j["severity"] = *d.severity;
}

void to_json(json& j, const SenderStats& s) {
    j = json{
        {"per_minute", s.counts.per_minute},
        {"per_hour", s.counts.per_hour},
        {"per_day", s.counts.per_day},
        {"limits", s.limits},
        {"warning_count", s.warning_count},
        {"is_blocked", s.blocked},
    };
    j["last_warning"] = s.last_warning ? json(utils::format_iso(*s.last_warning)) : json(nullptr);
}

void to_json(json& j, const BlockedSender& b) {
    j = json{
        {"sender_id", b.sender_id},
        {"reason", b.reason},
        {"severity", b.severity},
        {"remaining_ms", b.remaining.count()},
        {"blocked_at", utils::format_iso(b.blocked_at)},
    };
}

void to_json(json& j, const GlobalStats& g) {
    j = json{
        {"total_senders", g.total_senders},
        {"blocked_senders", g.blocked_senders},
        {"active_senders", g.active_senders},
    };
}

// -- SenderState --

auto RateLimiter::SenderState::log(Category c) -> std::deque<Timestamp>& {
    switch (c) {
        case Category::Media:   return media;
        case Category::Command: return commands;
        default:                return messages;
    }
}

auto RateLimiter::SenderState::log(Category c) const -> const std::deque<Timestamp>& {
    switch (c) {
        case Category::Media:   return media;
        case Category::Command: return commands;
        default:                return messages;
    }
}

// -- RateLimiter --

RateLimiter::RateLimiter(RateLimitConfig config, NowFn now)
    : config_(std::move(config))
    , now_(std::move(now)) {}

auto RateLimiter::can_proceed(std::string_view sender, Category category) -> Decision {
    std::lock_guard lock(mutex_);
    return check_locked(std::string(sender), category, now_());
}

void RateLimiter::record(std::string_view sender, Category category) {
    std::lock_guard lock(mutex_);
    auto now = now_();
    auto& log = senders_[std::string(sender)].log(category);
    purge(log, now);
    log.push_back(now);
}

auto RateLimiter::admit(std::string_view sender, Category category) -> Decision {
    std::lock_guard lock(mutex_);
    auto now = now_();
    std::string key(sender);

    auto decision = check_locked(key, category, now);
    if (decision.allowed) {
        senders_[key].log(category).push_back(now);
    }
    return decision;
}

auto RateLimiter::check_locked(const std::string& sender, Category category, Timestamp now)
    -> Decision {
    if (is_blocked_locked(sender, now)) {
        const auto& block = blocks_.at(sender);
        return Decision{
            .allowed = false,
            .reason = block.reason,
            .severity = block.severity,
            .remaining = ms_until(block.expires_at(), now),
            .violations = block.violations,
        };
    }

    auto& state = senders_[sender];
    auto& log = state.log(category);
    purge(log, now);

    const auto& limits = limits_for(category);
    auto current = counts(log, now);

    std::vector<Violation> violations;
    if (current.per_minute >= limits.per_minute) {
        violations.push_back({WindowKind::Minute, current.per_minute, limits.per_minute});
    }
    if (current.per_hour >= limits.per_hour) {
        violations.push_back({WindowKind::Hour, current.per_hour, limits.per_hour});
    }
    if (current.per_day >= limits.per_day) {
        violations.push_back({WindowKind::Day, current.per_day, limits.per_day});
    }

    if (!violations.empty()) {
        // Highest severity wins; on equal severity the longer window does.
        // Violations are ordered minute, hour, day, so >= prefers the later.
        const Violation* worst = &violations.front();
        auto worst_severity = severity_for(worst->observed, worst->limit);
        for (const auto& v : violations) {
            auto s = severity_for(v.observed, v.limit);
            if (s >= worst_severity) {
                worst = &v;
                worst_severity = s;
            }
        }

        BlockRecord record{
            .blocked_at = now,
            .duration = duration_for(worst_severity),
            .reason = fmt::format("Rate limit exceeded: {}/{} {}",
                                  worst->observed, worst->limit,
                                  window_kind_to_string(worst->window)),
            .category = category,
            .severity = worst_severity,
            .violations = violations,
        };

        LOG_WARN("Blocking {} for {}s ({}, {})", sender,
                 std::chrono::duration_cast<std::chrono::seconds>(record.duration).count(),
                 severity_to_string(worst_severity), record.reason);

        Decision decision{
            .allowed = false,
            .reason = record.reason,
            .severity = worst_severity,
            .remaining = record.duration,
            .violations = std::move(violations),
        };
        blocks_.insert_or_assign(sender, std::move(record));
        return decision;
    }

    // The warning threshold is evaluated against the count this attempt
    // would produce, so the Nth message of the window is the one warned.
    int prospective = current.per_minute + 1;
    auto threshold = static_cast<int>(
        std::floor(static_cast<double>(limits.per_minute) * threshold_for(category)));
    auto cooldown = std::chrono::seconds(config_.warning_cooldown_seconds);

    if (prospective >= threshold &&
        (!state.last_warning || now - *state.last_warning >= cooldown)) {
        state.last_warning = now;
        ++state.warning_count;
        LOG_INFO("Rate warning for {} ({}/{} per minute)", sender, prospective, limits.per_minute);
        return Decision{
            .allowed = true,
            .warning = fmt::format(
                "⚠️ Warning: You're sending messages quickly ({}/{} per minute). "
                "Please slow down to avoid being temporarily blocked.",
                prospective, limits.per_minute),
        };
    }

    return Decision{};
}

auto RateLimiter::is_blocked(std::string_view sender) -> bool {
    std::lock_guard lock(mutex_);
    return is_blocked_locked(std::string(sender), now_());
}

auto RateLimiter::is_blocked_locked(const std::string& sender, Timestamp now) -> bool {
    auto it = blocks_.find(sender);
    if (it == blocks_.end()) return false;
    if (it->second.active_at(now)) return true;

    LOG_DEBUG("Block for {} expired", sender);
    blocks_.erase(it);
    return false;
}

auto RateLimiter::block_info(std::string_view sender) -> std::optional<BlockRecord> {
    std::lock_guard lock(mutex_);
    std::string key(sender);
    if (!is_blocked_locked(key, now_())) return std::nullopt;
    return blocks_.at(key);
}

auto RateLimiter::sweep_expired() -> size_t {
    std::lock_guard lock(mutex_);
    auto now = now_();
    auto removed = std::erase_if(blocks_, [now](const auto& entry) {
        return !entry.second.active_at(now);
    });
    if (removed > 0) {
        LOG_DEBUG("Swept {} expired blocks", removed);
    }

    // Senders with no activity inside the horizon and no block are forgotten.
    size_t idle = 0;
    for (auto it = senders_.begin(); it != senders_.end();) {
        auto& state = it->second;
        purge(state.messages, now);
        purge(state.media, now);
        purge(state.commands, now);
        if (state.messages.empty() && state.media.empty() && state.commands.empty() &&
            !blocks_.contains(it->first)) {
            it = senders_.erase(it);
            ++idle;
        } else {
            ++it;
        }
    }
    if (idle > 0) {
        LOG_DEBUG("Dropped {} idle senders", idle);
    }
    return removed;
}

auto RateLimiter::blocked_senders() const -> std::vector<BlockedSender> {
    std::lock_guard lock(mutex_);
    auto now = now_();

    std::vector<BlockedSender> out;
    for (const auto& [sender, block] : blocks_) {
        if (!block.active_at(now)) continue;
        out.push_back(BlockedSender{
            .sender_id = sender,
            .reason = block.reason,
            .severity = block.severity,
            .remaining = ms_until(block.expires_at(), now),
            .blocked_at = block.blocked_at,
        });
    }
    std::ranges::sort(out, {}, &BlockedSender::blocked_at);
    return out;
}

auto RateLimiter::sender_stats(std::string_view sender, Category category)
    -> std::optional<SenderStats> {
    std::lock_guard lock(mutex_);
    std::string key(sender);
    auto now = now_();

    auto it = senders_.find(key);
    if (it == senders_.end()) return std::nullopt;

    auto& log = it->second.log(category);
    purge(log, now);

    return SenderStats{
        .counts = counts(log, now),
        .limits = limits_for(category),
        .warning_count = it->second.warning_count,
        .last_warning = it->second.last_warning,
        .blocked = is_blocked_locked(key, now),
    };
}

auto RateLimiter::global_stats() const -> GlobalStats {
    std::lock_guard lock(mutex_);
    auto now = now_();
    auto hour_ago = now - std::chrono::hours(1);

    GlobalStats stats;
    stats.total_senders = senders_.size();
    stats.blocked_senders = static_cast<size_t>(std::ranges::count_if(blocks_,
        [now](const auto& entry) { return entry.second.active_at(now); }));

    for (const auto& [_, state] : senders_) {
        bool active = count_since(state.messages, hour_ago) > 0 ||
                      count_since(state.media, hour_ago) > 0 ||
                      count_since(state.commands, hour_ago) > 0;
        if (active) ++stats.active_senders;
    }
    return stats;
}

void RateLimiter::update_limits(RateLimitConfig config) {
    std::lock_guard lock(mutex_);
    config_ = std::move(config);
    LOG_INFO("Rate limits updated: messages {}/{}/{}, media {}/{}/{}, commands {}/{}/{}",
             config_.messages.per_minute, config_.messages.per_hour, config_.messages.per_day,
             config_.media.per_minute, config_.media.per_hour, config_.media.per_day,
             config_.commands.per_minute, config_.commands.per_hour, config_.commands.per_day);
}

auto RateLimiter::limits() const -> RateLimitConfig {
    std::lock_guard lock(mutex_);
    return config_;
}

void RateLimiter::clear_sender(std::string_view sender) {
    std::lock_guard lock(mutex_);
    std::string key(sender);
    senders_.erase(key);
    blocks_.erase(key);
    LOG_INFO("Cleared rate-limit state for {}", sender);
}

auto RateLimiter::limits_for(Category c) const -> const CategoryLimits& {
    switch (c) {
        case Category::Media:   return config_.media;
        case Category::Command: return config_.commands;
        default:                return config_.messages;
    }
}

auto RateLimiter::threshold_for(Category c) const -> double {
    switch (c) {
        case Category::Media:   return config_.warning_thresholds.media;
        case Category::Command: return config_.warning_thresholds.commands;
        default:                return config_.warning_thresholds.messages;
    }
}

auto RateLimiter::duration_for(Severity s) const -> std::chrono::milliseconds {
    const auto& d = config_.block_durations;
    switch (s) {
        case Severity::Warning: return std::chrono::seconds(d.warning);
        case Severity::Soft:    return std::chrono::seconds(d.soft);
        case Severity::Hard:    return std::chrono::seconds(d.hard);
        case Severity::Severe:  return std::chrono::seconds(d.severe);
    }
    return std::chrono::seconds(d.soft);
}

void RateLimiter::purge(std::deque<Timestamp>& log, Timestamp now) {
    auto cutoff = now - kHorizon;
    std::erase_if(log, [cutoff](Timestamp t) { return t <= cutoff; });
}

auto RateLimiter::count_since(const std::deque<Timestamp>& log, Timestamp cutoff) -> int {
    return static_cast<int>(std::ranges::count_if(log, [cutoff](Timestamp t) {
        return t > cutoff;
    }));
}

auto RateLimiter::counts(const std::deque<Timestamp>& log, Timestamp now) -> WindowCounts {
    return WindowCounts{
        .per_minute = count_since(log, now - window_span(WindowKind::Minute)),
        .per_hour = count_since(log, now - window_span(WindowKind::Hour)),
        .per_day = count_since(log, now - window_span(WindowKind::Day)),
    };
}

} // namespace chatwarden::rate_limit
