#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatwarden/core/config.hpp"
#include "chatwarden/core/types.hpp"

namespace chatwarden::rate_limit {

enum class Category {
    Message,
    Media,
    Command,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Category, {
    {Category::Message, "message"},
    {Category::Media, "media"},
    {Category::Command, "command"},
})

enum class WindowKind {
    Minute,
    Hour,
    Day,
};

NLOHMANN_JSON_SERIALIZE_ENUM(WindowKind, {
    {WindowKind::Minute, "per_minute"},
    {WindowKind::Hour, "per_hour"},
    {WindowKind::Day, "per_day"},
})

enum class Severity {
    Warning,
    Soft,
    Hard,
    Severe,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Severity, {
    {Severity::Warning, "warning"},
    {Severity::Soft, "soft"},
    {Severity::Hard, "hard"},
    {Severity::Severe, "severe"},
})

auto category_to_string(Category c) -> std::string_view;
auto window_kind_to_string(WindowKind w) -> std::string_view;
auto severity_to_string(Severity s) -> std::string_view;

[[nodiscard]] constexpr auto window_span(WindowKind w) -> std::chrono::milliseconds {
    switch (w) {
        case WindowKind::Minute: return std::chrono::minutes(1);
        case WindowKind::Hour:   return std::chrono::hours(1);
        case WindowKind::Day:    return std::chrono::hours(24);
    }
    return std::chrono::hours(24);
}

/// Severity from the observed/limit ratio: >= 2 severe, >= 1.5 hard,
/// >= 1 soft, otherwise warning.
[[nodiscard]] auto severity_for(int observed, int limit) -> Severity;

/// One sliding window that reached its limit.
struct Violation {
    WindowKind window = WindowKind::Minute;
    int observed = 0;
    int limit = 0;
};

struct BlockRecord {
    Timestamp blocked_at;
    std::chrono::milliseconds duration{0};
    std::string reason;
    Category category = Category::Message;
    Severity severity = Severity::Soft;
    std::vector<Violation> violations;

    [[nodiscard]] auto expires_at() const -> Timestamp { return blocked_at + duration; }

    /// A sender is blocked iff now < blocked_at + duration.
    [[nodiscard]] auto active_at(Timestamp now) const -> bool { return now < expires_at(); }
};

/// Outcome of an admission check. Blocked is a regular outcome, not an error.
struct Decision {
    bool allowed = true;
    std::optional<std::string> warning;
    std::string reason;
    std::optional<Severity> severity;
    std::chrono::milliseconds remaining{0};
    std::vector<Violation> violations;

    [[nodiscard]] auto blocked() const noexcept -> bool { return !allowed; }
};

struct WindowCounts {
    int per_minute = 0;
    int per_hour = 0;
    int per_day = 0;
};

struct SenderStats {
    WindowCounts counts;
    CategoryLimits limits;
    int warning_count = 0;
    std::optional<Timestamp> last_warning;
    bool blocked = false;
};

struct BlockedSender {
    std::string sender_id;
    std::string reason;
    Severity severity = Severity::Soft;
    std::chrono::milliseconds remaining{0};
    Timestamp blocked_at;
};

struct GlobalStats {
    size_t total_senders = 0;
    size_t blocked_senders = 0;
    size_t active_senders = 0;   // any activity within the last hour
};

void to_json(json& j, const Violation& v);
void to_json(json& j, const Decision& d);
void to_json(json& j, const SenderStats& s);
void to_json(json& j, const BlockedSender& b);
void to_json(json& j, const GlobalStats& g);

/// Per-sender sliding-window rate limiter with a blocked-sender registry.
///
/// Activity timestamps are kept per (sender, category) for a trailing 24h
/// horizon and purged lazily whenever a sender's log is touched. All state
/// sits behind one mutex, so admit() is an atomic check-then-record.
class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config, NowFn now = system_now);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Admission check without recording the attempt.
    [[nodiscard]] auto can_proceed(std::string_view sender, Category category) -> Decision;

    /// Appends the current time to the sender's activity log for `category`.
    void record(std::string_view sender, Category category);

    /// can_proceed() and, when allowed, record() under a single lock.
    [[nodiscard]] auto admit(std::string_view sender, Category category) -> Decision;

    /// Lazily drops the block record if it has expired.
    [[nodiscard]] auto is_blocked(std::string_view sender) -> bool;

    [[nodiscard]] auto block_info(std::string_view sender) -> std::optional<BlockRecord>;

    /// Removes every expired block record and forgets senders with no
    /// activity inside the 24h horizon. Returns how many blocks were removed.
    auto sweep_expired() -> size_t;

    /// Non-expired block records with their remaining time.
    [[nodiscard]] auto blocked_senders() const -> std::vector<BlockedSender>;

    [[nodiscard]] auto sender_stats(std::string_view sender, Category category)
        -> std::optional<SenderStats>;

    [[nodiscard]] auto global_stats() const -> GlobalStats;

    void update_limits(RateLimitConfig config);

    [[nodiscard]] auto limits() const -> RateLimitConfig;

    /// Administrative reset: forgets activity, warnings and any block.
    void clear_sender(std::string_view sender);

private:
    struct SenderState {
        std::deque<Timestamp> messages;
        std::deque<Timestamp> media;
        std::deque<Timestamp> commands;
        std::optional<Timestamp> last_warning;
        int warning_count = 0;

        auto log(Category c) -> std::deque<Timestamp>&;
        [[nodiscard]] auto log(Category c) const -> const std::deque<Timestamp>&;
    };

    auto check_locked(const std::string& sender, Category category, Timestamp now) -> Decision;
    auto is_blocked_locked(const std::string& sender, Timestamp now) -> bool;
    [[nodiscard]] auto limits_for(Category c) const -> const CategoryLimits&;
    [[nodiscard]] auto threshold_for(Category c) const -> double;
    [[nodiscard]] auto duration_for(Severity s) const -> std::chrono::milliseconds;

    static void purge(std::deque<Timestamp>& log, Timestamp now);
    static auto count_since(const std::deque<Timestamp>& log, Timestamp cutoff) -> int;
    static auto counts(const std::deque<Timestamp>& log, Timestamp now) -> WindowCounts;

    RateLimitConfig config_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SenderState> senders_;
    std::unordered_map<std::string, BlockRecord> blocks_;
};

} // namespace chatwarden::rate_limit
