#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "chatwarden/core/error.hpp"
#include "chatwarden/messages/message.hpp"
#include "chatwarden/triggers/rule.hpp"

namespace chatwarden::triggers {

/// Holds the ordered set of trigger rules and evaluates messages against it.
///
/// Rules live in an immutable snapshot that is replaced wholesale on every
/// mutation. Readers load the current snapshot without locking; writers
/// serialize among themselves, build a new snapshot and publish it. A
/// mutation is visible to the next match() call on any thread.
class TriggerEngine {
public:
    TriggerEngine();
    ~TriggerEngine() = default;

    TriggerEngine(const TriggerEngine&) = delete;
    TriggerEngine& operator=(const TriggerEngine&) = delete;

    /// Returns every active rule that fires for the message, in the order
    /// the rules were added. Empty text matches nothing.
    [[nodiscard]] auto match(const messages::NormalizedMessage& msg) const
        -> std::vector<TriggerRule>;

    /// Appends a rule. Fails with DuplicateKeyword if the keyword exists.
    auto add(std::string keyword, std::string response,
             MatchKind match_kind = MatchKind::Exact,
             bool case_sensitive = false) -> Result<void>;

    /// Removes the rule with the given keyword. Fails with NotFound.
    auto remove(std::string_view keyword) -> Result<void>;

    /// Atomically replaces the whole rule set, e.g. after a store reload.
    /// Later duplicates of a keyword are dropped.
    void replace(std::vector<TriggerRule> rules);

    /// Copy of the rules in evaluation order.
    [[nodiscard]] auto rules() const -> std::vector<TriggerRule>;

    [[nodiscard]] auto contains(std::string_view keyword) const -> bool;

    [[nodiscard]] auto size() const -> size_t;

private:
    struct CompiledRule {
        TriggerRule rule;
        std::string folded_keyword;           // keyword after case folding
        std::optional<std::regex> pattern;    // compiled regex, if valid
        std::string pattern_error;            // compile error, if invalid
    };

    using Snapshot = std::vector<CompiledRule>;

    static auto compile(TriggerRule rule) -> CompiledRule;
    static auto fires(const CompiledRule& compiled, const std::string& text,
                      const std::string& folded_text) -> bool;

    [[nodiscard]] auto load() const -> std::shared_ptr<const Snapshot>;
    void publish(Snapshot next);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
    std::mutex write_mutex_;
};

} // namespace chatwarden::triggers
