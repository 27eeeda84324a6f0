#include "chatwarden/triggers/engine.hpp"

#include <algorithm>
#include <unordered_set>

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"

namespace chatwarden::triggers {

// -- MatchKind / TriggerRule --

auto match_kind_to_string(MatchKind kind) -> std::string_view {
    switch (kind) {
        case MatchKind::Exact:    return "exact";
        case MatchKind::Contains: return "contains";
        case MatchKind::Regex:    return "regex";
    }
    return "exact";
}

auto match_kind_from_string(std::string_view s) -> Result<MatchKind> {
    if (s == "exact") return MatchKind::Exact;
    if (s == "contains") return MatchKind::Contains;
    if (s == "regex") return MatchKind::Regex;
    return std::unexpected(make_error(ErrorCode::InvalidArgument,
        "Unknown match type", std::string(s)));
}

void to_json(json& j, const TriggerRule& r) {
    j = json{
        {"keyword", r.keyword},
        {"response", r.response},
        {"match_type", r.match_kind},
        {"case_sensitive", r.case_sensitive},
        {"active", r.active},
    };
}

void from_json(const json& j, TriggerRule& r) {
    j.at("keyword").get_to(r.keyword);
    j.at("response").get_to(r.response);
    if (j.contains("match_type")) j.at("match_type").get_to(r.match_kind);
    if (j.contains("case_sensitive")) j.at("case_sensitive").get_to(r.case_sensitive);
    if (j.contains("active")) j.at("active").get_to(r.active);
}

// -- TriggerEngine --

TriggerEngine::TriggerEngine()
    : snapshot_(std::make_shared<const Snapshot>()) {}

auto TriggerEngine::compile(TriggerRule rule) -> CompiledRule {
    CompiledRule compiled;
    compiled.folded_keyword = rule.case_sensitive ? rule.keyword : utils::to_lower(rule.keyword);

    if (rule.match_kind == MatchKind::Regex) {
        auto flags = std::regex::ECMAScript;
        if (!rule.case_sensitive) {
            flags |= std::regex::icase;
        }
        try {
            compiled.pattern.emplace(rule.keyword, flags);
        } catch (const std::regex_error& e) {
            compiled.pattern_error = e.what();
            LOG_WARN("Trigger '{}' has an invalid pattern and will never fire: {}",
                     rule.keyword, e.what());
        }
    }

    compiled.rule = std::move(rule);
    return compiled;
}

auto TriggerEngine::fires(const CompiledRule& compiled, const std::string& text,
                          const std::string& folded_text) -> bool {
    const auto& rule = compiled.rule;
    const auto& subject = rule.case_sensitive ? text : folded_text;

    switch (rule.match_kind) {
        case MatchKind::Exact:
            return subject == compiled.folded_keyword;

        case MatchKind::Contains:
            return subject.find(compiled.folded_keyword) != std::string::npos;

        case MatchKind::Regex:
            if (!compiled.pattern) {
                LOG_ERROR("Skipping trigger '{}': invalid regex ({})",
                          rule.keyword, compiled.pattern_error);
                return false;
            }
            try {
                return std::regex_search(text, *compiled.pattern);
            } catch (const std::regex_error& e) {
                LOG_ERROR("Regex match error for trigger '{}': {}", rule.keyword, e.what());
                return false;
            }
    }
    return false;
}

auto TriggerEngine::match(const messages::NormalizedMessage& msg) const
    -> std::vector<TriggerRule> {
    std::vector<TriggerRule> fired;
    if (msg.text.empty()) {
        return fired;
    }

    auto snapshot = load();
    auto folded_text = utils::to_lower(msg.text);

    for (const auto& compiled : *snapshot) {
        if (!compiled.rule.active) continue;
        if (fires(compiled, msg.text, folded_text)) {
            LOG_DEBUG("Message {} matched trigger '{}'", msg.id, compiled.rule.keyword);
            fired.push_back(compiled.rule);
        }
    }
    return fired;
}

auto TriggerEngine::add(std::string keyword, std::string response,
                        MatchKind match_kind, bool case_sensitive) -> Result<void> {
    if (keyword.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Trigger keyword must not be empty"));
    }

    std::lock_guard lock(write_mutex_);
    auto current = load();

    auto exists = std::ranges::any_of(*current, [&](const CompiledRule& c) {
        return c.rule.keyword == keyword;
    });
    if (exists) {
        return std::unexpected(make_error(ErrorCode::DuplicateKeyword,
            "Trigger keyword already exists", keyword));
    }

    Snapshot next = *current;
    next.push_back(compile(TriggerRule{
        .keyword = keyword,
        .response = std::move(response),
        .match_kind = match_kind,
        .case_sensitive = case_sensitive,
        .active = true,
    }));
    publish(std::move(next));

    LOG_INFO("Trigger added: '{}' ({})", keyword, match_kind_to_string(match_kind));
    return {};
}

auto TriggerEngine::remove(std::string_view keyword) -> Result<void> {
    std::lock_guard lock(write_mutex_);
    auto current = load();

    Snapshot next;
    next.reserve(current->size());
    for (const auto& compiled : *current) {
        if (compiled.rule.keyword != keyword) {
            next.push_back(compiled);
        }
    }

    if (next.size() == current->size()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "No trigger with this keyword", std::string(keyword)));
    }

    publish(std::move(next));
    LOG_INFO("Trigger removed: '{}'", keyword);
    return {};
}

void TriggerEngine::replace(std::vector<TriggerRule> rules) {
    Snapshot next;
    next.reserve(rules.size());

    std::unordered_set<std::string> seen;
    for (auto& rule : rules) {
        if (!seen.insert(rule.keyword).second) {
            LOG_WARN("Dropping duplicate trigger keyword '{}' during reload", rule.keyword);
            continue;
        }
        next.push_back(compile(std::move(rule)));
    }

    std::lock_guard lock(write_mutex_);
    publish(std::move(next));
    LOG_INFO("Loaded {} triggers", seen.size());
}

auto TriggerEngine::rules() const -> std::vector<TriggerRule> {
    auto snapshot = load();
    std::vector<TriggerRule> out;
    out.reserve(snapshot->size());
    for (const auto& compiled : *snapshot) {
        out.push_back(compiled.rule);
    }
    return out;
}

auto TriggerEngine::contains(std::string_view keyword) const -> bool {
    auto snapshot = load();
    return std::ranges::any_of(*snapshot, [&](const CompiledRule& c) {
        return c.rule.keyword == keyword;
    });
}

auto TriggerEngine::size() const -> size_t {
    return load()->size();
}

auto TriggerEngine::load() const -> std::shared_ptr<const Snapshot> {
    return snapshot_.load(std::memory_order_acquire);
}

void TriggerEngine::publish(Snapshot next) {
    snapshot_.store(std::make_shared<const Snapshot>(std::move(next)),
                    std::memory_order_release);
}

} // namespace chatwarden::triggers
