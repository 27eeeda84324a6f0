#include "chatwarden/pipeline/coordinator.hpp"

#include <fmt/format.h>

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"
#include "chatwarden/messages/normalizer.hpp"
#include "chatwarden/pipeline/collector.hpp"

namespace chatwarden::pipeline {

namespace {

/// Membership change notifications carry {id, participants, action}
/// instead of a message key.
auto is_group_update(const json& raw) -> bool {
    if (!raw.is_object() || raw.contains("key")) return false;
    auto participants = raw.find("participants");
    auto action = raw.find("action");
    return participants != raw.end() && participants->is_array() &&
           action != raw.end() && action->is_string();
}

auto welcome_text(std::string_view participant) -> std::string {
    return fmt::format("👋 Welcome to the group, @{}!", utils::address_local_part(participant));
}

} // anonymous namespace

auto process_status_to_string(ProcessStatus s) -> std::string_view {
    switch (s) {
        case ProcessStatus::Skipped:     return "skipped";
        case ProcessStatus::Blocked:     return "blocked";
        case ProcessStatus::Processed:   return "processed";
        case ProcessStatus::GroupUpdate: return "group_update";
    }
    return "skipped";
}

Coordinator::Coordinator(store::Store& store,
                         triggers::TriggerEngine& triggers,
                         rate_limit::RateLimiter& limiter,
                         rate_limit::SpamEscalator& spam,
                         channels::Channel& channel,
                         DataCollectionConfig collection,
                         NowFn now)
    : store_(store)
    , triggers_(triggers)
    , limiter_(limiter)
    , spam_(spam)
    , channel_(channel)
    , collection_(std::move(collection))
    , now_(std::move(now)) {}

auto Coordinator::process(const json& raw_event) -> awaitable<ProcessOutcome> {
    if (is_group_update(raw_event)) {
        co_return co_await process_group_update(raw_event);
    }

    ProcessOutcome outcome;

    std::optional<messages::NormalizedMessage> normalized;
    try {
        normalized = messages::normalize(raw_event, now_);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to normalize event: {}", e.what());
        outcome.failures.emplace_back("normalize");
        failed_.fetch_add(1);
        co_return outcome;
    }
    if (!normalized) {
        co_return outcome;
    }

    if (normalized->id.empty()) {
        // Store rows are unique per message id; an empty id would collide.
        normalized->id = fmt::format("local-{}-{}", to_epoch_ms(now_()),
                                     local_ids_.fetch_add(1) + 1);
        LOG_WARN("Event without message id from '{}', assigned {}",
                 normalized->sender_id, normalized->id);
    }

    outcome.message = std::move(*normalized);
    const auto& msg = *outcome.message;

    // -- Admission ---------------------------------------------------------

    auto category = messages::is_media(msg.content_kind)
        ? rate_limit::Category::Media
        : rate_limit::Category::Message;
    auto decision = limiter_.admit(msg.sender_id, category);
    outcome.decision = decision;

    if (decision.blocked()) {
        outcome.status = ProcessStatus::Blocked;
        blocked_.fetch_add(1);
        LOG_INFO("Message {} from {} rate limited: {}", msg.id, msg.sender_id, decision.reason);

        json context = {
            {"messageId", msg.id},
            {"sender", msg.sender_id},
            {"reason", decision.reason},
            {"remaining_ms", decision.remaining.count()},
        };
        if (decision.severity) {
            context["severity"] = *decision.severity;
        }
        co_await guarded("audit", audit("warn", "Rate limited", std::move(context)), outcome);
        co_return outcome;
    }

    if (decision.warning) {
        outcome.warning_sent = co_await guarded(
            "rate_warning", dispatch_warning(msg, *decision.warning), outcome);
    }

    // -- Triggers ----------------------------------------------------------

    std::vector<triggers::TriggerRule> fired;
    try {
        fired = triggers_.match(msg);
    } catch (const std::exception& e) {
        LOG_ERROR("Trigger matching failed for {}: {}", msg.id, e.what());
        outcome.failures.emplace_back("trigger_match");
    }

    for (const auto& rule : fired) {
        outcome.fired_triggers.push_back(rule.keyword);
        co_await guarded("trigger:" + rule.keyword, dispatch_trigger(msg, rule), outcome);
    }

    // -- Persistence and bookkeeping ---------------------------------------

    co_await guarded("save_message", persist_message(msg), outcome);
    co_await guarded("user_activity", update_activity(msg), outcome);
    if (collection_enabled(collection_)) {
        co_await guarded("data_collection", collect_data(msg, outcome), outcome);
    }
    co_await guarded("spam_check", check_spam(msg, outcome), outcome);

    outcome.status = ProcessStatus::Processed;
    processed_.fetch_add(1);

    if (!outcome.failures.empty()) {
        failed_.fetch_add(1);
        co_await guarded("audit", audit("error", "Message processing failed", json{
            {"messageId", msg.id},
            {"stages", outcome.failures},
        }), outcome);
    }

    co_await guarded("audit", audit("info", "Message processed", json{
        {"messageId", msg.id},
        {"sender", msg.sender_id},
        {"isGroup", msg.is_group},
        {"type", std::string(messages::content_kind_to_string(msg.content_kind))},
    }), outcome);

    co_return outcome;
}

auto Coordinator::run(EventQueue& queue) -> awaitable<void> {
    LOG_INFO("Pipeline coordinator started");

    while (!stopping_.load()) {
        auto event = co_await queue.pop();
        if (!event) {
            break;
        }
        try {
            co_await process(*event);
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            LOG_ERROR("Unexpected error while processing event: {}", e.what());
        }
    }

    LOG_INFO("Pipeline coordinator stopped: {} processed, {} blocked, {} with failures",
             processed_.load(), blocked_.load(), failed_.load());
}

void Coordinator::stop() {
    stopping_.store(true);
}

auto Coordinator::guarded(std::string_view stage, awaitable<Result<void>> op,
                          ProcessOutcome& outcome) -> awaitable<bool> {
    std::string name(stage);
    std::string error;
    try {
        auto result = co_await std::move(op);
        if (result) {
            co_return true;
        }
        error = result.error().what();
    } catch (const std::exception& e) {
        error = e.what();
    }

    LOG_ERROR("Pipeline stage '{}' failed: {}", name, error);
    outcome.failures.push_back(std::move(name));
    co_return false;
}

auto Coordinator::process_group_update(const json& raw_event) -> awaitable<ProcessOutcome> {
    ProcessOutcome outcome;
    outcome.status = ProcessStatus::GroupUpdate;

    std::string group;
    if (auto id = raw_event.find("id"); id != raw_event.end() && id->is_string()) {
        group = id->get<std::string>();
    }
    auto action = raw_event.at("action").get<std::string>();

    for (const auto& participant : raw_event.at("participants")) {
        if (!participant.is_string()) continue;
        auto member = participant.get<std::string>();

        if (action == "add") {
            co_await guarded("welcome", channel_.send(channels::OutgoingMessage{
                .conversation_id = group,
                .text = welcome_text(member),
                .mentions = {member},
            }), outcome);
            co_await guarded("audit", audit("info", "New member joined group",
                json{{"group", group}, {"member", member}}), outcome);
        } else if (action == "remove") {
            co_await guarded("audit", audit("info", "Member left group",
                json{{"group", group}, {"member", member}}), outcome);
        } else {
            LOG_DEBUG("Ignoring group action '{}' for {} in {}", action, member, group);
        }
    }
    co_return outcome;
}

auto Coordinator::dispatch_warning(const messages::NormalizedMessage& msg, std::string text)
    -> awaitable<Result<void>> {
    channels::OutgoingMessage out{
        .conversation_id = msg.conversation_id,
        .text = std::move(text),
    };
    if (msg.is_group) {
        out.mentions.push_back(msg.sender_id);
    }
    co_return co_await channel_.send(std::move(out));
}

auto Coordinator::dispatch_trigger(const messages::NormalizedMessage& msg,
                                   const triggers::TriggerRule& rule) -> awaitable<Result<void>> {
    auto sent = co_await channel_.send(channels::OutgoingMessage{
        .conversation_id = msg.conversation_id,
        .text = rule.response,
    });
    if (!sent) {
        co_return sent;
    }

    LOG_INFO("Trigger '{}' answered in {}", rule.keyword, msg.conversation_id);
    auto logged = co_await audit("info", "Trigger response sent", json{
        {"trigger", rule.keyword},
        {"response", rule.response},
        {"to", msg.conversation_id},
    });
    if (!logged) {
        LOG_WARN("Trigger response for '{}' sent but not audited: {}",
                 rule.keyword, logged.error().what());
    }
    co_return ok_result();
}

auto Coordinator::persist_message(const messages::NormalizedMessage& msg)
    -> awaitable<Result<void>> {
    auto saved = co_await store_.save_message(msg);
    if (!saved) {
        co_return make_fail(saved.error());
    }
    co_return ok_result();
}

auto Coordinator::update_activity(const messages::NormalizedMessage& msg)
    -> awaitable<Result<void>> {
    auto upserted = co_await store_.upsert_user(msg.sender_id);
    if (!upserted) {
        co_return upserted;
    }
    co_return co_await store_.touch_user_activity(msg.sender_id);
}

auto Coordinator::collect_data(const messages::NormalizedMessage& msg, ProcessOutcome& outcome)
    -> awaitable<Result<void>> {
    std::optional<Error> first_error;
    for (const auto& point : extract_data_points(msg, collection_)) {
        auto saved = co_await store_.save_collected_data_point(point);
        if (saved) {
            ++outcome.data_points;
        } else if (!first_error) {
            first_error = saved.error();
        }
    }
    if (first_error) {
        co_return make_fail(std::move(*first_error));
    }
    co_return ok_result();
}

auto Coordinator::check_spam(const messages::NormalizedMessage& msg, ProcessOutcome& outcome)
    -> awaitable<Result<void>> {
    auto verdict = spam_.observe(msg.sender_id);
    if (!verdict.flagged) {
        co_return ok_result();
    }
    outcome.spam_flagged = true;

    auto saved = co_await store_.save_spam_event(store::SpamEvent{
        .sender_id = msg.sender_id,
        .message_id = msg.id,
        .reason = std::string(rate_limit::kSpamReason),
        .severity = std::string(rate_limit::kSpamSeverity),
        .action = std::string(rate_limit::kSpamAction),
        .at = now_(),
    });

    if (msg.is_group) {
        auto sent = co_await channel_.send(channels::OutgoingMessage{
            .conversation_id = msg.conversation_id,
            .text = rate_limit::SpamEscalator::warning_text(msg.sender_id),
            .mentions = {msg.sender_id},
        });
        if (!sent) {
            LOG_WARN("Spam warning to {} not delivered: {}", msg.conversation_id,
                     sent.error().what());
            if (saved) {
                co_return sent;
            }
        }
    }
    co_return saved;
}

auto Coordinator::audit(std::string_view level, std::string_view message, json context)
    -> awaitable<Result<void>> {
    co_return co_await store_.append_log(level, message, context);
}

} // namespace chatwarden::pipeline
