#include "chatwarden/service/bot_service.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"

namespace chatwarden::service {

BotService::BotService(Config config,
                       std::unique_ptr<store::Store> store,
                       channels::Channel& channel,
                       boost::asio::io_context& ioc,
                       NowFn now)
    : config_(std::move(config))
    , store_(std::move(store))
    , channel_(channel)
    , ioc_(ioc)
    , limiter_(config_.rate_limit, now)
    , spam_(config_.moderation, now)
    , queue_(ioc.get_executor(), config_.pipeline.queue_capacity)
    , coordinator_(*store_, triggers_, limiter_, spam_, channel_,
                   config_.data_collection, now)
    , sweeper_(ioc, std::chrono::seconds(config_.rate_limit.sweep_interval_seconds),
               [this] {
                   auto blocks = limiter_.sweep_expired();
                   auto senders = spam_.sweep();
                   LOG_DEBUG("Sweep removed {} expired blocks, {} idle spam windows",
                             blocks, senders);
               }) {
    channel_.attach(queue_);
}

auto BotService::initialize() -> awaitable<Result<void>> {
    auto rules = co_await store_->get_active_triggers();
    if (!rules) {
        LOG_ERROR("Failed to load triggers: {}", rules.error().what());
        co_return make_fail(rules.error());
    }
    triggers_.replace(std::move(*rules));
    LOG_INFO("{} initialized with {} active triggers", config_.bot.name, triggers_.size());
    co_return ok_result();
}

auto BotService::add_trigger_rule(std::string keyword, std::string response,
                                  triggers::MatchKind match_kind, bool case_sensitive)
    -> awaitable<Result<void>> {
    auto added = triggers_.add(keyword, response, match_kind, case_sensitive);
    if (!added) {
        co_return added;
    }

    auto stored = co_await store_->add_trigger(triggers::TriggerRule{
        .keyword = keyword,
        .response = std::move(response),
        .match_kind = match_kind,
        .case_sensitive = case_sensitive,
        .active = true,
    });
    if (!stored) {
        LOG_ERROR("Failed to persist trigger '{}': {}", keyword, stored.error().what());
        if (auto rolled_back = triggers_.remove(keyword); !rolled_back) {
            LOG_ERROR("Rollback of trigger '{}' failed: {}", keyword, rolled_back.error().what());
        }
        co_return stored;
    }
    co_return ok_result();
}

auto BotService::remove_trigger_rule(std::string keyword) -> awaitable<Result<void>> {
    auto previous = triggers_.rules();
    auto removed = triggers_.remove(keyword);
    if (!removed) {
        co_return removed;
    }

    auto stored = co_await store_->remove_trigger(keyword);
    if (!stored) {
        LOG_ERROR("Failed to remove trigger '{}' from the store: {}",
                  keyword, stored.error().what());
        // Restores the rule at its original position.
        triggers_.replace(std::move(previous));
        co_return stored;
    }
    co_return ok_result();
}

auto BotService::send_message(std::string conversation_id, std::string text)
    -> awaitable<Result<void>> {
    auto sent = co_await channel_.send(channels::OutgoingMessage{
        .conversation_id = conversation_id,
        .text = std::move(text),
    });
    if (!sent) {
        LOG_ERROR("Failed to send message to {}: {}", conversation_id, sent.error().what());
        co_return sent;
    }

    auto logged = co_await store_->append_log("info", "Message sent",
                                              json{{"to", conversation_id}});
    if (!logged) {
        LOG_WARN("Sent message to {} was not audited: {}", conversation_id,
                 logged.error().what());
    }
    co_return ok_result();
}

auto BotService::get_status() const -> json {
    return json{
        {"running", running_.load()},
        {"bot", config_.bot},
        {"channel", {
            {"name", std::string(channel_.name())},
            {"type", std::string(channel_.type())},
            {"running", channel_.is_running()},
        }},
        {"triggers", triggers_.size()},
        {"pipeline", {
            {"queue_capacity", queue_.capacity()},
            {"processed", coordinator_.processed_count()},
            {"blocked", coordinator_.blocked_count()},
            {"failures", coordinator_.failure_count()},
        }},
        {"rate_limit", limiter_.limits()},
        {"moderation", config_.moderation},
        {"data_collection", config_.data_collection},
        {"timestamp", utils::timestamp_iso()},
    };
}

auto BotService::get_stats() -> awaitable<Result<json>> {
    auto totals = co_await store_->totals();
    if (!totals) {
        co_return make_fail(totals.error());
    }

    co_return json{
        {"totals", *totals},
        {"rate_limiter", limiter_.global_stats()},
        {"blocked_senders", limiter_.blocked_senders()},
        {"status", get_status()},
    };
}

auto BotService::sender_stats(std::string_view sender, rate_limit::Category category)
    -> std::optional<rate_limit::SenderStats> {
    return limiter_.sender_stats(sender, category);
}

auto BotService::blocked_senders() const -> std::vector<rate_limit::BlockedSender> {
    return limiter_.blocked_senders();
}

void BotService::clear_sender(std::string_view sender) {
    limiter_.clear_sender(sender);
    spam_.clear_sender(sender);
}

auto BotService::run() -> awaitable<void> {
    if (running_.exchange(true)) {
        co_return;
    }
    LOG_INFO("Starting {} v{}", config_.bot.name, config_.bot.version);

    boost::asio::co_spawn(ioc_, sweeper_.start(), boost::asio::detached);
    co_await channel_.start();
    co_await coordinator_.run(queue_);

    sweeper_.stop();
    co_await channel_.stop();
    running_.store(false);
    LOG_INFO("{} stopped", config_.bot.name);
}

void BotService::stop() {
    LOG_INFO("Stopping {}", config_.bot.name);
    coordinator_.stop();
    queue_.close();
    sweeper_.stop();
}

} // namespace chatwarden::service
