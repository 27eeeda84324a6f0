#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <SQLiteCpp/SQLiteCpp.h>

#include "chatwarden/core/error.hpp"
#include "chatwarden/core/types.hpp"
#include "chatwarden/messages/message.hpp"
#include "chatwarden/triggers/rule.hpp"

namespace chatwarden::store {

using boost::asio::awaitable;

/// A value extracted from message text or media ("phone", "url", "media").
struct CollectedDataPoint {
    std::string kind;
    std::string value;
    std::string source_id;
    std::optional<std::string> message_id;
    json context;
};

struct SpamEvent {
    std::string sender_id;
    std::string message_id;
    std::string reason;
    std::string severity;
    std::string action;
    Timestamp at;
};

struct LogEntry {
    std::string level;
    std::string message;
    json context;
    Timestamp at;
};

struct Totals {
    int64_t messages = 0;
    int64_t users = 0;
    int64_t groups = 0;
    int64_t active_triggers = 0;
    int64_t spam_events = 0;
    int64_t collected_data = 0;
};

void to_json(json& j, const SpamEvent& e);
void to_json(json& j, const LogEntry& e);
void to_json(json& j, const Totals& t);

/// Persistence sink for messages, users, triggers and audit records.
/// Message writes are insert-or-ignore on the message id so redelivered
/// events are never stored twice.
class Store {
public:
    virtual ~Store() = default;

    /// Returns true when the message was new, false for a duplicate id.
    virtual auto save_message(const messages::NormalizedMessage& msg)
        -> awaitable<Result<bool>> = 0;
    virtual auto upsert_user(std::string_view user_id) -> awaitable<Result<void>> = 0;
    virtual auto touch_user_activity(std::string_view user_id) -> awaitable<Result<void>> = 0;

    /// Active rules in insertion order.
    virtual auto get_active_triggers() -> awaitable<Result<std::vector<triggers::TriggerRule>>> = 0;
    /// Fails with DuplicateKeyword when the keyword is taken.
    virtual auto add_trigger(const triggers::TriggerRule& rule) -> awaitable<Result<void>> = 0;
    /// Fails with NotFound when no row has the keyword.
    virtual auto remove_trigger(std::string_view keyword) -> awaitable<Result<void>> = 0;

    virtual auto append_log(std::string_view level, std::string_view message,
                            const json& context) -> awaitable<Result<void>> = 0;
    virtual auto save_collected_data_point(const CollectedDataPoint& point)
        -> awaitable<Result<void>> = 0;
    virtual auto save_spam_event(const SpamEvent& event) -> awaitable<Result<void>> = 0;

    virtual auto totals() -> awaitable<Result<Totals>> = 0;
    virtual auto recent_messages(std::string_view conversation_id, int limit)
        -> awaitable<Result<std::vector<messages::NormalizedMessage>>> = 0;
    virtual auto spam_events(std::string_view sender_id, int limit)
        -> awaitable<Result<std::vector<SpamEvent>>> = 0;
    virtual auto logs(std::optional<std::string> level, int limit)
        -> awaitable<Result<std::vector<LogEntry>>> = 0;
};

class SqliteStore : public Store {
public:
    /// Opens (creating if needed) the database and applies the schema.
    /// Throws SQLite::Exception if the file cannot be opened.
    explicit SqliteStore(const std::string& db_path);

    auto save_message(const messages::NormalizedMessage& msg) -> awaitable<Result<bool>> override;
    auto upsert_user(std::string_view user_id) -> awaitable<Result<void>> override;
    auto touch_user_activity(std::string_view user_id) -> awaitable<Result<void>> override;

    auto get_active_triggers() -> awaitable<Result<std::vector<triggers::TriggerRule>>> override;
    auto add_trigger(const triggers::TriggerRule& rule) -> awaitable<Result<void>> override;
    auto remove_trigger(std::string_view keyword) -> awaitable<Result<void>> override;

    auto append_log(std::string_view level, std::string_view message,
                    const json& context) -> awaitable<Result<void>> override;
    auto save_collected_data_point(const CollectedDataPoint& point)
        -> awaitable<Result<void>> override;
    auto save_spam_event(const SpamEvent& event) -> awaitable<Result<void>> override;

    auto totals() -> awaitable<Result<Totals>> override;
    auto recent_messages(std::string_view conversation_id, int limit)
        -> awaitable<Result<std::vector<messages::NormalizedMessage>>> override;
    auto spam_events(std::string_view sender_id, int limit)
        -> awaitable<Result<std::vector<SpamEvent>>> override;
    auto logs(std::optional<std::string> level, int limit)
        -> awaitable<Result<std::vector<LogEntry>>> override;

private:
    void init_schema();
    auto count(const char* sql) -> int64_t;

    std::unique_ptr<SQLite::Database> db_;
};

} // namespace chatwarden::store
