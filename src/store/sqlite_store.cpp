#include "chatwarden/store/store.hpp"

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"

namespace chatwarden::store {

namespace {

auto parse_context(const SQLite::Column& column) -> json {
    if (column.isNull()) return nullptr;
    auto parsed = json::parse(column.getString(), nullptr, false);
    return parsed.is_discarded() ? json(nullptr) : parsed;
}

void bind_optional(SQLite::Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        stmt.bind(index, *value);
    } else {
        stmt.bind(index);  // bind NULL
    }
}

auto db_fail(std::string_view what, const SQLite::Exception& e) -> Fail {
    LOG_ERROR("{}: {}", what, e.what());
    return make_fail(make_error(ErrorCode::DatabaseError, std::string(what), e.what()));
}

} // anonymous namespace

// -- JSON --

void to_json(json& j, const SpamEvent& e) {
    j = json{
        {"sender_id", e.sender_id},
        {"message_id", e.message_id},
        {"reason", e.reason},
        {"severity", e.severity},
        {"action", e.action},
        {"timestamp", utils::format_iso(e.at)},
    };
}

void to_json(json& j, const LogEntry& e) {
    j = json{
        {"level", e.level},
        {"message", e.message},
        {"context", e.context},
        {"timestamp", utils::format_iso(e.at)},
    };
}

void to_json(json& j, const Totals& t) {
    j = json{
        {"messages", t.messages},
        {"users", t.users},
        {"groups", t.groups},
        {"active_triggers", t.active_triggers},
        {"spam_events", t.spam_events},
        {"collected_data", t.collected_data},
    };
}

// -- SqliteStore --

SqliteStore::SqliteStore(const std::string& db_path)
    : db_(std::make_unique<SQLite::Database>(
          db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)) {
    init_schema();
    LOG_INFO("SQLite store opened at {}", db_path);
}

void SqliteStore::init_schema() {
    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            jid TEXT UNIQUE NOT NULL,
            phone TEXT,
            last_seen INTEGER,
            message_count INTEGER NOT NULL DEFAULT 0,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            message_id TEXT UNIQUE NOT NULL,
            jid TEXT NOT NULL,
            sender_jid TEXT NOT NULL,
            message_type TEXT NOT NULL,
            content TEXT,
            media_url TEXT,
            media_type TEXT,
            timestamp INTEGER NOT NULL,
            is_group INTEGER NOT NULL DEFAULT 0,
            reply_to TEXT,
            is_forwarded INTEGER NOT NULL DEFAULT 0,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS triggers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            keyword TEXT UNIQUE NOT NULL,
            response TEXT NOT NULL,
            is_active INTEGER NOT NULL DEFAULT 1,
            match_type TEXT NOT NULL DEFAULT 'exact',
            case_sensitive INTEGER NOT NULL DEFAULT 0,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS spam_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_jid TEXT NOT NULL,
            message_id TEXT,
            reason TEXT NOT NULL,
            severity TEXT NOT NULL DEFAULT 'low',
            action_taken TEXT,
            timestamp INTEGER NOT NULL
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS collected_data (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL,
            value TEXT NOT NULL,
            source_jid TEXT NOT NULL,
            message_id TEXT,
            context TEXT,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS bot_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            level TEXT NOT NULL,
            message TEXT NOT NULL,
            context TEXT,
            timestamp INTEGER NOT NULL
        )
    )SQL");

    db_->exec("CREATE INDEX IF NOT EXISTS idx_messages_jid_timestamp ON messages(jid, timestamp)");
    db_->exec("CREATE INDEX IF NOT EXISTS idx_messages_sender_timestamp ON messages(sender_jid, timestamp)");
    db_->exec("CREATE INDEX IF NOT EXISTS idx_spam_logs_user ON spam_logs(user_jid)");
    db_->exec("CREATE INDEX IF NOT EXISTS idx_collected_data_type ON collected_data(type)");
    db_->exec("CREATE INDEX IF NOT EXISTS idx_bot_logs_level_timestamp ON bot_logs(level, timestamp)");
}

auto SqliteStore::save_message(const messages::NormalizedMessage& msg)
    -> awaitable<Result<bool>> {
    try {
        SQLite::Statement stmt(*db_,
            "INSERT OR IGNORE INTO messages (message_id, jid, sender_jid, message_type, "
            "content, media_url, media_type, timestamp, is_group, reply_to, is_forwarded) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

        stmt.bind(1, msg.id);
        stmt.bind(2, msg.conversation_id);
        stmt.bind(3, msg.sender_id);
        stmt.bind(4, std::string(messages::content_kind_to_string(msg.content_kind)));
        stmt.bind(5, msg.text);
        if (msg.media) {
            stmt.bind(6, msg.media->url);
            stmt.bind(7, msg.media->mime_type);
        } else {
            stmt.bind(6);
            stmt.bind(7);
        }
        stmt.bind(8, to_epoch_ms(msg.timestamp));
        stmt.bind(9, msg.is_group ? 1 : 0);
        bind_optional(stmt, 10, msg.reply_to_id);
        stmt.bind(11, msg.is_forwarded ? 1 : 0);

        auto rows = stmt.exec();
        if (rows == 0) {
            LOG_DEBUG("Message {} already stored", msg.id);
        }
        co_return rows > 0;
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to save message", e);
    }
}

auto SqliteStore::upsert_user(std::string_view user_id) -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_,
            "INSERT OR IGNORE INTO users (jid, phone) VALUES (?, ?)");
        stmt.bind(1, std::string(user_id));
        stmt.bind(2, utils::address_local_part(user_id));
        stmt.exec();
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to upsert user", e);
    }
}

auto SqliteStore::touch_user_activity(std::string_view user_id) -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_,
            "UPDATE users SET last_seen = ?, message_count = message_count + 1 WHERE jid = ?");
        stmt.bind(1, to_epoch_ms(Clock::now()));
        stmt.bind(2, std::string(user_id));

        if (stmt.exec() == 0) {
            co_return make_fail(make_error(ErrorCode::NotFound, "User not found",
                                           std::string(user_id)));
        }
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to update user activity", e);
    }
}

auto SqliteStore::get_active_triggers()
    -> awaitable<Result<std::vector<triggers::TriggerRule>>> {
    try {
        SQLite::Statement stmt(*db_,
            "SELECT keyword, response, match_type, case_sensitive FROM triggers "
            "WHERE is_active = 1 ORDER BY id ASC");

        std::vector<triggers::TriggerRule> rules;
        while (stmt.executeStep()) {
            auto match_type = stmt.getColumn(2).getString();
            auto kind = triggers::match_kind_from_string(match_type);
            if (!kind) {
                LOG_WARN("Trigger '{}' has unknown match type '{}', using exact",
                         stmt.getColumn(0).getString(), match_type);
            }
            rules.push_back(triggers::TriggerRule{
                .keyword = stmt.getColumn(0).getString(),
                .response = stmt.getColumn(1).getString(),
                .match_kind = kind.value_or(triggers::MatchKind::Exact),
                .case_sensitive = stmt.getColumn(3).getInt() != 0,
                .active = true,
            });
        }
        co_return rules;
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to load triggers", e);
    }
}

auto SqliteStore::add_trigger(const triggers::TriggerRule& rule) -> awaitable<Result<void>> {
    try {
        SQLite::Statement exists(*db_, "SELECT 1 FROM triggers WHERE keyword = ?");
        exists.bind(1, rule.keyword);
        if (exists.executeStep()) {
            co_return make_fail(make_error(ErrorCode::DuplicateKeyword,
                "Trigger keyword already exists", rule.keyword));
        }

        SQLite::Statement stmt(*db_,
            "INSERT INTO triggers (keyword, response, is_active, match_type, case_sensitive) "
            "VALUES (?, ?, ?, ?, ?)");
        stmt.bind(1, rule.keyword);
        stmt.bind(2, rule.response);
        stmt.bind(3, rule.active ? 1 : 0);
        stmt.bind(4, std::string(triggers::match_kind_to_string(rule.match_kind)));
        stmt.bind(5, rule.case_sensitive ? 1 : 0);
        stmt.exec();

        LOG_DEBUG("Stored trigger '{}'", rule.keyword);
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to add trigger", e);
    }
}

auto SqliteStore::remove_trigger(std::string_view keyword) -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_, "DELETE FROM triggers WHERE keyword = ?");
        stmt.bind(1, std::string(keyword));

        if (stmt.exec() == 0) {
            co_return make_fail(make_error(ErrorCode::NotFound,
                "No trigger with this keyword", std::string(keyword)));
        }
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to remove trigger", e);
    }
}

auto SqliteStore::append_log(std::string_view level, std::string_view message,
                             const json& context) -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_,
            "INSERT INTO bot_logs (level, message, context, timestamp) VALUES (?, ?, ?, ?)");
        stmt.bind(1, std::string(level));
        stmt.bind(2, std::string(message));
        if (context.is_null()) {
            stmt.bind(3);
        } else {
            stmt.bind(3, context.dump());
        }
        stmt.bind(4, to_epoch_ms(Clock::now()));
        stmt.exec();
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to append log", e);
    }
}

auto SqliteStore::save_collected_data_point(const CollectedDataPoint& point)
    -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_,
            "INSERT INTO collected_data (type, value, source_jid, message_id, context) "
            "VALUES (?, ?, ?, ?, ?)");
        stmt.bind(1, point.kind);
        stmt.bind(2, point.value);
        stmt.bind(3, point.source_id);
        bind_optional(stmt, 4, point.message_id);
        if (point.context.is_null()) {
            stmt.bind(5);
        } else {
            stmt.bind(5, point.context.dump());
        }
        stmt.exec();
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to save collected data", e);
    }
}

auto SqliteStore::save_spam_event(const SpamEvent& event) -> awaitable<Result<void>> {
    try {
        SQLite::Statement stmt(*db_,
            "INSERT INTO spam_logs (user_jid, message_id, reason, severity, action_taken, timestamp) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        stmt.bind(1, event.sender_id);
        stmt.bind(2, event.message_id);
        stmt.bind(3, event.reason);
        stmt.bind(4, event.severity);
        stmt.bind(5, event.action);
        stmt.bind(6, to_epoch_ms(event.at));
        stmt.exec();
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to save spam event", e);
    }
}

auto SqliteStore::count(const char* sql) -> int64_t {
    SQLite::Statement stmt(*db_, sql);
    if (!stmt.executeStep()) return 0;
    return stmt.getColumn(0).getInt64();
}

auto SqliteStore::totals() -> awaitable<Result<Totals>> {
    try {
        co_return Totals{
            .messages = count("SELECT COUNT(*) FROM messages"),
            .users = count("SELECT COUNT(*) FROM users"),
            .groups = count("SELECT COUNT(DISTINCT jid) FROM messages WHERE is_group = 1"),
            .active_triggers = count("SELECT COUNT(*) FROM triggers WHERE is_active = 1"),
            .spam_events = count("SELECT COUNT(*) FROM spam_logs"),
            .collected_data = count("SELECT COUNT(*) FROM collected_data"),
        };
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to compute totals", e);
    }
}

auto SqliteStore::recent_messages(std::string_view conversation_id, int limit)
    -> awaitable<Result<std::vector<messages::NormalizedMessage>>> {
    try {
        SQLite::Statement stmt(*db_,
            "SELECT message_id, jid, sender_jid, message_type, content, media_url, media_type, "
            "timestamp, is_group, reply_to, is_forwarded FROM messages WHERE jid = ? "
            "ORDER BY timestamp DESC, id DESC LIMIT ?");
        stmt.bind(1, std::string(conversation_id));
        stmt.bind(2, limit);

        std::vector<messages::NormalizedMessage> results;
        while (stmt.executeStep()) {
            messages::NormalizedMessage msg;
            msg.id = stmt.getColumn(0).getString();
            msg.conversation_id = stmt.getColumn(1).getString();
            msg.sender_id = stmt.getColumn(2).getString();
            msg.content_kind = json(stmt.getColumn(3).getString()).get<messages::ContentKind>();
            msg.text = stmt.getColumn(4).getString();
            if (!stmt.getColumn(5).isNull()) {
                msg.media = messages::MediaRef{
                    .url = stmt.getColumn(5).getString(),
                    .mime_type = stmt.getColumn(6).getString(),
                };
            }
            msg.timestamp = from_epoch_ms(stmt.getColumn(7).getInt64());
            msg.is_group = stmt.getColumn(8).getInt() != 0;
            if (!stmt.getColumn(9).isNull()) {
                msg.reply_to_id = stmt.getColumn(9).getString();
            }
            msg.is_forwarded = stmt.getColumn(10).getInt() != 0;
            results.push_back(std::move(msg));
        }
        co_return results;
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to list messages", e);
    }
}

auto SqliteStore::spam_events(std::string_view sender_id, int limit)
    -> awaitable<Result<std::vector<SpamEvent>>> {
    try {
        SQLite::Statement stmt(*db_,
            "SELECT user_jid, message_id, reason, severity, action_taken, timestamp "
            "FROM spam_logs WHERE user_jid = ? ORDER BY timestamp DESC, id DESC LIMIT ?");
        stmt.bind(1, std::string(sender_id));
        stmt.bind(2, limit);

        std::vector<SpamEvent> results;
        while (stmt.executeStep()) {
            results.push_back(SpamEvent{
                .sender_id = stmt.getColumn(0).getString(),
                .message_id = stmt.getColumn(1).getString(),
                .reason = stmt.getColumn(2).getString(),
                .severity = stmt.getColumn(3).getString(),
                .action = stmt.getColumn(4).getString(),
                .at = from_epoch_ms(stmt.getColumn(5).getInt64()),
            });
        }
        co_return results;
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to list spam events", e);
    }
}

auto SqliteStore::logs(std::optional<std::string> level, int limit)
    -> awaitable<Result<std::vector<LogEntry>>> {
    try {
        std::string sql = "SELECT level, message, context, timestamp FROM bot_logs";
        if (level) {
            sql += " WHERE level = ?";
        }
        sql += " ORDER BY timestamp DESC, id DESC LIMIT ?";

        SQLite::Statement stmt(*db_, sql);
        int index = 1;
        if (level) {
            stmt.bind(index++, *level);
        }
        stmt.bind(index, limit);

        std::vector<LogEntry> results;
        while (stmt.executeStep()) {
            results.push_back(LogEntry{
                .level = stmt.getColumn(0).getString(),
                .message = stmt.getColumn(1).getString(),
                .context = parse_context(stmt.getColumn(2)),
                .at = from_epoch_ms(stmt.getColumn(3).getInt64()),
            });
        }
        co_return results;
    } catch (const SQLite::Exception& e) {
        co_return db_fail("Failed to list logs", e);
    }
}

} // namespace chatwarden::store
