#include "chatwarden/cli/commands.hpp"
#include "chatwarden/core/logger.hpp"

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>

#include "chatwarden/channels/jsonl.hpp"
#include "chatwarden/service/bot_service.hpp"
#include "chatwarden/store/store.hpp"

#ifndef CHATWARDEN_VERSION_STRING
#define CHATWARDEN_VERSION_STRING "1.0.0-dev"
#endif

namespace chatwarden::cli {

using boost::asio::awaitable;

namespace {

void ensure_parent_directory(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        LOG_WARN("Cannot create directory {}: {}", parent.string(), ec.message());
    }
}

void print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
}

} // anonymous namespace

auto prepare_config(const GlobalOptions& options) -> Config {
    Config config = options.config_path.empty()
        ? default_config()
        : load_config(std::filesystem::path(options.config_path));
    config = load_config_from_env(std::move(config));

    if (!options.log_level.empty()) {
        config.logging.level = options.log_level;
    }
    if (config.logging.file) {
        ensure_parent_directory(*config.logging.file);
    }
    Logger::init("chatwarden", config.logging.level, config.logging.file.value_or(std::string{}));

    if (auto valid = validate_config(config); !valid) {
        LOG_ERROR("Invalid configuration: {}", valid.error().what());
        throw CLI::RuntimeError(1);
    }
    return config;
}

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret", "password",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

auto with_service(const Config& config,
                  std::function<awaitable<int>(service::BotService&)> body) -> int {
    ensure_parent_directory(config.database.path);

    std::unique_ptr<store::Store> store;
    try {
        store = std::make_unique<store::SqliteStore>(config.database.path);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Cannot open database {}: {}", config.database.path, e.what());
        return 1;
    }

    boost::asio::io_context ioc;
    channels::JsonlChannel channel(config.transport);
    service::BotService service(config, std::move(store), channel, ioc);

    int exit_code = 1;
    boost::asio::co_spawn(ioc,
        [&service, &body]() -> awaitable<int> {
            auto loaded = co_await service.initialize();
            if (!loaded) {
                co_return 1;
            }
            co_return co_await body(service);
        },
        [&exit_code](std::exception_ptr ep, int rc) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("Command failed: {}", e.what());
                }
                return;
            }
            exit_code = rc;
        });

    ioc.run();
    return exit_code;
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("run", "Process chat events from the transport");

    struct RunOptions {
        std::string input;
        std::string output;
        bool keep_open = false;
    };
    auto opts = std::make_shared<RunOptions>();

    sub->add_option("-i,--input", opts->input,
                    "Read JSON-lines events from this file instead of the configured input");
    sub->add_option("-o,--output", opts->output,
                    "Append outgoing messages to this file instead of the configured output");
    sub->add_flag("--keep-open", opts->keep_open,
                  "Keep running after the input is exhausted");

    sub->callback([&options, opts]() {
        auto config = prepare_config(options);
        if (!opts->input.empty()) config.transport.input = opts->input;
        if (!opts->output.empty()) config.transport.output = opts->output;
        if (opts->keep_open) config.transport.close_on_eof = false;

        LOG_INFO("{} v{} starting (database: {})", config.bot.name, config.bot.version,
                 config.database.path);

        int rc = with_service(config, [](service::BotService& svc) -> awaitable<int> {
            auto executor = co_await boost::asio::this_coro::executor;

            // Graceful shutdown on SIGINT / SIGTERM.
            boost::asio::signal_set signals(executor, SIGINT, SIGTERM);
            signals.async_wait([&svc](const boost::system::error_code& ec, int signo) {
                if (ec) return;
                LOG_INFO("Received signal {}, shutting down...", signo);
                svc.stop();
            });

            co_await svc.run();
            signals.cancel();
            co_return 0;
        });

        if (rc != 0) {
            throw CLI::RuntimeError(rc);
        }
    });
}

// ---------------------------------------------------------------------------
// status / stats commands
// ---------------------------------------------------------------------------

void register_status_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("status", "Show configuration-derived bot status");

    sub->callback([&options]() {
        auto config = prepare_config(options);
        int rc = with_service(config, [](service::BotService& svc) -> awaitable<int> {
            print_json(svc.get_status());
            co_return 0;
        });
        if (rc != 0) throw CLI::RuntimeError(rc);
    });
}

void register_stats_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("stats", "Show stored totals and rate-limiter statistics");

    sub->callback([&options]() {
        auto config = prepare_config(options);
        int rc = with_service(config, [](service::BotService& svc) -> awaitable<int> {
            auto stats = co_await svc.get_stats();
            if (!stats) {
                std::cerr << "Failed to read statistics: " << stats.error().what() << "\n";
                co_return 1;
            }
            print_json(*stats);
            co_return 0;
        });
        if (rc != 0) throw CLI::RuntimeError(rc);
    });
}

// ---------------------------------------------------------------------------
// trigger commands
// ---------------------------------------------------------------------------

void register_trigger_commands(CLI::App& app, GlobalOptions& options) {
    struct TriggerOptions {
        std::string keyword;
        std::string response;
        std::string match_type = "exact";
        bool case_sensitive = false;
    };
    auto opts = std::make_shared<TriggerOptions>();

    auto* add = app.add_subcommand("add-trigger", "Add an auto-reply trigger");
    add->add_option("keyword", opts->keyword, "Keyword or pattern to match")->required();
    add->add_option("response", opts->response, "Reply text")->required();
    add->add_option("-m,--match-type", opts->match_type, "exact, contains or regex")
        ->check(CLI::IsMember({"exact", "contains", "regex"}))
        ->default_val("exact");
    add->add_flag("--case-sensitive", opts->case_sensitive, "Match case exactly");

    add->callback([&options, opts]() {
        auto config = prepare_config(options);
        auto kind = triggers::match_kind_from_string(opts->match_type);
        if (!kind) {
            std::cerr << kind.error().what() << "\n";
            throw CLI::RuntimeError(2);
        }

        int rc = with_service(config, [opts, match_kind = *kind](service::BotService& svc)
                -> awaitable<int> {
            auto added = co_await svc.add_trigger_rule(opts->keyword, opts->response, match_kind,
                                                       opts->case_sensitive);
            if (!added) {
                std::cerr << "Failed to add trigger: " << added.error().what() << "\n";
                co_return 1;
            }
            std::cout << "Trigger '" << opts->keyword << "' added.\n";
            co_return 0;
        });
        if (rc != 0) throw CLI::RuntimeError(rc);
    });

    auto* remove = app.add_subcommand("remove-trigger", "Remove an auto-reply trigger");
    remove->add_option("keyword", opts->keyword, "Keyword of the trigger")->required();

    remove->callback([&options, opts]() {
        auto config = prepare_config(options);
        int rc = with_service(config, [opts](service::BotService& svc) -> awaitable<int> {
            auto removed = co_await svc.remove_trigger_rule(opts->keyword);
            if (!removed) {
                std::cerr << "Failed to remove trigger: " << removed.error().what() << "\n";
                co_return 1;
            }
            std::cout << "Trigger '" << opts->keyword << "' removed.\n";
            co_return 0;
        });
        if (rc != 0) throw CLI::RuntimeError(rc);
    });
}

// ---------------------------------------------------------------------------
// send command
// ---------------------------------------------------------------------------

void register_send_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("send", "Send a message through the transport");

    struct SendOptions {
        std::string to;
        std::string text;
    };
    auto opts = std::make_shared<SendOptions>();
    sub->add_option("to", opts->to, "Conversation identifier")->required();
    sub->add_option("text", opts->text, "Message text")->required();

    sub->callback([&options, opts]() {
        auto config = prepare_config(options);
        int rc = with_service(config, [opts](service::BotService& svc) -> awaitable<int> {
            auto sent = co_await svc.send_message(opts->to, opts->text);
            if (!sent) {
                std::cerr << "Failed to send: " << sent.error().what() << "\n";
                co_return 1;
            }
            co_return 0;
        });
        if (rc != 0) throw CLI::RuntimeError(rc);
    });
}

// ---------------------------------------------------------------------------
// logs command
// ---------------------------------------------------------------------------

void register_logs_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("logs", "Show recent audit entries");

    struct LogsOptions {
        std::string level;
        std::string spam_sender;
        std::string conversation;
        int limit = 50;
    };
    auto opts = std::make_shared<LogsOptions>();
    sub->add_option("-l,--level", opts->level, "Only entries of this level");
    sub->add_option("--spam", opts->spam_sender, "Show spam events for this sender instead");
    sub->add_option("--messages", opts->conversation,
                    "Show stored messages for this conversation instead");
    sub->add_option("-n,--limit", opts->limit, "Maximum number of rows")
        ->check(CLI::PositiveNumber)
        ->default_val(50);

    sub->callback([&options, opts]() {
        auto config = prepare_config(options);
        int rc = with_service(config, [opts](service::BotService& svc) -> awaitable<int> {
            auto& store = svc.store();
            json out;

            if (!opts->spam_sender.empty()) {
                auto events = co_await store.spam_events(opts->spam_sender, opts->limit);
                if (!events) {
                    std::cerr << events.error().what() << "\n";
                    co_return 1;
                }
                out = *events;
            } else if (!opts->conversation.empty()) {
                auto messages = co_await store.recent_messages(opts->conversation, opts->limit);
                if (!messages) {
                    std::cerr << messages.error().what() << "\n";
                    co_return 1;
                }
                out = *messages;
            } else {
                std::optional<std::string> level;
                if (!opts->level.empty()) level = opts->level;
                auto entries = co_await store.logs(level, opts->limit);
                if (!entries) {
                    std::cerr << entries.error().what() << "\n";
                    co_return 1;
                }
                out = *entries;
            }

            print_json(out);
            co_return 0;
        });
        if (rc != 0) throw CLI::RuntimeError(rc);
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&options, validate_only]() {
        // prepare_config() rejects an invalid configuration.
        auto cfg = prepare_config(options);

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = cfg;
        redact_config_json(j);
        print_json(j);
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "chatwarden " << CHATWARDEN_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
        std::cout << "SQLite: " << SQLite::getLibVersion() << "\n";
    });
}

} // namespace chatwarden::cli
