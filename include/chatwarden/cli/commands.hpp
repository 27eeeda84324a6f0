#pragma once

#include <functional>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <CLI/CLI.hpp>

#include "chatwarden/core/config.hpp"

namespace chatwarden::service {
class BotService;
}

namespace chatwarden::cli {

/// Options shared by every subcommand.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
};

/// Loads the configuration file (when given), overlays CHATWARDEN_*
/// environment variables and --log-level, then initializes logging.
/// Throws CLI::RuntimeError when the result does not validate.
auto prepare_config(const GlobalOptions& options) -> Config;

/// Recursively replaces sensitive string values with a redaction marker.
void redact_config_json(json& j);

/// Opens the store, builds a BotService around a JSON-lines channel,
/// loads the triggers and runs `body` to completion on a private
/// io_context. Returns the body's exit code.
auto with_service(const Config& config,
                  std::function<boost::asio::awaitable<int>(service::BotService&)> body) -> int;

/// Register the `run` subcommand.
/// Starts the pipeline and processes events until the input ends or a
/// termination signal arrives.
void register_run_command(CLI::App& app, GlobalOptions& options);

/// Register the `status` subcommand.
void register_status_command(CLI::App& app, GlobalOptions& options);

/// Register the `stats` subcommand.
void register_stats_command(CLI::App& app, GlobalOptions& options);

/// Register the `add-trigger` and `remove-trigger` subcommands.
void register_trigger_commands(CLI::App& app, GlobalOptions& options);

/// Register the `send` subcommand.
void register_send_command(CLI::App& app, GlobalOptions& options);

/// Register the `logs` subcommand.
/// Prints recent audit entries, spam events or stored messages.
void register_logs_command(CLI::App& app, GlobalOptions& options);

/// Register the `config` subcommand.
/// Shows or validates the current configuration.
void register_config_command(CLI::App& app, GlobalOptions& options);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace chatwarden::cli
