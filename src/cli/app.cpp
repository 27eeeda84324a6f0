#include "chatwarden/cli/app.hpp"
#include "chatwarden/core/logger.hpp"

// Version string; typically injected by CMake via -DCHATWARDEN_VERSION_STRING=...
#ifndef CHATWARDEN_VERSION_STRING
#define CHATWARDEN_VERSION_STRING "1.0.0-dev"
#endif

namespace chatwarden::cli {

App::App()
    : cli_("chatwarden", "Chat moderation and auto-reply pipeline")
{
    cli_.set_version_flag("--version", CHATWARDEN_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("CHATWARDEN_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override. Empty keeps the configured level.
    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        Logger::flush();
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() -> GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_run_command(cli_, options_);
    register_status_command(cli_, options_);
    register_stats_command(cli_, options_);
    register_trigger_commands(cli_, options_);
    register_send_command(cli_, options_);
    register_logs_command(cli_, options_);
    register_config_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace chatwarden::cli
