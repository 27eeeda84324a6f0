#include "chatwarden/core/logger.hpp"

#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chatwarden {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;

    constexpr std::size_t kLogFileMaxBytes = 5 * 1024 * 1024;
    constexpr std::size_t kLogFileMaxFiles = 3;
}

void Logger::init(std::string_view name, std::string_view level, std::string_view file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                std::string(file), kLogFileMaxBytes, kLogFileMaxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works; report through it below.
            g_logger = std::make_shared<spdlog::logger>(std::string(name), sinks.begin(), sinks.end());
            g_logger->warn("Cannot open log file '{}': {}", file, e.what());
        }
    }

    g_logger = std::make_shared<spdlog::logger>(std::string(name), sinks.begin(), sinks.end());
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    auto& logger = get();
    if (level == "trace") logger->set_level(spdlog::level::trace);
    else if (level == "debug") logger->set_level(spdlog::level::debug);
    else if (level == "info") logger->set_level(spdlog::level::info);
    else if (level == "warn") logger->set_level(spdlog::level::warn);
    else if (level == "error") logger->set_level(spdlog::level::err);
    else if (level == "critical") logger->set_level(spdlog::level::critical);
    else logger->set_level(spdlog::level::info);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace chatwarden
