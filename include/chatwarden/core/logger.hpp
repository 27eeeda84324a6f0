#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chatwarden {

class Logger {
public:
    /// Creates the process logger. When `file` is non-empty a rotating
    /// file sink is attached next to the console sink.
    static void init(std::string_view name = "chatwarden",
                     std::string_view level = "info",
                     std::string_view file = {});
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace chatwarden

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::chatwarden::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::chatwarden::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::chatwarden::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::chatwarden::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::chatwarden::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::chatwarden::Logger::get(), __VA_ARGS__)
