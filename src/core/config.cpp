#include "chatwarden/core/config.hpp"
#include "chatwarden/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace chatwarden {

namespace {

/// Expands `${VAR}` references in every string value of the document.
void resolve_env_refs_in(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) {
            resolve_env_refs_in(child);
        }
    }
}

auto env_flag(const char* value) -> bool {
    std::string_view v(value);
    return v == "true" || v == "1" || v == "yes";
}

void apply_int_env(const char* name, int& target) {
    auto* val = std::getenv(name);
    if (!val) return;
    try {
        target = std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN("Config: ignoring non-numeric {}='{}'", name, val);
    }
}

auto check_limits(std::string_view category, const CategoryLimits& limits) -> VoidResult {
    if (limits.per_minute <= 0 || limits.per_hour <= 0 || limits.per_day <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Rate limits must be positive", std::string(category)));
    }
    return {};
}

auto check_threshold(std::string_view category, double threshold) -> VoidResult {
    if (threshold <= 0.0 || threshold > 1.0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Warning threshold must be in (0, 1]", std::string(category)));
    }
    return {};
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in(j);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env(Config config) -> Config {
    if (auto* val = std::getenv("CHATWARDEN_DB_PATH")) {
        config.database.path = val;
    }
    if (auto* val = std::getenv("CHATWARDEN_LOG_LEVEL")) {
        config.logging.level = val;
    }
    if (auto* val = std::getenv("CHATWARDEN_LOG_FILE")) {
        config.logging.file = val;
    }
    apply_int_env("CHATWARDEN_SPAM_THRESHOLD", config.moderation.spam_threshold);

    // Window is given in milliseconds, matching the legacy deployment env.
    int window_ms = config.moderation.spam_window_seconds * 1000;
    apply_int_env("CHATWARDEN_SPAM_TIME_WINDOW", window_ms);
    config.moderation.spam_window_seconds = window_ms / 1000;

    if (auto* val = std::getenv("CHATWARDEN_COLLECT_PHONE_NUMBERS")) {
        config.data_collection.collect_phone_numbers = env_flag(val);
    }
    if (auto* val = std::getenv("CHATWARDEN_COLLECT_URLS")) {
        config.data_collection.collect_urls = env_flag(val);
    }
    if (auto* val = std::getenv("CHATWARDEN_COLLECT_MEDIA")) {
        config.data_collection.collect_media = env_flag(val);
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    const auto& rl = config.rate_limit;
    if (auto r = check_limits("messages", rl.messages); !r) return r;
    if (auto r = check_limits("media", rl.media); !r) return r;
    if (auto r = check_limits("commands", rl.commands); !r) return r;
    if (auto r = check_threshold("messages", rl.warning_thresholds.messages); !r) return r;
    if (auto r = check_threshold("media", rl.warning_thresholds.media); !r) return r;
    if (auto r = check_threshold("commands", rl.warning_thresholds.commands); !r) return r;

    if (rl.sweep_interval_seconds <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "sweep_interval_seconds must be positive"));
    }
    if (config.moderation.spam_threshold <= 0 || config.moderation.spam_window_seconds <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Spam threshold and window must be positive"));
    }
    if (config.pipeline.queue_capacity == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "queue_capacity must be positive"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace chatwarden
