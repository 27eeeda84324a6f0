#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatwarden/core/error.hpp"
#include "chatwarden/core/types.hpp"

// std::optional serializer for nlohmann/json, used by the NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace chatwarden {

struct BotConfig {
    std::string name = "chatwarden";
    std::string version = "1.0.0";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BotConfig, name, version)

struct DatabaseConfig {
    std::string path = "./data/chatwarden.db";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DatabaseConfig, path)

struct LoggingConfig {
    std::string level = "info";
    std::optional<std::string> file;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LoggingConfig, level, file)

/// Sliding-window limits for one activity category.
struct CategoryLimits {
    int per_minute = 0;
    int per_hour = 0;
    int per_day = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CategoryLimits, per_minute, per_hour, per_day)

/// Fraction of the per-minute limit at which a sender is warned.
struct WarningThresholds {
    double messages = 0.8;
    double media = 0.7;
    double commands = 0.9;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(WarningThresholds, messages, media, commands)

/// Block duration per violation severity, in seconds.
struct BlockDurations {
    int warning = 0;
    int soft = 5 * 60;
    int hard = 30 * 60;
    int severe = 2 * 60 * 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BlockDurations, warning, soft, hard, severe)

struct RateLimitConfig {
    CategoryLimits messages{20, 100, 500};
    CategoryLimits media{5, 30, 100};
    CategoryLimits commands{10, 50, 200};
    WarningThresholds warning_thresholds;
    BlockDurations block_durations;
    int warning_cooldown_seconds = 5 * 60;
    int sweep_interval_seconds = 10 * 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RateLimitConfig, messages, media, commands,
    warning_thresholds, block_durations, warning_cooldown_seconds, sweep_interval_seconds)

struct ModerationConfig {
    int spam_threshold = 5;
    int spam_window_seconds = 5 * 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ModerationConfig, spam_threshold, spam_window_seconds)

struct DataCollectionConfig {
    bool collect_phone_numbers = false;
    bool collect_urls = false;
    bool collect_media = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DataCollectionConfig,
    collect_phone_numbers, collect_urls, collect_media)

struct PipelineConfig {
    size_t queue_capacity = 256;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PipelineConfig, queue_capacity)

/// JSON-lines transport. Empty input/output mean stdin/stdout.
struct TransportConfig {
    std::string name = "jsonl";
    std::string input;
    std::string output;
    bool close_on_eof = true;   // end the run when the input is exhausted
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TransportConfig, name, input, output, close_on_eof)

struct Config {
    BotConfig bot;
    DatabaseConfig database;
    LoggingConfig logging;
    RateLimitConfig rate_limit;
    ModerationConfig moderation;
    DataCollectionConfig data_collection;
    PipelineConfig pipeline;
    TransportConfig transport;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, bot, database, logging, rate_limit,
    moderation, data_collection, pipeline, transport)

auto load_config(const std::filesystem::path& path) -> Config;

/// Overlays CHATWARDEN_* environment variables onto `base`.
auto load_config_from_env(Config base = {}) -> Config;

auto default_config() -> Config;

/// Rejects limits that are not positive and warning thresholds outside (0, 1].
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace chatwarden
