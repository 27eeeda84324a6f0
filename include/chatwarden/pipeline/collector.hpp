#pragma once

#include <vector>

#include "chatwarden/core/config.hpp"
#include "chatwarden/messages/message.hpp"
#include "chatwarden/store/store.hpp"

namespace chatwarden::pipeline {

/// Extracts phone numbers, URLs and media references from a message,
/// limited to the kinds enabled in `config`. Results keep text order:
/// phones first, then URLs, then the media reference.
[[nodiscard]] auto extract_data_points(const messages::NormalizedMessage& msg,
                                       const DataCollectionConfig& config)
    -> std::vector<store::CollectedDataPoint>;

[[nodiscard]] inline auto collection_enabled(const DataCollectionConfig& config) -> bool {
    return config.collect_phone_numbers || config.collect_urls || config.collect_media;
}

} // namespace chatwarden::pipeline
