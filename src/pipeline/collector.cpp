#include "chatwarden/pipeline/collector.hpp"

#include <regex>

namespace chatwarden::pipeline {

namespace {

const std::regex& phone_pattern() {
    static const std::regex pattern(
        R"((\+?\d{1,3}[-.\s]?)?\(?(\d{3})\)?[-.\s]?(\d{3})[-.\s]?(\d{4}))");
    return pattern;
}

const std::regex& url_pattern() {
    static const std::regex pattern(R"(https?://[^\s]+)");
    return pattern;
}

void collect_matches(const messages::NormalizedMessage& msg, const std::regex& pattern,
                     const char* kind, std::vector<store::CollectedDataPoint>& out) {
    for (std::sregex_iterator it(msg.text.begin(), msg.text.end(), pattern), end;
         it != end; ++it) {
        out.push_back(store::CollectedDataPoint{
            .kind = kind,
            .value = it->str(),
            .source_id = msg.sender_id,
            .message_id = msg.id,
            .context = nullptr,
        });
    }
}

} // anonymous namespace

auto extract_data_points(const messages::NormalizedMessage& msg,
                         const DataCollectionConfig& config)
    -> std::vector<store::CollectedDataPoint> {
    std::vector<store::CollectedDataPoint> points;

    if (config.collect_phone_numbers && !msg.text.empty()) {
        collect_matches(msg, phone_pattern(), "phone", points);
    }
    if (config.collect_urls && !msg.text.empty()) {
        collect_matches(msg, url_pattern(), "url", points);
    }
    if (config.collect_media && msg.media && !msg.media->url.empty()) {
        points.push_back(store::CollectedDataPoint{
            .kind = "media",
            .value = msg.media->url,
            .source_id = msg.sender_id,
            .message_id = msg.id,
            .context = json{
                {"type", msg.media->mime_type},
                {"message_type", std::string(messages::content_kind_to_string(msg.content_kind))},
            },
        });
    }
    return points;
}

} // namespace chatwarden::pipeline
