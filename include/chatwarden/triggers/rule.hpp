#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatwarden/core/error.hpp"

namespace chatwarden::triggers {

using json = nlohmann::json;

/// How a rule keyword is compared against message text.
enum class MatchKind {
    Exact,
    Contains,
    Regex,
};

NLOHMANN_JSON_SERIALIZE_ENUM(MatchKind, {
    {MatchKind::Exact, "exact"},
    {MatchKind::Contains, "contains"},
    {MatchKind::Regex, "regex"},
})

auto match_kind_to_string(MatchKind kind) -> std::string_view;

/// Parses "exact", "contains" or "regex"; anything else is InvalidArgument.
auto match_kind_from_string(std::string_view s) -> Result<MatchKind>;

/// A keyword -> auto-response mapping. The keyword is unique per engine.
struct TriggerRule {
    std::string keyword;
    std::string response;
    MatchKind match_kind = MatchKind::Exact;
    bool case_sensitive = false;
    bool active = true;

    auto operator==(const TriggerRule&) const -> bool = default;
};

void to_json(json& j, const TriggerRule& r);
void from_json(const json& j, TriggerRule& r);

} // namespace chatwarden::triggers
