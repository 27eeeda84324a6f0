#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chatwarden/core/types.hpp"

namespace chatwarden::utils {

auto timestamp_iso() -> std::string;
auto format_iso(Timestamp ts) -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;

/// Returns the local part of an address such as "15551234567@s.whatsapp.net".
auto address_local_part(std::string_view address) -> std::string;

} // namespace chatwarden::utils
