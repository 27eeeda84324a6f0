#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include <nlohmann/json.hpp>

namespace chatwarden {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

/// Time source injected into the stateful components so that window and
/// expiry behavior can be driven deterministically.
using NowFn = std::function<Timestamp()>;

inline auto system_now() -> Timestamp { return Clock::now(); }

/// Milliseconds since the Unix epoch.
inline auto to_epoch_ms(Timestamp ts) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

inline auto from_epoch_ms(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::milliseconds{ms}};
}

} // namespace chatwarden
