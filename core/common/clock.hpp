#pragma once

#include <chrono>
#include <cstdint>

namespace kgraph {

/// Wall-clock milliseconds since the Unix epoch (UTC).
inline int64_t nowMillis() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

} // namespace kgraph
