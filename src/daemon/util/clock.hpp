#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <string>

// Wall-clock milliseconds since the epoch. Persisted timestamps use this unit.
using ClockFn = std::function<int64_t()>;

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ISO 8601 UTC, e.g. 2026-10-19T08:15:02.120Z. Zero renders as empty.
inline std::string format_iso8601(int64_t ms) {
    if (ms <= 0) return {};
    auto tp = std::chrono::sys_time<std::chrono::milliseconds>(std::chrono::milliseconds(ms));
    return std::format("{:%FT%T}Z", tp);
}
