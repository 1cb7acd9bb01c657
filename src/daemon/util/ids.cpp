#include "util/ids.hpp"

#include <cstdint>
#include <format>
#include <mutex>
#include <random>

namespace ids {

std::string generate() {
    static std::mutex mu;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard lock(mu);
        hi = rng();
        lo = rng();
    }

    hi = (hi & 0xffffffffffff0fffull) | 0x0000000000004000ull; // version 4
    lo = (lo & 0x3fffffffffffffffull) | 0x8000000000000000ull; // variant 10

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffull);
}

} // namespace ids
