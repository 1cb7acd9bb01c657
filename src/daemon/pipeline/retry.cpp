#include "pipeline/retry.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

RetryPolicy RetryPolicy::from_config(const Config::Retry& cfg) {
    return RetryPolicy{
        .max_attempts = std::max<uint32_t>(cfg.max_attempts, 1),
        .base_delay = std::chrono::milliseconds(cfg.base_delay_ms),
        .max_delay = std::chrono::milliseconds(cfg.max_delay_ms),
        .jitter = cfg.jitter,
    };
}

std::chrono::milliseconds RetryPolicy::delay_for_retry(uint32_t retry, double unit) const {
    double j = std::clamp(jitter, 0.0, 1.0 / 3.0);
    double factor = 1.0 - j + 2.0 * j * std::clamp(unit, 0.0, 1.0);
    int exponent = static_cast<int>(std::min<uint32_t>(retry > 0 ? retry - 1 : 0, 30));
    double ms = static_cast<double>(base_delay.count()) * std::ldexp(1.0, exponent) * factor;
    ms = std::min(ms, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(std::llround(ms));
}

RetryExecutor::RetryExecutor(RetryPolicy policy, SleepFn sleep, RandomFn random)
    : policy_(policy), sleep_(std::move(sleep)), random_(std::move(random)) {
    if (!random_) {
        auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());
        auto mutex = std::make_shared<std::mutex>();
        random_ = [engine, mutex] {
            std::lock_guard lock(*mutex);
            return std::uniform_real_distribution<double>(0.0, 1.0)(*engine);
        };
    }
}

std::chrono::milliseconds RetryExecutor::next_wait(const ProviderError& err, uint32_t attempt) {
    if (err.retry_after) return std::min(*err.retry_after, policy_.max_delay);
    return policy_.delay_for_retry(attempt, random_());
}
