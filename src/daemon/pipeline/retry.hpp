#pragma once

#include "config.hpp"
#include "provider/provider.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <random>
#include <type_traits>
#include <vector>

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Exponential backoff with symmetric jitter.
struct RetryPolicy {
    uint32_t max_attempts = 5; // including the first call
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{60000};
    double jitter = 0.2;

    static RetryPolicy from_config(const Config::Retry& cfg);

    // Wait before retry `retry` (1-based): base * 2^(retry-1) scaled by a factor
    // in [1 - jitter, 1 + jitter] picked by `unit` in [0, 1], then capped.
    // Jitter is clamped to 1/3 so consecutive waits never shrink.
    std::chrono::milliseconds delay_for_retry(uint32_t retry, double unit) const;
};

struct RetryOutcome {
    uint32_t attempts = 0;
    std::vector<std::chrono::milliseconds> waits;
    int rate_limited = 0;
    int transient = 0;
    bool interrupted = false; // stopped before the budget ran out
    bool exhausted = false;   // every attempt failed with a retryable error
};

template <typename T>
struct RetryRun {
    std::expected<T, ProviderError> result;
    RetryOutcome outcome;
};

class RetryExecutor {
public:
    using RandomFn = std::function<double()>;
    using RetryObserver =
        std::function<void(const ProviderError&, uint32_t attempt, std::chrono::milliseconds wait)>;

    RetryExecutor(RetryPolicy policy, SleepFn sleep, RandomFn random = {});

    void on_retry(RetryObserver observer) { observer_ = std::move(observer); }
    const RetryPolicy& policy() const { return policy_; }

    // Calls op until it succeeds, fails fatally, or the attempt budget is spent.
    // `stop` is consulted before every wait.
    template <typename F>
    auto run(F&& op, const std::function<bool()>& stop = {})
        -> RetryRun<typename std::invoke_result_t<F&>::value_type> {
        using T = typename std::invoke_result_t<F&>::value_type;
        RetryOutcome outcome;

        for (uint32_t attempt = 1;; ++attempt) {
            outcome.attempts = attempt;
            std::expected<T, ProviderError> r = op();
            if (r || r.error().kind == ProviderErrc::Fatal)
                return RetryRun<T>{std::move(r), std::move(outcome)};

            const auto& err = r.error();
            if (err.kind == ProviderErrc::RateLimited) ++outcome.rate_limited;
            else ++outcome.transient;

            if (attempt >= policy_.max_attempts) {
                outcome.exhausted = true;
                return RetryRun<T>{std::move(r), std::move(outcome)};
            }
            if (stop && stop()) {
                outcome.interrupted = true;
                return RetryRun<T>{std::move(r), std::move(outcome)};
            }

            auto wait = next_wait(err, attempt);
            outcome.waits.push_back(wait);
            if (observer_) observer_(err, attempt, wait);
            sleep_(wait);
        }
    }

private:
    std::chrono::milliseconds next_wait(const ProviderError& err, uint32_t attempt);

    RetryPolicy policy_;
    SleepFn sleep_;
    RandomFn random_;
    RetryObserver observer_;
};
