#pragma once

#include "pipeline/job.hpp"
#include "pipeline/retry.hpp"
#include "provider/provider.hpp"
#include "storage/chunk_store.hpp"

#include <chrono>
#include <functional>
#include <string>

// Persists the job; false means the lease was lost and work must stop.
using PersistFn = std::function<bool(TranscriptionJob&)>;

// Drives a job's pending segments through the provider one at a time, in
// index order. Segments already done are never resubmitted.
class TranscriptionOrchestrator {
public:
    enum class Status { Done, Failed, StorageFailed, Interrupted, LeaseLost };

    struct Result {
        Status status = Status::Done;
        Interrupt interrupt = Interrupt::None;
        int failed_segment = -1;
        std::string error;
    };

    TranscriptionOrchestrator(TranscriptionProvider& provider, ChunkStore& store,
                              RetryPolicy policy, std::chrono::milliseconds inter_segment_delay,
                              SleepFn sleep, bool verbose = false,
                              RetryExecutor::RandomFn random = {});

    Result run(TranscriptionJob& job, const PersistFn& persist, const InterruptCheck& interrupted);

private:
    void log(const std::string& msg);

    TranscriptionProvider& provider_;
    ChunkStore& store_;
    RetryExecutor executor_;
    std::chrono::milliseconds inter_segment_delay_;
    SleepFn sleep_;
    bool verbose_;
};
