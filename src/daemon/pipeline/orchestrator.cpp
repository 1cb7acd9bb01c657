#include "pipeline/orchestrator.hpp"

#include <algorithm>
#include <format>
#include <print>

TranscriptionOrchestrator::TranscriptionOrchestrator(TranscriptionProvider& provider,
                                                     ChunkStore& store, RetryPolicy policy,
                                                     std::chrono::milliseconds inter_segment_delay,
                                                     SleepFn sleep, bool verbose,
                                                     RetryExecutor::RandomFn random)
    : provider_(provider), store_(store),
      executor_(policy, sleep, std::move(random)),
      inter_segment_delay_(inter_segment_delay), sleep_(std::move(sleep)), verbose_(verbose) {
    executor_.on_retry([this](const ProviderError& err, uint32_t attempt,
                              std::chrono::milliseconds wait) {
        log(std::format("provider {} (attempt {}): {}, retrying in {} ms",
                        to_string(err.kind), attempt, err.message, wait.count()));
    });
}

TranscriptionOrchestrator::Result
TranscriptionOrchestrator::run(TranscriptionJob& job, const PersistFn& persist,
                               const InterruptCheck& interrupted) {
    auto check = [&interrupted] { return interrupted ? interrupted() : Interrupt::None; };

    std::ranges::sort(job.segments, {}, &Segment::index);
    const std::optional<std::string> hint =
        job.language_hint ? job.language_hint : job.detected_language;

    bool submitted = false;
    for (auto& seg : job.segments) {
        if (seg.status == SegmentStatus::Done) continue;

        if (auto why = check(); why != Interrupt::None)
            return Result{.status = Status::Interrupted, .interrupt = why};

        if (submitted) sleep_(inter_segment_delay_);
        submitted = true;

        if (auto why = check(); why != Interrupt::None)
            return Result{.status = Status::Interrupted, .interrupt = why};

        auto audio = store_.read_blob(seg.storage_ref);
        if (!audio) {
            std::println(stderr, "provider: segment {} of job {}: {}", seg.index, job.id, audio.error());
            return Result{.status = Status::StorageFailed, .failed_segment = seg.index,
                          .error = std::format("segment {} audio unavailable", seg.index + 1)};
        }

        seg.status = SegmentStatus::Transcribing;
        if (!persist(job)) return Result{.status = Status::LeaseLost};

        log(std::format("job {}: transcribing segment {}/{} ({:.1f}s - {:.1f}s)", job.id,
                        seg.index + 1, job.segments.size(), seg.start_offset, seg.end_offset));

        Interrupt stopped_by = Interrupt::None;
        auto attempt = executor_.run(
            [&] { return provider_.transcribe(*audio, hint); },
            [&] {
                stopped_by = check();
                return stopped_by != Interrupt::None;
            });

        job.rate_limited_events += attempt.outcome.rate_limited;
        job.transient_error_events += attempt.outcome.transient;

        if (attempt.result) {
            seg.transcript_text = std::move(attempt.result->text);
            seg.cues = std::move(attempt.result->cues);
            seg.status = SegmentStatus::Done;
            if (!persist(job)) return Result{.status = Status::LeaseLost};
            continue;
        }

        const auto& err = attempt.result.error();
        if (attempt.outcome.interrupted) {
            seg.status = SegmentStatus::Pending;
            if (!persist(job)) return Result{.status = Status::LeaseLost};
            return Result{.status = Status::Interrupted, .interrupt = stopped_by};
        }

        seg.status = SegmentStatus::Failed;
        std::string summary =
            attempt.outcome.exhausted
                ? std::format("segment {} failed after {} attempts: {}", seg.index + 1,
                              attempt.outcome.attempts, err.message)
                : std::format("segment {} failed: {}", seg.index + 1, err.message);
        std::println(stderr, "provider: job {}: {}", job.id, summary);
        if (!persist(job)) return Result{.status = Status::LeaseLost};
        return Result{.status = Status::Failed, .failed_segment = seg.index, .error = summary};
    }

    return Result{.status = Status::Done};
}

void TranscriptionOrchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
