#include <catch2/catch_test_macros.hpp>

#include "pipeline/orchestrator.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

constexpr uint32_t kRate = 100;

struct Fixture {
    testing::TmpDir dir;
    ChunkStore store{dir.path};
    testing::ScriptedProvider provider;
    testing::RecordingSleep sleep;
    int persists = 0;

    Fixture() { REQUIRE(store.init()); }

    // Job with `count` stored 60-second segments.
    TranscriptionJob job_with_segments(int count) {
        TranscriptionJob job;
        job.id = "job";
        job.stage = Stage::Transcribing;
        job.status = JobStatus::Running;
        for (int k = 0; k < count; ++k) {
            Segment seg;
            seg.index = k;
            seg.start_offset = 60.0 * k;
            seg.end_offset = 60.0 * (k + 1);
            seg.storage_ref = ChunkStore::blob_ref("job", "segment_" + std::to_string(k) + ".wav");
            // First sample carries the segment's start second
            std::vector<int16_t> samples(kRate, static_cast<int16_t>(60 * k));
            REQUIRE(store.write_blob(seg.storage_ref, wav::encode(samples, kRate)));
            job.segments.push_back(seg);
        }
        return job;
    }

    TranscriptionOrchestrator orchestrator() {
        RetryPolicy policy{.max_attempts = 5, .base_delay = 1000ms, .max_delay = 60000ms,
                           .jitter = 0.2};
        return TranscriptionOrchestrator(provider, store, policy, 3000ms, sleep, false,
                                         [] { return 0.5; });
    }

    PersistFn persist() {
        return [this](TranscriptionJob&) {
            ++persists;
            return true;
        };
    }
};

} // namespace

TEST_CASE("TranscriptionOrchestrator", "[orchestrator]") {
    Fixture f;
    auto orchestrator = f.orchestrator();

    SECTION("TranscribesInIndexOrder") {
        auto job = f.job_with_segments(3);
        std::swap(job.segments[0], job.segments[2]);

        auto r = orchestrator.run(job, f.persist(), {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Done);
        REQUIRE(f.provider.seconds() == std::vector<int>{0, 60, 120});
        REQUIRE(job.segments[1].transcript_text == "speech from second 60.");
        REQUIRE(job.segments[1].cues.size() == 1);
        REQUIRE(job.done_segments() == 3);
        // Paced between consecutive submissions only
        REQUIRE(*f.sleep.waits == std::vector<std::chrono::milliseconds>{3000ms, 3000ms});
        // Before and after each segment
        REQUIRE(f.persists == 6);
    }

    SECTION("RateLimitsThenSuccess") {
        auto job = f.job_with_segments(2);
        f.provider.failures = {testing::rate_limited(), testing::rate_limited(),
                               testing::rate_limited()};

        auto r = orchestrator.run(job, f.persist(), {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Done);
        REQUIRE(job.rate_limited_events == 3);
        REQUIRE(job.transient_error_events == 0);
        REQUIRE(f.provider.seconds() == std::vector<int>{0, 0, 0, 0, 60});
        REQUIRE(*f.sleep.waits ==
                std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 4000ms, 3000ms});
    }

    SECTION("FatalErrorFailsSegmentWithoutRetry") {
        auto job = f.job_with_segments(3);
        f.provider.fail_when = [](size_t, int second) -> std::optional<ProviderError> {
            if (second == 60) return testing::fatal();
            return std::nullopt;
        };

        auto r = orchestrator.run(job, f.persist(), {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Failed);
        REQUIRE(r.failed_segment == 1);
        REQUIRE(r.error.find("segment 2 failed") != std::string::npos);
        REQUIRE(job.segments[0].status == SegmentStatus::Done);
        REQUIRE(job.segments[1].status == SegmentStatus::Failed);
        REQUIRE(job.segments[2].status == SegmentStatus::Pending);
        REQUIRE(f.provider.seconds() == std::vector<int>{0, 60});
    }

    SECTION("ExhaustedRetriesFailSegment") {
        auto job = f.job_with_segments(1);
        f.provider.fail_when = [](size_t, int) -> std::optional<ProviderError> {
            return testing::transient();
        };

        auto r = orchestrator.run(job, f.persist(), {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Failed);
        REQUIRE(r.error.find("after 5 attempts") != std::string::npos);
        REQUIRE(job.transient_error_events == 5);
        REQUIRE(f.provider.calls().size() == 5);
    }

    SECTION("DoneSegmentsAreNeverResubmitted") {
        auto job = f.job_with_segments(4);
        job.segments[0].status = SegmentStatus::Done;
        job.segments[0].transcript_text = "kept";
        job.segments[2].status = SegmentStatus::Done;

        auto r = orchestrator.run(job, f.persist(), {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Done);
        REQUIRE(f.provider.seconds() == std::vector<int>{60, 180});
        REQUIRE(job.segments[0].transcript_text == "kept");
    }

    SECTION("LanguageHintWinsOverDetection") {
        auto job = f.job_with_segments(1);
        job.detected_language = "fr";
        REQUIRE(orchestrator.run(job, f.persist(), {}).status ==
                TranscriptionOrchestrator::Status::Done);
        REQUIRE(f.provider.calls()[0].language == "fr");

        auto hinted = f.job_with_segments(1);
        hinted.detected_language = "fr";
        hinted.language_hint = "de";
        REQUIRE(orchestrator.run(hinted, f.persist(), {}).status ==
                TranscriptionOrchestrator::Status::Done);
        REQUIRE(f.provider.calls()[1].language == "de");
    }

    SECTION("InterruptStopsAtSegmentBoundary") {
        auto job = f.job_with_segments(3);
        Interrupt flag = Interrupt::None;
        f.provider.on_call = [&](size_t call, int) {
            if (call == 0) flag = Interrupt::Cancelled;
        };

        auto r = orchestrator.run(job, f.persist(), [&] { return flag; });
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Interrupted);
        REQUIRE(r.interrupt == Interrupt::Cancelled);
        // The in-flight segment finished, the next never started
        REQUIRE(job.segments[0].status == SegmentStatus::Done);
        REQUIRE(job.segments[1].status == SegmentStatus::Pending);
        REQUIRE(f.provider.calls().size() == 1);
    }

    SECTION("InterruptDuringBackoffLeavesSegmentPending") {
        auto job = f.job_with_segments(2);
        Interrupt flag = Interrupt::None;
        f.provider.fail_when = [&](size_t, int) -> std::optional<ProviderError> {
            flag = Interrupt::Shutdown;
            return testing::rate_limited();
        };

        auto r = orchestrator.run(job, f.persist(), [&] { return flag; });
        REQUIRE(r.status == TranscriptionOrchestrator::Status::Interrupted);
        REQUIRE(r.interrupt == Interrupt::Shutdown);
        REQUIRE(job.segments[0].status == SegmentStatus::Pending);
        REQUIRE(f.sleep.waits->empty());
    }

    SECTION("LostLeaseStopsWork") {
        auto job = f.job_with_segments(3);
        int allowed = 2;
        auto r = orchestrator.run(job, [&](TranscriptionJob&) { return allowed-- > 0; }, {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::LeaseLost);
        REQUIRE(f.provider.calls().size() == 1);
    }

    SECTION("MissingSegmentAudio") {
        auto job = f.job_with_segments(2);
        f.store.remove_blob(job.segments[1].storage_ref);
        auto r = orchestrator.run(job, f.persist(), {});
        REQUIRE(r.status == TranscriptionOrchestrator::Status::StorageFailed);
        REQUIRE(r.failed_segment == 1);
    }
}
