#include <catch2/catch_test_macros.hpp>

#include "pipeline/job.hpp"

#include <string>

namespace {

TranscriptionJob failed_at(Stage stage) {
    TranscriptionJob job;
    job.id = "j";
    job.stage = Stage::Failed;
    job.failed_stage = stage;
    job.status = JobStatus::Failed;
    job.error = "TRANSCRIPTION_FAILED: segment 2";
    job.warnings = {"something"};
    job.retry_count = 3;
    job.completed_at = 99;
    job.normalized_ref = "blobs/j/normalized.wav";
    job.detected_language = "en";
    job.language_confidence = 0.5;
    for (int i = 0; i < 4; ++i) {
        Segment seg;
        seg.index = i;
        seg.storage_ref = "blobs/j/segment_" + std::to_string(i) + ".wav";
        seg.status = i < 2 ? SegmentStatus::Done : SegmentStatus::Failed;
        seg.transcript_text = i < 2 ? "done" : "partial";
        seg.cues = {Cue{0.0, 1.0, seg.transcript_text}};
        job.segments.push_back(seg);
    }
    job.merged_transcript = "merged";
    job.word_count = 10;
    job.outputs = {{"txt", "blobs/j/transcript.txt"}};
    return job;
}

} // namespace

TEST_CASE("Stage machine", "[job]") {

    SECTION("NamesRoundTrip") {
        for (int s = 0; s <= static_cast<int>(Stage::Failed); ++s) {
            auto stage = static_cast<Stage>(s);
            REQUIRE(stage_from_string(to_string(stage)) == stage);
        }
        REQUIRE(to_string(Stage::DetectingLanguage) == "detecting_language");
        REQUIRE(to_string(JobStatus::Retrying) == "retrying");
        REQUIRE_FALSE(stage_from_string("bogus"));
        REQUIRE_FALSE(job_status_from_string(""));
    }

    SECTION("OnlyForwardOrFailed") {
        for (int s = 0; s < static_cast<int>(Stage::Complete); ++s) {
            auto from = static_cast<Stage>(s);
            for (int t = 0; t <= static_cast<int>(Stage::Failed); ++t) {
                auto to = static_cast<Stage>(t);
                bool legal = to == Stage::Failed || t == s + 1;
                REQUIRE(can_transition(from, to) == legal);
            }
        }
        REQUIRE_FALSE(can_transition(Stage::Complete, Stage::Failed));
        REQUIRE_FALSE(can_transition(Stage::Failed, Stage::Validating));
    }

    SECTION("Advance") {
        TranscriptionJob job;
        job.stage = Stage::Merging;
        advance<Stage::Merging, Stage::Diarizing>(job);
        REQUIRE(job.stage == Stage::Diarizing);
    }

    SECTION("Progress") {
        auto job = failed_at(Stage::Transcribing);
        REQUIRE(job.done_segments() == 2);
        REQUIRE(job.progress() == 0.5);

        TranscriptionJob empty;
        REQUIRE(empty.progress() == 0.0);
        empty.status = JobStatus::Complete;
        REQUIRE(empty.progress() == 1.0);
    }
}

TEST_CASE("rewind", "[job]") {

    SECTION("KeepsFinishedSegments") {
        auto job = failed_at(Stage::Transcribing);
        REQUIRE(rewind(job, Stage::Transcribing));

        REQUIRE(job.stage == Stage::Transcribing);
        REQUIRE(job.status == JobStatus::Pending);
        REQUIRE(job.failed_stage == Stage::Created);
        REQUIRE(job.error.empty());
        REQUIRE(job.warnings.empty());
        REQUIRE(job.retry_count == 0);
        REQUIRE(job.completed_at == 0);

        REQUIRE(job.segments.size() == 4);
        REQUIRE(job.segments[0].status == SegmentStatus::Done);
        REQUIRE(job.segments[0].transcript_text == "done");
        REQUIRE(job.segments[3].status == SegmentStatus::Pending);
        REQUIRE(job.segments[3].transcript_text.empty());
        REQUIRE(job.segments[3].cues.empty());

        REQUIRE(job.detected_language == "en");
        REQUIRE(job.normalized_ref == "blobs/j/normalized.wav");
        REQUIRE(job.merged_transcript.empty());
        REQUIRE(job.outputs.empty());
    }

    SECTION("ResegmentingDropsSegments") {
        auto job = failed_at(Stage::Transcribing);
        REQUIRE(rewind(job, Stage::Segmenting));
        REQUIRE(job.segments.empty());
        REQUIRE_FALSE(job.detected_language);
        REQUIRE(job.normalized_ref == "blobs/j/normalized.wav");

        auto again = failed_at(Stage::Transcribing);
        REQUIRE(rewind(again, Stage::Validating));
        REQUIRE(again.normalized_ref.empty());
    }

    SECTION("CannotRewindPastFailure") {
        auto job = failed_at(Stage::Segmenting);
        REQUIRE_FALSE(rewind(job, Stage::Transcribing));
        REQUIRE_FALSE(rewind(job, Stage::Created));
        REQUIRE_FALSE(rewind(job, Stage::Complete));
        REQUIRE(job.stage == Stage::Failed);
    }

    SECTION("OnlyFailedJobs") {
        auto job = failed_at(Stage::Transcribing);
        job.stage = Stage::Transcribing;
        REQUIRE_FALSE(rewind(job, Stage::Validating));
    }
}
