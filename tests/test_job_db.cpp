#include <catch2/catch_test_macros.hpp>

#include "storage/job_db.hpp"
#include "test_support.hpp"

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int64_t kNow = 1'700'000'000'000;
constexpr int64_t kLease = 60'000;

UploadSession make_session(const std::string& id) {
    UploadSession s;
    s.upload_id = id;
    s.filename = "talk.mp3";
    s.total_size = 12;
    s.mime_type = "audio/mpeg";
    s.chunk_size = 5;
    s.total_chunks = 3;
    s.created_at = s.updated_at = kNow;
    s.expires_at = kNow + 3'600'000;
    s.language = "de";
    s.output_formats = {"txt", "srt"};
    return s;
}

TranscriptionJob make_job(const std::string& id, int64_t created_at = kNow) {
    TranscriptionJob job;
    job.id = id;
    job.upload_id = "up-" + id;
    job.filename = "talk.mp3";
    job.total_size = 12;
    job.mime_type = "audio/mpeg";
    job.stage = Stage::Validating;
    job.status = JobStatus::Pending;
    job.created_at = job.updated_at = created_at;
    job.output_formats = {"txt", "json"};
    job.source_ref = "blobs/" + id + "/source";
    return job;
}

} // namespace

TEST_CASE("JobDb sessions", "[db]") {
    testing::TmpDir dir;
    JobDb db;
    REQUIRE(db.open((dir.path / "test.db").string()));

    SECTION("InsertAndGet") {
        REQUIRE(db.insert_session(make_session("s1")));
        auto s = db.get_session("s1");
        REQUIRE(s);
        REQUIRE(s->filename == "talk.mp3");
        REQUIRE(s->total_chunks == 3);
        REQUIRE(s->status == UploadStatus::Collecting);
        REQUIRE(s->language == "de");
        REQUIRE(s->output_formats == std::vector<std::string>{"txt", "srt"});
        REQUIRE(s->received_chunks.empty());

        REQUIRE_FALSE(db.get_session("nope"));
    }

    SECTION("RecordChunkIsIdempotent") {
        REQUIRE(db.insert_session(make_session("s2")));
        REQUIRE(db.record_chunk("s2", 0, 5, kNow));
        REQUIRE(db.record_chunk("s2", 0, 5, kNow + 1));
        REQUIRE(db.record_chunk("s2", 2, 2, kNow + 2));

        auto s = db.get_session("s2");
        REQUIRE(s);
        REQUIRE(s->received_chunks == std::set<int>{0, 2});
        REQUIRE(s->bytes_received == 7);
        REQUIRE(s->updated_at == kNow + 2);
    }

    SECTION("ChunksOnlyWhileCollecting") {
        REQUIRE(db.insert_session(make_session("s3")));
        REQUIRE(db.transition_session("s3", UploadStatus::Collecting, UploadStatus::Aborted, kNow));
        REQUIRE_FALSE(db.record_chunk("s3", 0, 5, kNow));
        REQUIRE_FALSE(db.record_chunk("missing", 0, 5, kNow));
    }

    SECTION("TransitionIsCheckAndSet") {
        REQUIRE(db.insert_session(make_session("s4")));
        REQUIRE(db.transition_session("s4", UploadStatus::Collecting, UploadStatus::Finalizing, kNow));
        // A second finalizer loses
        REQUIRE_FALSE(db.transition_session("s4", UploadStatus::Collecting,
                                            UploadStatus::Finalizing, kNow));
        REQUIRE(db.get_session("s4")->status == UploadStatus::Finalizing);
    }

    SECTION("CompleteCreatesJobAtomically") {
        REQUIRE(db.insert_session(make_session("s5")));
        REQUIRE(db.record_chunk("s5", 0, 5, kNow));

        auto job = make_job("j5");
        // Not finalizing yet: nothing happens
        REQUIRE_FALSE(db.complete_session_with_job("s5", job, kNow));
        REQUIRE_FALSE(db.get_job("j5"));

        REQUIRE(db.transition_session("s5", UploadStatus::Collecting, UploadStatus::Finalizing, kNow));
        REQUIRE(db.complete_session_with_job("s5", job, kNow));

        auto s = db.get_session("s5");
        REQUIRE(s->status == UploadStatus::Completed);
        REQUIRE(s->job_id == "j5");
        REQUIRE(s->received_chunks.empty());
        REQUIRE(db.get_job("j5"));
    }

    SECTION("ExpiredSessions") {
        auto s = make_session("s6");
        s.expires_at = kNow - 1;
        REQUIRE(db.insert_session(s));
        REQUIRE(db.insert_session(make_session("s7")));

        REQUIRE(db.expired_sessions(kNow) == std::vector<std::string>{"s6"});
        REQUIRE(db.session_is_live("s6"));
        REQUIRE(db.transition_session("s6", UploadStatus::Collecting, UploadStatus::Expired, kNow));
        REQUIRE_FALSE(db.session_is_live("s6"));
        REQUIRE(db.expired_sessions(kNow).empty());
    }
}

TEST_CASE("JobDb jobs", "[db]") {
    testing::TmpDir dir;
    JobDb db;
    REQUIRE(db.open((dir.path / "test.db").string()));

    SECTION("RoundTripsEveryField") {
        auto job = make_job("j1");
        job.language_hint = "fr";
        job.enable_diarization = false;
        job.audio_duration_seconds = 480.5;
        job.segments = {
            Segment{0, 0.0, 240.0, "blobs/j1/segment_0000.wav", "hello", SegmentStatus::Done,
                    {Cue{0.0, 1.0, "hello"}}},
            Segment{1, 240.0, 480.5, "blobs/j1/segment_0001.wav", "", SegmentStatus::Failed, {}},
        };
        job.detected_language = "fr";
        job.language_confidence = 0.67;
        job.merged_transcript = "[Part 1] hello";
        job.outputs = {{"txt", "blobs/j1/transcript.txt"}};
        job.warnings = {"diarization failed: empty transcript"};
        job.stage_durations = {{"transcribing", 12.5}};
        job.rate_limited_events = 2;
        REQUIRE(db.insert_job(job));

        auto back = db.get_job("j1");
        REQUIRE(back);
        REQUIRE(back->stage == Stage::Validating);
        REQUIRE(back->language_hint == "fr");
        REQUIRE_FALSE(back->enable_diarization);
        REQUIRE(back->audio_duration_seconds == 480.5);
        REQUIRE(back->segments.size() == 2);
        REQUIRE(back->segments[0].status == SegmentStatus::Done);
        REQUIRE(back->segments[0].cues.size() == 1);
        REQUIRE(back->segments[1].status == SegmentStatus::Failed);
        REQUIRE(back->segments[1].end_offset == 480.5);
        REQUIRE(back->detected_language == "fr");
        REQUIRE(back->outputs.at("txt") == "blobs/j1/transcript.txt");
        REQUIRE(back->warnings.size() == 1);
        REQUIRE(back->stage_durations.at("transcribing") == 12.5);
        REQUIRE(back->rate_limited_events == 2);
        REQUIRE(back->output_formats == std::vector<std::string>{"txt", "json"});
    }

    SECTION("ClaimTakesOldestFirst") {
        REQUIRE(db.insert_job(make_job("late", kNow + 10)));
        REQUIRE(db.insert_job(make_job("early", kNow)));

        auto first = db.claim_next("w1", kNow, kLease);
        REQUIRE(first);
        REQUIRE(first->id == "early");
        REQUIRE(first->status == JobStatus::Running);
        REQUIRE(first->owner == "w1");
        REQUIRE(first->lease_expires_at == kNow + kLease);
        REQUIRE(first->started_at == kNow);

        auto second = db.claim_next("w2", kNow, kLease);
        REQUIRE(second);
        REQUIRE(second->id == "late");

        REQUIRE_FALSE(db.claim_next("w3", kNow, kLease));
    }

    SECTION("ConcurrentClaimsAreExclusive") {
        for (int i = 0; i < 20; ++i) REQUIRE(db.insert_job(make_job("job" + std::to_string(i), kNow + i)));

        std::mutex m;
        std::vector<std::string> claimed;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t] {
                while (auto job = db.claim_next("w" + std::to_string(t), kNow, kLease)) {
                    std::lock_guard lock(m);
                    claimed.push_back(job->id);
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(claimed.size() == 20);
        REQUIRE(std::set<std::string>(claimed.begin(), claimed.end()).size() == 20);
    }

    SECTION("ExpiredLeaseCanBeReclaimed") {
        REQUIRE(db.insert_job(make_job("j2")));
        auto job = db.claim_next("w1", kNow, kLease);
        REQUIRE(job);

        // Still leased
        REQUIRE_FALSE(db.claim_next("w2", kNow + kLease - 1, kLease));

        auto stolen = db.claim_next("w2", kNow + kLease + 1, kLease);
        REQUIRE(stolen);
        REQUIRE(stolen->id == "j2");
        REQUIRE(stolen->owner == "w2");
        // started_at is kept from the first claim
        REQUIRE(stolen->started_at == kNow);

        // The old owner can no longer write
        job->stage = Stage::Transcoding;
        REQUIRE_FALSE(db.save_job(*job, "w1"));
        REQUIRE_FALSE(db.renew_lease("j2", "w1", kNow + 10 * kLease));
        REQUIRE(db.get_job("j2")->stage == Stage::Validating);
    }

    SECTION("SaveRequiresOwner") {
        REQUIRE(db.insert_job(make_job("j3")));
        auto job = db.claim_next("w1", kNow, kLease);
        REQUIRE(job);

        job->stage = Stage::Transcoding;
        REQUIRE(db.save_job(*job, "w1"));
        REQUIRE(db.get_job("j3")->stage == Stage::Transcoding);
        REQUIRE_FALSE(db.save_job(*job, "w2"));

        REQUIRE(db.renew_lease("j3", "w1", kNow + 5 * kLease));
        REQUIRE(db.get_job("j3")->lease_expires_at == kNow + 5 * kLease);

        // Releasing clears the owner; the unowned record is writable by ""
        job->owner.clear();
        job->status = JobStatus::Pending;
        REQUIRE(db.save_job(*job, "w1"));
        REQUIRE(db.save_job(*job, ""));
    }

    SECTION("SaveNeverTouchesCancelFlag") {
        REQUIRE(db.insert_job(make_job("j4")));
        auto job = db.claim_next("w1", kNow, kLease);
        REQUIRE(job);
        REQUIRE(db.request_cancel("j4"));

        job->cancel_requested = false;
        REQUIRE(db.save_job(*job, "w1"));
        REQUIRE(db.is_cancel_requested("j4"));

        REQUIRE(db.clear_cancel("j4"));
        REQUIRE_FALSE(db.is_cancel_requested("j4"));
    }

    SECTION("CancelIgnoresFinishedJobs") {
        auto job = make_job("j5");
        job.stage = Stage::Complete;
        job.status = JobStatus::Complete;
        REQUIRE(db.insert_job(job));
        REQUIRE_FALSE(db.request_cancel("j5"));
        REQUIRE_FALSE(db.request_cancel("unknown"));
    }

    SECTION("RequeueRunning") {
        REQUIRE(db.insert_job(make_job("j6")));
        REQUIRE(db.insert_job(make_job("j7", kNow + 1)));
        REQUIRE(db.claim_next("w1", kNow, kLease));

        REQUIRE(db.requeue_running() == 1);
        auto job = db.get_job("j6");
        REQUIRE(job->status == JobStatus::Pending);
        REQUIRE(job->owner.empty());
        // Claimable again right away
        REQUIRE(db.claim_next("w2", kNow, kLease)->id == "j6");
    }

    SECTION("RetryingJobsAreClaimable") {
        auto job = make_job("j8");
        job.status = JobStatus::Retrying;
        job.retry_count = 1;
        REQUIRE(db.insert_job(job));
        auto claimed = db.claim_next("w1", kNow, kLease);
        REQUIRE(claimed);
        REQUIRE(claimed->retry_count == 1);
    }

    SECTION("ListAndCount") {
        auto failed = make_job("f1", kNow);
        failed.stage = Stage::Failed;
        failed.status = JobStatus::Failed;
        REQUIRE(db.insert_job(failed));
        REQUIRE(db.insert_job(make_job("p1", kNow + 1)));
        REQUIRE(db.insert_job(make_job("p2", kNow + 2)));

        auto all = db.list_jobs(std::nullopt, 10);
        REQUIRE(all.size() == 3);
        REQUIRE(all.front().id == "p2"); // newest first

        auto pending = db.list_jobs(JobStatus::Pending, 1);
        REQUIRE(pending.size() == 1);
        REQUIRE(pending[0].id == "p2");

        auto counts = db.count_by_status();
        REQUIRE(counts["pending"] == 2);
        REQUIRE(counts["failed"] == 1);
        REQUIRE(counts["running"] == 0);
        REQUIRE(counts["complete"] == 0);
    }

    SECTION("SurvivesReopen") {
        REQUIRE(db.insert_job(make_job("j9")));
        db.close();

        JobDb again;
        REQUIRE(again.open((dir.path / "test.db").string()));
        REQUIRE(again.get_job("j9"));
    }
}
