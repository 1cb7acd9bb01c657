#include <catch2/catch_test_macros.hpp>

#include "common/content_hash.hpp"
#include "upload/upload_manager.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> payload(size_t n) {
    std::vector<uint8_t> data(n);
    for (size_t i = 0; i < n; ++i) data[i] = static_cast<uint8_t>(i * 31 + 7);
    return data;
}

std::span<const uint8_t> chunk_of(const std::vector<uint8_t>& data, uint64_t chunk_size, int index) {
    size_t start = static_cast<size_t>(index) * chunk_size;
    size_t len = std::min<size_t>(chunk_size, data.size() - start);
    return std::span<const uint8_t>(data).subspan(start, len);
}

struct Fixture {
    testing::TmpDir dir;
    testing::FakeClock clock;
    Config config;
    JobDb db;
    ChunkStore store{dir.path};

    Fixture() {
        config.upload.chunk_size = 10;
        config.upload.max_file_size = 1000;
        config.upload.session_ttl_hours = 1;
        config.upload.allowed_mime_types = {"audio/mpeg", "video/*"};
        REQUIRE(store.init());
        REQUIRE(db.open((dir.path / "test.db").string()));
    }

    UploadManager manager() { return UploadManager(config, db, store, false, clock); }

    CreateSessionRequest request(uint64_t size) {
        return CreateSessionRequest{.filename = "talk.mp3", .total_size = size,
                                    .mime_type = "audio/mpeg"};
    }
};

} // namespace

TEST_CASE("UploadManager sessions", "[upload]") {
    Fixture f;
    auto uploads = f.manager();

    SECTION("ChunkCountRoundsUp") {
        auto s = uploads.create_session(f.request(25));
        REQUIRE(s);
        REQUIRE(s->total_chunks == 3);
        REQUIRE(s->chunk_size == 10);
        REQUIRE(s->status == UploadStatus::Collecting);
        REQUIRE(s->expires_at == f.clock() + 3'600'000);
        REQUIRE(s->output_formats == f.config.pipeline.output_formats);

        auto exact = uploads.create_session(f.request(20));
        REQUIRE(exact->total_chunks == 2);
    }

    SECTION("RejectsInvalidRequests") {
        auto empty = uploads.create_session(f.request(0));
        REQUIRE_FALSE(empty);
        REQUIRE(empty.error().code == UploadErrc::InvalidRequest);

        auto big = uploads.create_session(f.request(1001));
        REQUIRE_FALSE(big);
        REQUIRE(big.error().code == UploadErrc::PayloadTooLarge);

        auto req = f.request(10);
        req.mime_type = "application/pdf";
        auto pdf = uploads.create_session(req);
        REQUIRE_FALSE(pdf);
        REQUIRE(pdf.error().code == UploadErrc::UnsupportedMediaType);
    }

    SECTION("MimeMatching") {
        std::vector<std::string> patterns = {"audio/mpeg", "video/*"};
        REQUIRE(UploadManager::mime_allowed(patterns, "audio/mpeg"));
        REQUIRE(UploadManager::mime_allowed(patterns, "Audio/MPEG; charset=binary"));
        REQUIRE(UploadManager::mime_allowed(patterns, "video/quicktime"));
        REQUIRE_FALSE(UploadManager::mime_allowed(patterns, "audio/wav"));
        REQUIRE_FALSE(UploadManager::mime_allowed(patterns, "video"));
        REQUIRE_FALSE(UploadManager::mime_allowed(patterns, "video/"));
    }

    SECTION("ChunkValidation") {
        auto s = uploads.create_session(f.request(25));
        REQUIRE(s);
        auto data = payload(25);

        auto bad_index = uploads.put_chunk(s->upload_id, 3, chunk_of(data, 10, 2));
        REQUIRE(bad_index.error().code == UploadErrc::InvalidChunkIndex);
        REQUIRE(uploads.put_chunk(s->upload_id, -1, chunk_of(data, 10, 0)).error().code ==
                UploadErrc::InvalidChunkIndex);

        // Middle chunks must be full, the last one carries the remainder
        auto short_chunk = uploads.put_chunk(s->upload_id, 0, chunk_of(data, 10, 2));
        REQUIRE(short_chunk.error().code == UploadErrc::InvalidChunkSize);
        auto long_last = uploads.put_chunk(s->upload_id, 2, chunk_of(data, 10, 0));
        REQUIRE(long_last.error().code == UploadErrc::InvalidChunkSize);

        REQUIRE(uploads.put_chunk("missing", 0, chunk_of(data, 10, 0)).error().code ==
                UploadErrc::NotFound);
    }

    SECTION("DuplicateChunksCountOnce") {
        auto s = uploads.create_session(f.request(25));
        auto data = payload(25);

        REQUIRE(*uploads.put_chunk(s->upload_id, 1, chunk_of(data, 10, 1)) == 1);
        REQUIRE(*uploads.put_chunk(s->upload_id, 1, chunk_of(data, 10, 1)) == 1);
        REQUIRE(*uploads.put_chunk(s->upload_id, 0, chunk_of(data, 10, 0)) == 2);

        auto status = uploads.get_status(s->upload_id);
        REQUIRE(status);
        REQUIRE(status->received_chunks == std::vector<int>{0, 1});
        REQUIRE(status->bytes_received == 20);
        REQUIRE(status->chunk_size == 10);
        REQUIRE(status->progress > 66.0);
        REQUIRE(status->progress < 67.0);
    }

    SECTION("ExpiredSessionRefusesChunks") {
        auto s = uploads.create_session(f.request(10));
        f.clock.advance(3'600'000);
        auto r = uploads.put_chunk(s->upload_id, 0, chunk_of(payload(10), 10, 0));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code == UploadErrc::NotCollecting);
    }
}

TEST_CASE("UploadManager completion", "[upload]") {
    Fixture f;
    auto uploads = f.manager();
    auto data = payload(25);
    auto digest = hashing::sha256_hex(data);

    auto s = uploads.create_session(f.request(25));
    REQUIRE(s);
    auto id = s->upload_id;

    SECTION("OutOfOrderChunksAssembleIntoAJob") {
        REQUIRE(uploads.put_chunk(id, 2, chunk_of(data, 10, 2)));
        REQUIRE(uploads.put_chunk(id, 0, chunk_of(data, 10, 0)));
        REQUIRE(uploads.put_chunk(id, 1, chunk_of(data, 10, 1)));

        auto job_id = uploads.complete(id, digest);
        REQUIRE(job_id);

        auto job = f.db.get_job(*job_id);
        REQUIRE(job);
        REQUIRE(job->status == JobStatus::Pending);
        REQUIRE(job->stage == Stage::Validating);
        REQUIRE(job->upload_id == id);
        REQUIRE(job->total_size == 25);
        REQUIRE(job->max_retries == 3);

        auto source = f.store.read_blob(job->source_ref);
        REQUIRE(source);
        REQUIRE(*source == data);

        // Chunks are gone once the job owns the assembled file
        REQUIRE_FALSE(f.store.has_chunk(id, 0));

        auto status = uploads.get_status(id);
        REQUIRE(status->status == UploadStatus::Completed);
        REQUIRE(status->job_id == *job_id);
        REQUIRE(status->progress == 100.0);
    }

    SECTION("RepeatedCompleteReturnsSameJob") {
        for (int i = 0; i < 3; ++i) REQUIRE(uploads.put_chunk(id, i, chunk_of(data, 10, i)));
        auto first = uploads.complete(id, digest);
        auto second = uploads.complete(id, digest);
        REQUIRE(first);
        REQUIRE(second);
        REQUIRE(*first == *second);
        REQUIRE(f.db.list_jobs(std::nullopt, 10).size() == 1);

        // No chunks after completion
        auto late = uploads.put_chunk(id, 0, chunk_of(data, 10, 0));
        REQUIRE(late.error().code == UploadErrc::NotCollecting);
    }

    SECTION("IncompleteUploadListsMissing") {
        REQUIRE(uploads.put_chunk(id, 1, chunk_of(data, 10, 1)));
        auto r = uploads.complete(id, digest);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code == UploadErrc::IncompleteUpload);
        REQUIRE(r.error().message.find("0, 2") != std::string::npos);
        REQUIRE(f.db.list_jobs(std::nullopt, 10).empty());
    }

    SECTION("HashMismatchKeepsSessionResumable") {
        for (int i = 0; i < 3; ++i) REQUIRE(uploads.put_chunk(id, i, chunk_of(data, 10, i)));

        auto wrong = uploads.complete(id, hashing::sha256_hex(payload(24)));
        REQUIRE_FALSE(wrong);
        REQUIRE(wrong.error().code == UploadErrc::IntegrityMismatch);
        REQUIRE(f.db.list_jobs(std::nullopt, 10).empty());
        REQUIRE(uploads.get_status(id)->status == UploadStatus::Collecting);

        auto missing = uploads.complete(id, "");
        REQUIRE(missing.error().code == UploadErrc::IntegrityMismatch);

        // Re-sending a corrupted chunk and completing again succeeds
        auto corrupt = chunk_of(data, 10, 1);
        std::vector<uint8_t> bad(corrupt.begin(), corrupt.end());
        bad[0] ^= 0xff;
        REQUIRE(uploads.put_chunk(id, 1, bad));
        REQUIRE(uploads.complete(id, digest).error().code == UploadErrc::IntegrityMismatch);
        REQUIRE(uploads.put_chunk(id, 1, chunk_of(data, 10, 1)));

        std::string upper = digest;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        REQUIRE(uploads.complete(id, upper));
    }

    SECTION("AbortDiscardsChunks") {
        REQUIRE(uploads.put_chunk(id, 0, chunk_of(data, 10, 0)));
        REQUIRE(uploads.abort(id));
        REQUIRE_FALSE(f.store.has_chunk(id, 0));
        REQUIRE(uploads.get_status(id)->status == UploadStatus::Aborted);

        // Aborting twice is fine, completing is not
        REQUIRE(uploads.abort(id));
        REQUIRE(uploads.complete(id, digest).error().code == UploadErrc::NotCollecting);
        REQUIRE(uploads.put_chunk(id, 0, chunk_of(data, 10, 0)).error().code ==
                UploadErrc::NotCollecting);
    }

    SECTION("ReclaimExpiresStaleSessions") {
        REQUIRE(uploads.put_chunk(id, 0, chunk_of(data, 10, 0)));
        REQUIRE(uploads.reclaim_expired() == 0);
        REQUIRE(f.store.has_chunk(id, 0));

        f.clock.advance(3'600'000);
        REQUIRE(uploads.reclaim_expired() == 1);
        REQUIRE(uploads.get_status(id)->status == UploadStatus::Expired);
        REQUIRE_FALSE(f.store.has_chunk(id, 0));
        REQUIRE(uploads.reclaim_expired() == 0);
    }

    SECTION("CrashDuringCompleteIsRecovered") {
        for (int i = 0; i < 3; ++i) REQUIRE(uploads.put_chunk(id, i, chunk_of(data, 10, i)));
        auto kept_job = uploads.complete(id, digest);
        REQUIRE(kept_job);

        // A second upload dies between the finalizing mark and the job insert
        auto s2 = uploads.create_session(f.request(25));
        REQUIRE(s2);
        for (int i = 0; i < 3; ++i)
            REQUIRE(uploads.put_chunk(s2->upload_id, i, chunk_of(data, 10, i)));
        REQUIRE(f.db.transition_session(s2->upload_id, UploadStatus::Collecting,
                                        UploadStatus::Finalizing, f.clock()));
        auto stray = ChunkStore::blob_ref("unrecorded", "source");
        REQUIRE(f.store.write_blob(stray, data));
        REQUIRE(uploads.complete(s2->upload_id, digest).error().code == UploadErrc::NotCollecting);

        auto restarted = f.manager();
        REQUIRE(restarted.recover_interrupted() == 1);
        REQUIRE(restarted.get_status(s2->upload_id)->status == UploadStatus::Collecting);
        REQUIRE_FALSE(f.store.exists(stray));
        REQUIRE(f.store.exists(ChunkStore::blob_ref(*kept_job, "source")));
        REQUIRE(f.store.has_chunk(s2->upload_id, 2));

        auto job_id = restarted.complete(s2->upload_id, digest);
        REQUIRE(job_id);
        REQUIRE(*f.store.read_blob(f.db.get_job(*job_id)->source_ref) == data);
        REQUIRE(restarted.recover_interrupted() == 0);
    }

    SECTION("ReclaimRemovesOrphanedChunks") {
        REQUIRE(f.store.put_chunk("orphan", 0, payload(3)));
        REQUIRE(uploads.put_chunk(id, 0, chunk_of(data, 10, 0)));
        uploads.reclaim_expired();
        REQUIRE_FALSE(f.store.has_chunk("orphan", 0));
        REQUIRE(f.store.has_chunk(id, 0));
    }
}
