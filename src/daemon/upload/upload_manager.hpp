#pragma once

#include "config.hpp"
#include "storage/chunk_store.hpp"
#include "storage/job_db.hpp"
#include "upload/upload_session.hpp"
#include "util/clock.hpp"

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

enum class UploadErrc {
    InvalidRequest,
    NotFound,
    PayloadTooLarge,
    UnsupportedMediaType,
    InvalidChunkIndex,
    InvalidChunkSize,
    NotCollecting,
    IncompleteUpload,
    IntegrityMismatch,
    StorageError,
};

// Stable wire code, e.g. "INTEGRITY_MISMATCH".
std::string_view to_string(UploadErrc code);

struct UploadError {
    UploadErrc code;
    std::string message;
};

struct CreateSessionRequest {
    std::string filename;
    uint64_t total_size = 0;
    std::string mime_type;
    std::optional<std::string> language;
    std::optional<bool> enable_diarization;
    std::vector<std::string> output_formats; // empty: configured defaults
};

// Resumable chunked uploads. Every call is safe to repeat: chunks overwrite
// by index, and a failed completion leaves the session collecting.
class UploadManager {
public:
    UploadManager(const Config& config, JobDb& db, ChunkStore& store, bool verbose = false,
                  ClockFn clock = now_ms);

    std::expected<UploadSession, UploadError> create_session(const CreateSessionRequest& req);

    // Returns the number of distinct chunks received so far.
    std::expected<int, UploadError> put_chunk(const std::string& upload_id, int index,
                                              std::span<const uint8_t> data);

    std::expected<UploadStatusReport, UploadError> get_status(const std::string& upload_id);

    // Assembles and verifies the upload and creates its job. Returns the job id.
    std::expected<std::string, UploadError> complete(const std::string& upload_id,
                                                     const std::string& declared_sha256);

    std::expected<void, UploadError> abort(const std::string& upload_id);

    // Expires stale sessions and removes chunk directories with no live session.
    int reclaim_expired();

    // Startup recovery after a crash inside complete(): reopens finalizing
    // sessions and drops assembled blobs that never got a job record.
    // Returns how many sessions were reopened.
    int recover_interrupted();

    static bool mime_allowed(const std::vector<std::string>& patterns, std::string_view mime);

private:
    void log(const std::string& msg);

    Config::Upload upload_cfg_;
    Config::Pipeline pipeline_cfg_;
    JobDb& db_;
    ChunkStore& store_;
    bool verbose_;
    ClockFn clock_;
};
