#include "upload/upload_manager.hpp"

#include "common/content_hash.hpp"
#include "util/ids.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <print>

namespace {

constexpr int64_t kHourMs = 3600LL * 1000;

std::string normalize_mime(std::string_view mime) {
    auto semi = mime.find(';');
    if (semi != std::string_view::npos) mime = mime.substr(0, semi);
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.back())))
        mime.remove_suffix(1);
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.front())))
        mime.remove_prefix(1);

    std::string out(mime);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::unexpected<UploadError> fail(UploadErrc code, std::string message) {
    return std::unexpected(UploadError{code, std::move(message)});
}

} // namespace

std::string_view to_string(UploadErrc code) {
    switch (code) {
        case UploadErrc::InvalidRequest:       return "INVALID_REQUEST";
        case UploadErrc::NotFound:             return "NOT_FOUND";
        case UploadErrc::PayloadTooLarge:      return "PAYLOAD_TOO_LARGE";
        case UploadErrc::UnsupportedMediaType: return "UNSUPPORTED_MEDIA_TYPE";
        case UploadErrc::InvalidChunkIndex:    return "INVALID_CHUNK_INDEX";
        case UploadErrc::InvalidChunkSize:     return "INVALID_CHUNK_SIZE";
        case UploadErrc::NotCollecting:        return "NOT_COLLECTING";
        case UploadErrc::IncompleteUpload:     return "INCOMPLETE_UPLOAD";
        case UploadErrc::IntegrityMismatch:    return "INTEGRITY_MISMATCH";
        case UploadErrc::StorageError:         return "STORAGE_ERROR";
    }
    return "UNKNOWN";
}

UploadManager::UploadManager(const Config& config, JobDb& db, ChunkStore& store, bool verbose,
                             ClockFn clock)
    : upload_cfg_(config.upload), pipeline_cfg_(config.pipeline),
      db_(db), store_(store), verbose_(verbose), clock_(std::move(clock)) {}

bool UploadManager::mime_allowed(const std::vector<std::string>& patterns, std::string_view mime) {
    auto m = normalize_mime(mime);
    auto slash = m.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == m.size()) return false;

    for (const auto& pattern : patterns) {
        auto p = normalize_mime(pattern);
        if (p == m) return true;
        if (p.ends_with("/*") && m.compare(0, p.size() - 1, p, 0, p.size() - 1) == 0) return true;
    }
    return false;
}

std::expected<UploadSession, UploadError>
UploadManager::create_session(const CreateSessionRequest& req) {
    if (req.total_size == 0) return fail(UploadErrc::InvalidRequest, "total_size must be positive");
    if (req.filename.empty()) return fail(UploadErrc::InvalidRequest, "filename is required");

    if (req.total_size > upload_cfg_.max_file_size) {
        return fail(UploadErrc::PayloadTooLarge,
                    std::format("file size {} exceeds the maximum of {} bytes",
                                req.total_size, upload_cfg_.max_file_size));
    }
    if (!mime_allowed(upload_cfg_.allowed_mime_types, req.mime_type)) {
        return fail(UploadErrc::UnsupportedMediaType,
                    std::format("unsupported media type '{}'", req.mime_type));
    }

    int64_t now = clock_();
    UploadSession s;
    s.upload_id = ids::generate();
    s.filename = req.filename;
    s.total_size = req.total_size;
    s.mime_type = normalize_mime(req.mime_type);
    s.chunk_size = upload_cfg_.chunk_size;
    s.total_chunks = static_cast<int>((req.total_size + s.chunk_size - 1) / s.chunk_size);
    s.status = UploadStatus::Collecting;
    s.created_at = now;
    s.updated_at = now;
    s.expires_at = now + static_cast<int64_t>(upload_cfg_.session_ttl_hours) * kHourMs;
    s.language = req.language;
    s.enable_diarization = req.enable_diarization.value_or(pipeline_cfg_.enable_diarization);
    s.output_formats = req.output_formats.empty() ? pipeline_cfg_.output_formats
                                                  : req.output_formats;

    if (!db_.insert_session(s)) return fail(UploadErrc::StorageError, "could not persist session");

    log(std::format("session {} created: {} ({} bytes, {} chunks)",
                    s.upload_id, s.filename, s.total_size, s.total_chunks));
    return s;
}

std::expected<int, UploadError> UploadManager::put_chunk(const std::string& upload_id, int index,
                                                         std::span<const uint8_t> data) {
    auto session = db_.get_session(upload_id);
    if (!session) return fail(UploadErrc::NotFound, "upload session not found");
    if (session->status != UploadStatus::Collecting)
        return fail(UploadErrc::NotCollecting,
                    std::format("session is {}", to_string(session->status)));
    if (clock_() >= session->expires_at) return fail(UploadErrc::NotCollecting, "session expired");

    if (index < 0 || index >= session->total_chunks) {
        return fail(UploadErrc::InvalidChunkIndex,
                    std::format("chunk index {} outside [0, {})", index, session->total_chunks));
    }

    uint64_t expected = session->expected_chunk_size(index);
    if (data.size() != expected) {
        return fail(UploadErrc::InvalidChunkSize,
                    std::format("chunk {} has {} bytes, expected {}", index, data.size(), expected));
    }

    if (auto r = store_.put_chunk(upload_id, index, data); !r) {
        std::println(stderr, "upload: chunk {} of {}: {}", index, upload_id, r.error());
        return fail(UploadErrc::StorageError, "chunk could not be stored");
    }

    if (!db_.record_chunk(upload_id, index, data.size(), clock_())) {
        auto now_session = db_.get_session(upload_id);
        if (now_session && now_session->status != UploadStatus::Collecting)
            return fail(UploadErrc::NotCollecting,
                        std::format("session is {}", to_string(now_session->status)));
        return fail(UploadErrc::StorageError, "chunk could not be recorded");
    }

    session->received_chunks.insert(index);
    return static_cast<int>(session->received_chunks.size());
}

std::expected<UploadStatusReport, UploadError>
UploadManager::get_status(const std::string& upload_id) {
    auto session = db_.get_session(upload_id);
    if (!session) return fail(UploadErrc::NotFound, "upload session not found");

    UploadStatusReport r;
    r.upload_id = session->upload_id;
    r.status = session->status;
    r.chunk_size = session->chunk_size;
    r.total_chunks = session->total_chunks;
    r.received_chunks.assign(session->received_chunks.begin(), session->received_chunks.end());
    r.total_size = session->total_size;
    r.bytes_received = session->bytes_received;
    r.created_at = session->created_at;
    r.expires_at = session->expires_at;
    r.job_id = session->job_id;
    if (session->status == UploadStatus::Completed) {
        r.progress = 100.0;
    } else if (session->total_chunks > 0) {
        r.progress = 100.0 * static_cast<double>(session->received_chunks.size()) /
                     static_cast<double>(session->total_chunks);
    }
    return r;
}

std::expected<std::string, UploadError>
UploadManager::complete(const std::string& upload_id, const std::string& declared_sha256) {
    auto session = db_.get_session(upload_id);
    if (!session) return fail(UploadErrc::NotFound, "upload session not found");

    // A repeated completion after success reports the same job
    if (session->status == UploadStatus::Completed) return session->job_id;
    if (session->status != UploadStatus::Collecting)
        return fail(UploadErrc::NotCollecting,
                    std::format("session is {}", to_string(session->status)));

    if (!session->all_chunks_received()) {
        std::string missing;
        int listed = 0;
        for (int i = 0; i < session->total_chunks && listed < 10; ++i) {
            if (session->received_chunks.contains(i)) continue;
            missing += (listed++ ? ", " : "") + std::to_string(i);
        }
        int missing_count = session->total_chunks - static_cast<int>(session->received_chunks.size());
        return fail(UploadErrc::IncompleteUpload,
                    std::format("{} of {} chunks missing (first: {})", missing_count,
                                session->total_chunks, missing));
    }

    int64_t now = clock_();
    if (!db_.transition_session(upload_id, UploadStatus::Collecting, UploadStatus::Finalizing, now))
        return fail(UploadErrc::NotCollecting, "session is already being finalized");

    auto back_to_collecting = [&] {
        if (!db_.transition_session(upload_id, UploadStatus::Finalizing,
                                    UploadStatus::Collecting, clock_()))
            std::println(stderr, "upload: could not reopen session {}", upload_id);
    };

    std::string job_id = ids::generate();
    std::string source_ref = ChunkStore::blob_ref(job_id, "source");

    auto assembled = store_.assemble(upload_id, session->total_chunks, source_ref);
    if (!assembled) {
        std::println(stderr, "upload: assemble {}: {}", upload_id, assembled.error());
        store_.remove_job_blobs(job_id);
        back_to_collecting();
        return fail(UploadErrc::StorageError, "upload could not be assembled");
    }

    if (assembled->size != session->total_size || declared_sha256.empty() ||
        !hashing::digest_equal(assembled->sha256, declared_sha256)) {
        store_.remove_job_blobs(job_id);
        back_to_collecting();
        if (declared_sha256.empty())
            return fail(UploadErrc::IntegrityMismatch, "no content hash declared");
        return fail(UploadErrc::IntegrityMismatch,
                    std::format("sha256 of assembled file is {}", assembled->sha256));
    }

    TranscriptionJob job;
    job.id = job_id;
    job.upload_id = upload_id;
    job.filename = session->filename;
    job.total_size = session->total_size;
    job.mime_type = session->mime_type;
    job.stage = Stage::Validating;
    job.status = JobStatus::Pending;
    job.max_retries = static_cast<int>(pipeline_cfg_.max_job_retries);
    job.created_at = now;
    job.updated_at = now;
    job.language_hint = session->language;
    job.enable_diarization = session->enable_diarization;
    job.output_formats = session->output_formats;
    job.source_ref = source_ref;

    if (!db_.complete_session_with_job(upload_id, job, clock_())) {
        store_.remove_job_blobs(job_id);
        back_to_collecting();
        return fail(UploadErrc::StorageError, "job could not be created");
    }

    store_.remove_upload(upload_id);
    log(std::format("upload {} complete, job {} queued", upload_id, job_id));
    return job_id;
}

std::expected<void, UploadError> UploadManager::abort(const std::string& upload_id) {
    auto session = db_.get_session(upload_id);
    if (!session) return fail(UploadErrc::NotFound, "upload session not found");

    switch (session->status) {
        case UploadStatus::Aborted:
        case UploadStatus::Expired:
            store_.remove_upload(upload_id);
            return {};
        case UploadStatus::Completed:
        case UploadStatus::Finalizing:
            return fail(UploadErrc::NotCollecting,
                        std::format("session is {}", to_string(session->status)));
        case UploadStatus::Collecting:
            break;
    }

    if (!db_.transition_session(upload_id, UploadStatus::Collecting, UploadStatus::Aborted,
                                clock_())) {
        auto again = db_.get_session(upload_id);
        if (!again || again->status != UploadStatus::Aborted)
            return fail(UploadErrc::NotCollecting, "session changed state during abort");
    }

    store_.remove_upload(upload_id);
    if (!db_.clear_chunks(upload_id))
        std::println(stderr, "upload: could not clear chunk records of {}", upload_id);
    log(std::format("upload {} aborted", upload_id));
    return {};
}

int UploadManager::reclaim_expired() {
    int reclaimed = 0;
    int64_t now = clock_();

    for (const auto& id : db_.expired_sessions(now)) {
        auto session = db_.get_session(id);
        if (!session) continue;
        if (!db_.transition_session(id, session->status, UploadStatus::Expired, now)) continue;
        store_.remove_upload(id);
        if (!db_.clear_chunks(id))
            std::println(stderr, "upload: could not clear chunk records of {}", id);
        ++reclaimed;
        log(std::format("upload {} expired", id));
    }

    for (const auto& id : store_.upload_ids()) {
        if (db_.session_is_live(id)) continue;
        store_.remove_upload(id);
        log(std::format("removed orphaned chunks of {}", id));
    }

    return reclaimed;
}

int UploadManager::recover_interrupted() {
    int reopened = db_.reopen_finalizing(clock_());
    if (reopened > 0) log(std::format("reopened {} interrupted upload(s)", reopened));

    for (const auto& id : store_.job_ids()) {
        if (db_.has_job(id)) continue;
        store_.remove_job_blobs(id);
        log(std::format("removed blobs of unrecorded job {}", id));
    }
    return reopened;
}

void UploadManager::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
