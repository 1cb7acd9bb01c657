#include "daemon_core.hpp"

#include "audio/ffmpeg_toolkit.hpp"
#include "audio/native_wav_toolkit.hpp"
#include "common/base64.hpp"
#include "output/output.hpp"
#include "platform/platform_paths.hpp"
#include "provider/http_provider.hpp"
#include "util/clock.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

// Health turns degraded past these queue sizes.
constexpr int kDegradedFailedJobs = 10;
constexpr int kDegradedQueuedJobs = 50;

json error_response(const std::string& code, const std::string& message) {
    return {{"status", "error"}, {"code", code}, {"message", message}};
}

json error_response(const UploadError& e) {
    return error_response(std::string(to_string(e.code)), e.message);
}

json not_found(const std::string& what) {
    return error_response("NOT_FOUND", what + " not found");
}

// Progress inside the current stage; only transcription is divisible.
double stage_progress(const TranscriptionJob& job) {
    if (job.status == JobStatus::Complete) return 1.0;
    if (job.stage == Stage::Transcribing) return job.progress();
    return 0.0;
}

json job_summary(const TranscriptionJob& job) {
    return {
        {"job_id", job.id},
        {"filename", job.filename},
        {"stage", std::string(to_string(job.stage))},
        {"job_status", std::string(to_string(job.status))},
        {"progress", job.progress()},
        {"error", job.error},
        {"created_at", format_iso8601(job.created_at)},
    };
}

json job_detail(const TranscriptionJob& job) {
    json j = job_summary(job);
    j["upload_id"] = job.upload_id;
    j["total_size"] = job.total_size;
    j["mime_type"] = job.mime_type;
    j["stage_index"] = static_cast<int>(job.stage == Stage::Failed ? job.failed_stage : job.stage);
    j["stage_count"] = static_cast<int>(Stage::Complete);
    j["stage_progress"] = stage_progress(job);
    if (job.stage == Stage::Failed) j["failed_stage"] = std::string(to_string(job.failed_stage));
    j["segment_count"] = job.segment_count();
    j["segments_done"] = job.done_segments();
    j["retry_count"] = job.retry_count;
    j["max_retries"] = job.max_retries;
    j["audio_duration_seconds"] = job.audio_duration_seconds;
    j["language"] = job.detected_language ? json(*job.detected_language) : json(nullptr);
    j["language_confidence"] = job.language_confidence;
    j["word_count"] = job.word_count;
    j["speaker_count"] = job.speaker_count;
    j["warnings"] = job.warnings;
    j["stage_durations"] = job.stage_durations;
    j["rate_limited_events"] = job.rate_limited_events;
    j["transient_error_events"] = job.transient_error_events;
    j["cancel_requested"] = job.cancel_requested;
    j["updated_at"] = format_iso8601(job.updated_at);
    j["started_at"] = format_iso8601(job.started_at);
    j["completed_at"] = format_iso8601(job.completed_at);

    json formats = json::array();
    for (const auto& [format, ref] : job.outputs) formats.push_back(format);
    j["outputs"] = std::move(formats);
    return j;
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       std::unique_ptr<TranscriptionProvider> provider,
                       std::unique_ptr<MediaToolkit> media)
    : config_(std::move(config)), verbose_(verbose),
      provider_(std::move(provider)), media_(std::move(media)) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(bool start_workers) {
    data_dir_ = config_.storage.data_dir;
    if (data_dir_.empty()) data_dir_ = platform::data_dir();
    if (data_dir_.empty()) data_dir_ = "/tmp/longscribe";

    store_ = std::make_unique<ChunkStore>(data_dir_);
    if (!store_->init()) return false;

    if (!db_.open(data_dir_ + "/longscribe.db")) {
        std::println(stderr, "db: cannot open job database in {}", data_dir_);
        return false;
    }

    if (!provider_) {
        if (config_.provider.type != "http") {
            std::println(stderr, "Unknown provider type: {}", config_.provider.type);
            return false;
        }
        provider_ = std::make_unique<HttpProvider>(config_.provider);
    }

    if (!media_) {
        if (config_.pipeline.media_tool == "native") {
            media_ = std::make_unique<NativeWavToolkit>();
        } else if (config_.pipeline.media_tool == "ffmpeg") {
            media_ = std::make_unique<FfmpegToolkit>();
        } else {
            std::println(stderr, "Unknown media tool: {}", config_.pipeline.media_tool);
            return false;
        }
    }

    uploads_ = std::make_unique<UploadManager>(config_, db_, *store_, verbose_);
    runner_ = std::make_unique<JobRunner>(
        config_, *store_, *media_, *provider_, diarizer_,
        [this](std::chrono::milliseconds d) { sleeper_.sleep_for(d); }, verbose_);
    pool_ = std::make_unique<WorkerPool>(config_, db_, *runner_, sleeper_, verbose_);

    uploads_->recover_interrupted();

    int requeued = db_.requeue_running();
    if (requeued > 0) log(std::format("requeued {} interrupted job(s)", requeued));

    int expired = reclaim();
    if (expired > 0) log(std::format("expired {} stale upload session(s)", expired));

    log(std::format("provider {}, media tool {}, data in {}", provider_->name(), media_->name(),
                    data_dir_));

    if (start_workers && !pool_->start()) {
        std::println(stderr, "worker: pool failed to start");
        return false;
    }
    return true;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (!pool_) return error_response("UNAVAILABLE", "daemon not initialized");

    try {
        if (cmd_str == "create_session") return handle_create_session(cmd);
        if (cmd_str == "put_chunk") return handle_put_chunk(cmd);
        if (cmd_str == "upload_status") return handle_upload_status(cmd);
        if (cmd_str == "complete") return handle_complete(cmd);
        if (cmd_str == "abort") return handle_abort(cmd);
        if (cmd_str == "job_status") return handle_job_status(cmd);
        if (cmd_str == "job_outputs") return handle_job_outputs(cmd);
        if (cmd_str == "cancel_job") return handle_cancel_job(cmd);
        if (cmd_str == "retry_job") return handle_retry_job(cmd);
        if (cmd_str == "list_jobs") return handle_list_jobs(cmd);
        if (cmd_str == "queue_status") return handle_queue_status(cmd);
        if (cmd_str == "reclaim") return {{"status", "ok"}, {"expired", reclaim()}};
        if (cmd_str == "health") return handle_health(cmd);
    } catch (const json::exception& e) {
        return error_response("INVALID_REQUEST", std::string("bad arguments: ") + e.what());
    }
    return error_response("UNKNOWN_COMMAND", "unknown command");
}

json DaemonCore::handle_create_session(const json& cmd) {
    CreateSessionRequest req{
        .filename = cmd.value("filename", ""),
        .total_size = cmd.value("total_size", uint64_t{0}),
        .mime_type = cmd.value("mime_type", ""),
        .language = std::nullopt,
        .enable_diarization = std::nullopt,
        .output_formats = cmd.value("output_formats", std::vector<std::string>{}),
    };
    if (cmd.contains("language") && cmd["language"].is_string())
        req.language = cmd["language"].get<std::string>();
    if (cmd.contains("enable_diarization") && cmd["enable_diarization"].is_boolean())
        req.enable_diarization = cmd["enable_diarization"].get<bool>();

    auto session = uploads_->create_session(req);
    if (!session) return error_response(session.error());

    return {
        {"status", "ok"},
        {"upload_id", session->upload_id},
        {"chunk_size", session->chunk_size},
        {"total_chunks", session->total_chunks},
        {"max_duration_hours", config_.pipeline.max_duration_hours},
        {"expires_at", format_iso8601(session->expires_at)},
    };
}

json DaemonCore::handle_put_chunk(const json& cmd) {
    auto data = base64::decode(cmd.value("data", ""));
    if (!data) return error_response("INVALID_REQUEST", "chunk data is not valid base64");

    auto received = uploads_->put_chunk(cmd.value("upload_id", ""), cmd.value("index", -1), *data);
    if (!received) return error_response(received.error());
    return {{"status", "ok"}, {"chunks_received", *received}};
}

json DaemonCore::handle_upload_status(const json& cmd) {
    auto report = uploads_->get_status(cmd.value("upload_id", ""));
    if (!report) return error_response(report.error());

    json resp = {
        {"status", "ok"},
        {"upload_id", report->upload_id},
        {"upload_status", std::string(to_string(report->status))},
        {"chunk_size", report->chunk_size},
        {"total_chunks", report->total_chunks},
        {"received_chunks", report->received_chunks},
        {"total_size", report->total_size},
        {"bytes_received", report->bytes_received},
        {"progress", report->progress},
        {"created_at", format_iso8601(report->created_at)},
        {"expires_at", format_iso8601(report->expires_at)},
    };
    if (!report->job_id.empty()) resp["job_id"] = report->job_id;
    return resp;
}

json DaemonCore::handle_complete(const json& cmd) {
    auto job_id = uploads_->complete(cmd.value("upload_id", ""), cmd.value("sha256", ""));
    if (!job_id) return error_response(job_id.error());

    pool_->notify();
    return {{"status", "ok"}, {"job_id", *job_id}};
}

json DaemonCore::handle_abort(const json& cmd) {
    auto r = uploads_->abort(cmd.value("upload_id", ""));
    if (!r) return error_response(r.error());
    return {{"status", "ok"}};
}

json DaemonCore::handle_job_status(const json& cmd) {
    auto job = db_.get_job(cmd.value("job_id", ""));
    if (!job) return not_found("job");

    json resp = job_detail(*job);
    resp["status"] = "ok";
    return resp;
}

json DaemonCore::handle_job_outputs(const json& cmd) {
    auto job = db_.get_job(cmd.value("job_id", ""));
    if (!job) return not_found("job");
    if (job->status != JobStatus::Complete)
        return error_response("NOT_READY", std::format("job is {}", to_string(job->status)));

    std::string format = cmd.value("format", "");
    if (format.empty()) {
        json formats = json::array();
        for (const auto& [f, ref] : job->outputs) formats.push_back(f);
        return {{"status", "ok"}, {"formats", formats}, {"transcript", job->merged_transcript}};
    }

    auto it = job->outputs.find(format);
    if (it == job->outputs.end()) return not_found("output format " + format);

    auto blob = store_->read_blob(it->second);
    if (!blob) {
        std::println(stderr, "storage: {}", blob.error());
        return error_response("STORAGE_ERROR", "output could not be read");
    }

    auto renderer = make_renderer(format);
    return {
        {"status", "ok"},
        {"format", format},
        {"content_type", renderer ? std::string(renderer->content_type()) : "text/plain"},
        {"filename", std::format("{}.{}", std::filesystem::path(job->filename).stem().string(),
                                 renderer ? renderer->extension() : std::string_view(format))},
        {"content", std::string(blob->begin(), blob->end())},
    };
}

json DaemonCore::handle_cancel_job(const json& cmd) {
    std::string job_id = cmd.value("job_id", "");
    auto job = db_.get_job(job_id);
    if (!job) return not_found("job");
    if (is_terminal(job->stage) || job->status == JobStatus::Failed ||
        job->status == JobStatus::Complete)
        return error_response("INVALID_STATE", std::format("job is {}", to_string(job->status)));

    if (!db_.request_cancel(job_id))
        return error_response("INVALID_STATE", "job finished before it could be cancelled");

    // An unclaimed job fails right away; a running one stops at its next boundary.
    if (job->owner.empty()) {
        job->failed_stage = job->stage;
        job->stage = Stage::Failed;
        job->status = JobStatus::Failed;
        job->error = "CANCELLED: cancelled by operator";
        job->updated_at = now_ms();
        if (db_.save_job(*job, "")) {
            log(std::format("job {} cancelled", job_id));
            return {{"status", "ok"}, {"job_id", job_id}, {"state", "cancelled"}};
        }
    }

    log(std::format("job {} cancellation requested", job_id));
    return {{"status", "ok"}, {"job_id", job_id}, {"state", "cancelling"}};
}

json DaemonCore::handle_retry_job(const json& cmd) {
    std::string job_id = cmd.value("job_id", "");
    auto job = db_.get_job(job_id);
    if (!job) return not_found("job");
    if (job->status != JobStatus::Failed)
        return error_response("INVALID_STATE",
                              std::format("only failed jobs can be retried, job is {}",
                                          to_string(job->status)));

    Stage from = job->failed_stage;
    std::string from_name = cmd.value("from_stage", "");
    if (!from_name.empty()) {
        auto parsed = stage_from_string(from_name);
        if (!parsed) return error_response("INVALID_REQUEST", "unknown stage " + from_name);
        from = *parsed;
    }

    if (!rewind(*job, from)) {
        return error_response("INVALID_REQUEST",
                              std::format("cannot restart at {}, job failed at {}",
                                          to_string(from), to_string(job->failed_stage)));
    }
    job->updated_at = now_ms();

    if (!db_.clear_cancel(job_id) || !db_.save_job(*job, "")) {
        return error_response("STORAGE_ERROR", "job could not be re-queued");
    }

    pool_->notify();
    log(std::format("job {} re-queued at {}", job_id, to_string(from)));
    return {{"status", "ok"}, {"job_id", job_id}, {"stage", std::string(to_string(from))}};
}

json DaemonCore::handle_list_jobs(const json& cmd) {
    std::optional<JobStatus> filter;
    std::string status = cmd.value("filter", "");
    if (!status.empty()) {
        filter = job_status_from_string(status);
        if (!filter) return error_response("INVALID_REQUEST", "unknown status " + status);
    }
    int limit = std::clamp(cmd.value("limit", 20), 1, 1000);

    json jobs = json::array();
    for (const auto& job : db_.list_jobs(filter, limit)) jobs.push_back(job_summary(job));
    return {{"status", "ok"}, {"jobs", std::move(jobs)}};
}

json DaemonCore::handle_queue_status(const json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"counts", db_.count_by_status()},
        {"workers", {
            {"state", std::string(to_string(pool_->state()))},
            {"size", pool_->size()},
            {"busy", pool_->busy()},
        }},
    };
}

json DaemonCore::handle_health(const json& /*cmd*/) {
    auto counts = db_.count_by_status();
    int queued = counts["pending"] + counts["retrying"];
    int failed = counts["failed"];

    json reasons = json::array();
    if (pool_->state() != WorkerPool::State::Running) reasons.push_back("workers not running");
    if (failed > kDegradedFailedJobs) reasons.push_back(std::format("{} failed jobs", failed));
    if (queued > kDegradedQueuedJobs) reasons.push_back(std::format("{} queued jobs", queued));

    return {
        {"status", "ok"},
        {"health", reasons.empty() ? "healthy" : "degraded"},
        {"reasons", std::move(reasons)},
        {"workers", {
            {"state", std::string(to_string(pool_->state()))},
            {"size", pool_->size()},
            {"busy", pool_->busy()},
        }},
        {"queued", queued},
        {"running", counts["running"]},
        {"failed", failed},
        {"complete", counts["complete"]},
    };
}

int DaemonCore::reclaim() {
    return uploads_ ? uploads_->reclaim_expired() : 0;
}

void DaemonCore::shutdown() {
    if (pool_ && pool_->state() != WorkerPool::State::Stopped) {
        log("stopping workers");
        pool_->stop();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
