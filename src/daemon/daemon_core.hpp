#pragma once

#include "audio/media_toolkit.hpp"
#include "config.hpp"
#include "pipeline/diarizer.hpp"
#include "pipeline/job_runner.hpp"
#include "provider/provider.hpp"
#include "storage/chunk_store.hpp"
#include "storage/job_db.hpp"
#include "upload/upload_manager.hpp"
#include "util/sleeper.hpp"
#include "worker/worker_pool.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// Owns the stores and the worker pool and answers IPC commands. Nothing here
// is Linux specific; the event loop feeds it parsed commands.
class DaemonCore {
public:
    // A null provider or media toolkit is built from the configuration in init().
    DaemonCore(Config config, bool verbose,
               std::unique_ptr<TranscriptionProvider> provider = nullptr,
               std::unique_ptr<MediaToolkit> media = nullptr);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init(bool start_workers = true);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Expires stale upload sessions; returns how many were expired.
    int reclaim();

    void shutdown();

    const std::string& data_dir() const { return data_dir_; }

private:
    nlohmann::json handle_create_session(const nlohmann::json& cmd);
    nlohmann::json handle_put_chunk(const nlohmann::json& cmd);
    nlohmann::json handle_upload_status(const nlohmann::json& cmd);
    nlohmann::json handle_complete(const nlohmann::json& cmd);
    nlohmann::json handle_abort(const nlohmann::json& cmd);
    nlohmann::json handle_job_status(const nlohmann::json& cmd);
    nlohmann::json handle_job_outputs(const nlohmann::json& cmd);
    nlohmann::json handle_cancel_job(const nlohmann::json& cmd);
    nlohmann::json handle_retry_job(const nlohmann::json& cmd);
    nlohmann::json handle_list_jobs(const nlohmann::json& cmd);
    nlohmann::json handle_queue_status(const nlohmann::json& cmd);
    nlohmann::json handle_health(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    std::string data_dir_;

    JobDb db_;
    std::unique_ptr<ChunkStore> store_;
    std::unique_ptr<TranscriptionProvider> provider_;
    std::unique_ptr<MediaToolkit> media_;
    HeuristicDiarizer diarizer_;
    Sleeper sleeper_;

    std::unique_ptr<UploadManager> uploads_;
    std::unique_ptr<JobRunner> runner_;
    std::unique_ptr<WorkerPool> pool_;
};
