#pragma once

#include "pipeline/job.hpp"
#include "upload/upload_session.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

// Durable records for upload sessions and transcription jobs.
//
// Every state change that other parties may race on is a guarded update:
// session transitions compare the current status, job writes compare the
// current owner. A write whose guard fails changes nothing and returns false.
class JobDb {
public:
    JobDb();
    ~JobDb();

    JobDb(const JobDb&) = delete;
    JobDb& operator=(const JobDb&) = delete;

    bool open(const std::string& path);
    void close();

    // Upload sessions
    bool insert_session(const UploadSession& session);
    std::optional<UploadSession> get_session(const std::string& upload_id);
    bool record_chunk(const std::string& upload_id, int index, uint64_t size, int64_t now);
    bool clear_chunks(const std::string& upload_id);
    bool transition_session(const std::string& upload_id, UploadStatus from, UploadStatus to,
                            int64_t now);
    std::vector<std::string> expired_sessions(int64_t now);
    bool session_is_live(const std::string& upload_id);

    // Returns sessions a previous process left mid-completion to collecting.
    int reopen_finalizing(int64_t now);

    // Moves a finalizing session to completed and inserts its job atomically.
    bool complete_session_with_job(const std::string& upload_id, const TranscriptionJob& job,
                                   int64_t now);

    // Jobs
    bool insert_job(const TranscriptionJob& job);
    std::optional<TranscriptionJob> get_job(const std::string& job_id);
    bool has_job(const std::string& job_id);

    // Claims the oldest pending or retrying job, or a running job whose lease
    // has expired, for `owner`.
    std::optional<TranscriptionJob> claim_next(const std::string& owner, int64_t now,
                                               int64_t lease_ms);

    // Writes the whole record when the stored owner equals `expected_owner`.
    // The job's own owner field is written too, so clearing it releases the job.
    // cancel_requested is never written here.
    bool save_job(const TranscriptionJob& job, const std::string& expected_owner);

    // Extends the lease while `owner` still holds the job.
    bool renew_lease(const std::string& job_id, const std::string& owner, int64_t expires_at);

    // Returns jobs left running by a previous process to the queue.
    int requeue_running();

    bool request_cancel(const std::string& job_id);
    bool clear_cancel(const std::string& job_id);
    bool is_cancel_requested(const std::string& job_id);

    std::vector<TranscriptionJob> list_jobs(std::optional<JobStatus> status, int limit);
    std::map<std::string, int> count_by_status();

private:
    bool create_tables();
    bool exec(const char* sql);
    bool write_job(const char* sql, const TranscriptionJob& job,
                   const std::string* expected_owner);
    std::vector<TranscriptionJob> query_jobs(const char* sql, const std::string* arg, int limit);

    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
};
