#include "storage/job_db.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return stmt_ != nullptr; }

    void bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_optional(int idx, const std::optional<std::string>& v) {
        if (v) bind_text(idx, *v);
        else sqlite3_bind_null(stmt_, idx);
    }
    void bind_int(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind_real(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        auto* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    std::optional<std::string> optional_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Column order shared by every job read and write below.
constexpr const char* kJobColumns =
    "id, upload_id, filename, total_size, mime_type, stage, failed_stage, status, error, "
    "retry_count, max_retries, created_at, updated_at, started_at, completed_at, "
    "language_hint, enable_diarization, output_formats, source_ref, normalized_ref, "
    "audio_duration, segments, detected_language, language_confidence, merged_transcript, "
    "diarized_transcript, speaker_count, word_count, outputs, warnings, stage_durations, "
    "rate_limited_events, transient_error_events, owner, lease_expires_at, cancel_requested";

constexpr const char* kInsertJob =
    "INSERT INTO jobs (id, upload_id, filename, total_size, mime_type, stage, failed_stage, "
    "status, error, retry_count, max_retries, created_at, updated_at, started_at, completed_at, "
    "language_hint, enable_diarization, output_formats, source_ref, normalized_ref, "
    "audio_duration, segments, detected_language, language_confidence, merged_transcript, "
    "diarized_transcript, speaker_count, word_count, outputs, warnings, stage_durations, "
    "rate_limited_events, transient_error_events, owner, lease_expires_at) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, "
    "?19, ?20, ?21, ?22, ?23, ?24, ?25, ?26, ?27, ?28, ?29, ?30, ?31, ?32, ?33, ?34, ?35)";

constexpr const char* kUpdateJob =
    "UPDATE jobs SET upload_id = ?2, filename = ?3, total_size = ?4, mime_type = ?5, "
    "stage = ?6, failed_stage = ?7, status = ?8, error = ?9, retry_count = ?10, "
    "max_retries = ?11, created_at = ?12, updated_at = ?13, started_at = ?14, "
    "completed_at = ?15, language_hint = ?16, enable_diarization = ?17, output_formats = ?18, "
    "source_ref = ?19, normalized_ref = ?20, audio_duration = ?21, segments = ?22, "
    "detected_language = ?23, language_confidence = ?24, merged_transcript = ?25, "
    "diarized_transcript = ?26, speaker_count = ?27, word_count = ?28, outputs = ?29, "
    "warnings = ?30, stage_durations = ?31, rate_limited_events = ?32, "
    "transient_error_events = ?33, owner = ?34, lease_expires_at = ?35 "
    "WHERE id = ?1 AND owner = ?36";

json segments_to_json(const std::vector<Segment>& segments) {
    json arr = json::array();
    for (const auto& s : segments) {
        json cues = json::array();
        for (const auto& c : s.cues)
            cues.push_back({{"start", c.start}, {"end", c.end}, {"text", c.text}});
        arr.push_back({
            {"index", s.index},
            {"start", s.start_offset},
            {"end", s.end_offset},
            {"ref", s.storage_ref},
            {"text", s.transcript_text},
            {"status", std::string(to_string(s.status))},
            {"cues", std::move(cues)},
        });
    }
    return arr;
}

std::vector<Segment> segments_from_json(const std::string& text) {
    std::vector<Segment> out;
    auto arr = json::parse(text, nullptr, false);
    if (!arr.is_array()) return out;
    for (const auto& j : arr) {
        Segment s;
        s.index = j.value("index", 0);
        s.start_offset = j.value("start", 0.0);
        s.end_offset = j.value("end", 0.0);
        s.storage_ref = j.value("ref", "");
        s.transcript_text = j.value("text", "");
        s.status = segment_status_from_string(j.value("status", "pending"))
                       .value_or(SegmentStatus::Pending);
        if (j.contains("cues") && j["cues"].is_array()) {
            for (const auto& c : j["cues"])
                s.cues.push_back({c.value("start", 0.0), c.value("end", 0.0), c.value("text", "")});
        }
        out.push_back(std::move(s));
    }
    return out;
}

template <typename T>
T parse_column(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return T{};
    try {
        return j.template get<T>();
    } catch (const json::exception& e) {
        std::println(stderr, "db: bad column value: {}", e.what());
        return T{};
    }
}

void bind_job(Statement& st, const TranscriptionJob& job) {
    st.bind_text(1, job.id);
    st.bind_text(2, job.upload_id);
    st.bind_text(3, job.filename);
    st.bind_int(4, static_cast<int64_t>(job.total_size));
    st.bind_text(5, job.mime_type);
    st.bind_text(6, std::string(to_string(job.stage)));
    st.bind_text(7, std::string(to_string(job.failed_stage)));
    st.bind_text(8, std::string(to_string(job.status)));
    st.bind_text(9, job.error);
    st.bind_int(10, job.retry_count);
    st.bind_int(11, job.max_retries);
    st.bind_int(12, job.created_at);
    st.bind_int(13, job.updated_at);
    st.bind_int(14, job.started_at);
    st.bind_int(15, job.completed_at);
    st.bind_optional(16, job.language_hint);
    st.bind_int(17, job.enable_diarization ? 1 : 0);
    st.bind_text(18, json(job.output_formats).dump());
    st.bind_text(19, job.source_ref);
    st.bind_text(20, job.normalized_ref);
    st.bind_real(21, job.audio_duration_seconds);
    st.bind_text(22, segments_to_json(job.segments).dump());
    st.bind_optional(23, job.detected_language);
    st.bind_real(24, job.language_confidence);
    st.bind_text(25, job.merged_transcript);
    st.bind_text(26, job.diarized_transcript);
    st.bind_int(27, job.speaker_count);
    st.bind_int(28, job.word_count);
    st.bind_text(29, json(job.outputs).dump());
    st.bind_text(30, json(job.warnings).dump());
    st.bind_text(31, json(job.stage_durations).dump());
    st.bind_int(32, job.rate_limited_events);
    st.bind_int(33, job.transient_error_events);
    st.bind_text(34, job.owner);
    st.bind_int(35, job.lease_expires_at);
}

TranscriptionJob job_from_row(const Statement& st) {
    TranscriptionJob job;
    job.id = st.text(0);
    job.upload_id = st.text(1);
    job.filename = st.text(2);
    job.total_size = static_cast<uint64_t>(st.int64(3));
    job.mime_type = st.text(4);
    job.stage = stage_from_string(st.text(5)).value_or(Stage::Failed);
    job.failed_stage = stage_from_string(st.text(6)).value_or(Stage::Created);
    job.status = job_status_from_string(st.text(7)).value_or(JobStatus::Failed);
    job.error = st.text(8);
    job.retry_count = static_cast<int>(st.int64(9));
    job.max_retries = static_cast<int>(st.int64(10));
    job.created_at = st.int64(11);
    job.updated_at = st.int64(12);
    job.started_at = st.int64(13);
    job.completed_at = st.int64(14);
    job.language_hint = st.optional_text(15);
    job.enable_diarization = st.int64(16) != 0;
    job.output_formats = parse_column<std::vector<std::string>>(st.text(17));
    job.source_ref = st.text(18);
    job.normalized_ref = st.text(19);
    job.audio_duration_seconds = st.real(20);
    job.segments = segments_from_json(st.text(21));
    job.detected_language = st.optional_text(22);
    job.language_confidence = st.real(23);
    job.merged_transcript = st.text(24);
    job.diarized_transcript = st.text(25);
    job.speaker_count = static_cast<int>(st.int64(26));
    job.word_count = static_cast<int>(st.int64(27));
    job.outputs = parse_column<std::map<std::string, std::string>>(st.text(28));
    job.warnings = parse_column<std::vector<std::string>>(st.text(29));
    job.stage_durations = parse_column<std::map<std::string, double>>(st.text(30));
    job.rate_limited_events = static_cast<int>(st.int64(31));
    job.transient_error_events = static_cast<int>(st.int64(32));
    job.owner = st.text(33);
    job.lease_expires_at = st.int64(34);
    job.cancel_requested = st.int64(35) != 0;
    return job;
}

} // namespace

JobDb::JobDb() = default;

JobDb::~JobDb() {
    close();
}

bool JobDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Other connections (another daemon, the tests) may hold the write lock briefly
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");

    return create_tables();
}

void JobDb::close() {
    std::lock_guard lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool JobDb::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: {} failed: {}", sql, err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool JobDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            upload_id TEXT PRIMARY KEY,
            filename TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            mime_type TEXT NOT NULL,
            chunk_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            status TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            language TEXT,
            enable_diarization INTEGER NOT NULL DEFAULT 1,
            output_formats TEXT NOT NULL DEFAULT '[]',
            job_id TEXT NOT NULL DEFAULT ''
        );
        CREATE TABLE IF NOT EXISTS upload_chunks (
            upload_id TEXT NOT NULL REFERENCES upload_sessions(upload_id) ON DELETE CASCADE,
            idx INTEGER NOT NULL,
            size INTEGER NOT NULL,
            received_at INTEGER NOT NULL,
            PRIMARY KEY (upload_id, idx)
        );
        CREATE TABLE IF NOT EXISTS jobs (
            id TEXT PRIMARY KEY,
            upload_id TEXT NOT NULL,
            filename TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            mime_type TEXT NOT NULL,
            stage TEXT NOT NULL,
            failed_stage TEXT NOT NULL,
            status TEXT NOT NULL,
            error TEXT NOT NULL DEFAULT '',
            retry_count INTEGER NOT NULL DEFAULT 0,
            max_retries INTEGER NOT NULL DEFAULT 3,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            started_at INTEGER NOT NULL DEFAULT 0,
            completed_at INTEGER NOT NULL DEFAULT 0,
            language_hint TEXT,
            enable_diarization INTEGER NOT NULL DEFAULT 1,
            output_formats TEXT NOT NULL DEFAULT '[]',
            source_ref TEXT NOT NULL DEFAULT '',
            normalized_ref TEXT NOT NULL DEFAULT '',
            audio_duration REAL NOT NULL DEFAULT 0,
            segments TEXT NOT NULL DEFAULT '[]',
            detected_language TEXT,
            language_confidence REAL NOT NULL DEFAULT 0,
            merged_transcript TEXT NOT NULL DEFAULT '',
            diarized_transcript TEXT NOT NULL DEFAULT '',
            speaker_count INTEGER NOT NULL DEFAULT 0,
            word_count INTEGER NOT NULL DEFAULT 0,
            outputs TEXT NOT NULL DEFAULT '{}',
            warnings TEXT NOT NULL DEFAULT '[]',
            stage_durations TEXT NOT NULL DEFAULT '{}',
            rate_limited_events INTEGER NOT NULL DEFAULT 0,
            transient_error_events INTEGER NOT NULL DEFAULT 0,
            owner TEXT NOT NULL DEFAULT '',
            lease_expires_at INTEGER NOT NULL DEFAULT 0,
            cancel_requested INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS jobs_status_created ON jobs (status, created_at);
    )";
    return exec(sql);
}

// --- Upload sessions ---

bool JobDb::insert_session(const UploadSession& s) {
    std::lock_guard lock(mutex_);
    Statement st(db_,
                 "INSERT INTO upload_sessions (upload_id, filename, total_size, mime_type, "
                 "chunk_size, total_chunks, status, created_at, updated_at, expires_at, "
                 "language, enable_diarization, output_formats) "
                 "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)");
    if (!st) return false;

    st.bind_text(1, s.upload_id);
    st.bind_text(2, s.filename);
    st.bind_int(3, static_cast<int64_t>(s.total_size));
    st.bind_text(4, s.mime_type);
    st.bind_int(5, static_cast<int64_t>(s.chunk_size));
    st.bind_int(6, s.total_chunks);
    st.bind_text(7, std::string(to_string(s.status)));
    st.bind_int(8, s.created_at);
    st.bind_int(9, s.updated_at);
    st.bind_int(10, s.expires_at);
    st.bind_optional(11, s.language);
    st.bind_int(12, s.enable_diarization ? 1 : 0);
    st.bind_text(13, json(s.output_formats).dump());

    if (st.step() != SQLITE_DONE) {
        std::println(stderr, "db: insert session failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<UploadSession> JobDb::get_session(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    UploadSession s;
    {
        Statement st(db_,
                     "SELECT upload_id, filename, total_size, mime_type, chunk_size, "
                     "total_chunks, status, created_at, updated_at, expires_at, language, "
                     "enable_diarization, output_formats, job_id "
                     "FROM upload_sessions WHERE upload_id = ?1");
        if (!st) return std::nullopt;
        st.bind_text(1, upload_id);
        if (st.step() != SQLITE_ROW) return std::nullopt;

        s.upload_id = st.text(0);
        s.filename = st.text(1);
        s.total_size = static_cast<uint64_t>(st.int64(2));
        s.mime_type = st.text(3);
        s.chunk_size = static_cast<uint64_t>(st.int64(4));
        s.total_chunks = static_cast<int>(st.int64(5));
        s.status = upload_status_from_string(st.text(6)).value_or(UploadStatus::Aborted);
        s.created_at = st.int64(7);
        s.updated_at = st.int64(8);
        s.expires_at = st.int64(9);
        s.language = st.optional_text(10);
        s.enable_diarization = st.int64(11) != 0;
        s.output_formats = parse_column<std::vector<std::string>>(st.text(12));
        s.job_id = st.text(13);
    }

    Statement chunks(db_, "SELECT idx, size FROM upload_chunks WHERE upload_id = ?1");
    if (!chunks) return std::nullopt;
    chunks.bind_text(1, upload_id);
    while (chunks.step() == SQLITE_ROW) {
        s.received_chunks.insert(static_cast<int>(chunks.int64(0)));
        s.bytes_received += static_cast<uint64_t>(chunks.int64(1));
    }
    return s;
}

bool JobDb::record_chunk(const std::string& upload_id, int index, uint64_t size, int64_t now) {
    std::lock_guard lock(mutex_);
    Statement st(db_,
                 "INSERT OR REPLACE INTO upload_chunks (upload_id, idx, size, received_at) "
                 "SELECT ?1, ?2, ?3, ?4 WHERE EXISTS ("
                 "SELECT 1 FROM upload_sessions WHERE upload_id = ?1 AND status = 'collecting')");
    if (!st) return false;
    st.bind_text(1, upload_id);
    st.bind_int(2, index);
    st.bind_int(3, static_cast<int64_t>(size));
    st.bind_int(4, now);
    if (st.step() != SQLITE_DONE) {
        std::println(stderr, "db: record chunk failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_changes(db_) == 0) return false;

    Statement touch(db_, "UPDATE upload_sessions SET updated_at = ?2 WHERE upload_id = ?1");
    if (!touch) return false;
    touch.bind_text(1, upload_id);
    touch.bind_int(2, now);
    return touch.step() == SQLITE_DONE;
}

bool JobDb::clear_chunks(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "DELETE FROM upload_chunks WHERE upload_id = ?1");
    if (!st) return false;
    st.bind_text(1, upload_id);
    return st.step() == SQLITE_DONE;
}

bool JobDb::transition_session(const std::string& upload_id, UploadStatus from,
                               UploadStatus to, int64_t now) {
    std::lock_guard lock(mutex_);
    Statement st(db_,
                 "UPDATE upload_sessions SET status = ?3, updated_at = ?4 "
                 "WHERE upload_id = ?1 AND status = ?2");
    if (!st) return false;
    st.bind_text(1, upload_id);
    st.bind_text(2, std::string(to_string(from)));
    st.bind_text(3, std::string(to_string(to)));
    st.bind_int(4, now);
    if (st.step() != SQLITE_DONE) {
        std::println(stderr, "db: session transition failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) == 1;
}

std::vector<std::string> JobDb::expired_sessions(int64_t now) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    Statement st(db_,
                 "SELECT upload_id FROM upload_sessions "
                 "WHERE status IN ('collecting', 'finalizing') AND expires_at <= ?1");
    if (!st) return ids;
    st.bind_int(1, now);
    while (st.step() == SQLITE_ROW) ids.push_back(st.text(0));
    return ids;
}

int JobDb::reopen_finalizing(int64_t now) {
    std::lock_guard lock(mutex_);
    Statement st(db_,
                 "UPDATE upload_sessions SET status = 'collecting', updated_at = ?1 "
                 "WHERE status = 'finalizing'");
    if (!st) return 0;
    st.bind_int(1, now);
    if (st.step() != SQLITE_DONE) {
        std::println(stderr, "db: reopening sessions failed: {}", sqlite3_errmsg(db_));
        return 0;
    }
    return sqlite3_changes(db_);
}

bool JobDb::session_is_live(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_,
                 "SELECT 1 FROM upload_sessions "
                 "WHERE upload_id = ?1 AND status IN ('collecting', 'finalizing')");
    if (!st) return true; // unknown: keep the chunks
    st.bind_text(1, upload_id);
    return st.step() == SQLITE_ROW;
}

bool JobDb::complete_session_with_job(const std::string& upload_id, const TranscriptionJob& job,
                                      int64_t now) {
    std::lock_guard lock(mutex_);
    if (!exec("BEGIN IMMEDIATE")) return false;

    auto rollback = [this] {
        exec("ROLLBACK");
        return false;
    };

    {
        Statement st(db_,
                     "UPDATE upload_sessions SET status = 'completed', job_id = ?2, "
                     "updated_at = ?3 WHERE upload_id = ?1 AND status = 'finalizing'");
        if (!st) return rollback();
        st.bind_text(1, upload_id);
        st.bind_text(2, job.id);
        st.bind_int(3, now);
        if (st.step() != SQLITE_DONE || sqlite3_changes(db_) != 1) return rollback();
    }

    if (!write_job(kInsertJob, job, nullptr)) return rollback();

    {
        Statement st(db_, "DELETE FROM upload_chunks WHERE upload_id = ?1");
        if (!st) return rollback();
        st.bind_text(1, upload_id);
        if (st.step() != SQLITE_DONE) return rollback();
    }

    return exec("COMMIT") || rollback();
}

// --- Jobs ---

bool JobDb::write_job(const char* sql, const TranscriptionJob& job,
                      const std::string* expected_owner) {
    Statement st(db_, sql);
    if (!st) return false;
    bind_job(st, job);
    if (expected_owner) st.bind_text(36, *expected_owner);
    if (st.step() != SQLITE_DONE) {
        std::println(stderr, "db: write job {} failed: {}", job.id, sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) == 1;
}

bool JobDb::insert_job(const TranscriptionJob& job) {
    std::lock_guard lock(mutex_);
    return write_job(kInsertJob, job, nullptr);
}

std::optional<TranscriptionJob> JobDb::get_job(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    auto sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?1";
    Statement st(db_, sql.c_str());
    if (!st) return std::nullopt;
    st.bind_text(1, job_id);
    if (st.step() != SQLITE_ROW) return std::nullopt;
    return job_from_row(st);
}

bool JobDb::has_job(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "SELECT 1 FROM jobs WHERE id = ?1");
    if (!st) return true; // unknown: keep the blobs
    st.bind_text(1, job_id);
    return st.step() == SQLITE_ROW;
}

std::optional<TranscriptionJob> JobDb::claim_next(const std::string& owner, int64_t now,
                                                  int64_t lease_ms) {
    std::lock_guard lock(mutex_);
    if (!exec("BEGIN IMMEDIATE")) return std::nullopt;

    std::string id;
    {
        Statement st(db_,
                     "SELECT id FROM jobs WHERE status IN ('pending', 'retrying') "
                     "OR (status = 'running' AND lease_expires_at < ?1) "
                     "ORDER BY created_at, rowid LIMIT 1");
        if (!st) {
            exec("ROLLBACK");
            return std::nullopt;
        }
        st.bind_int(1, now);
        if (st.step() == SQLITE_ROW) id = st.text(0);
    }

    if (id.empty()) {
        exec("COMMIT");
        return std::nullopt;
    }

    {
        Statement st(db_,
                     "UPDATE jobs SET status = 'running', owner = ?2, lease_expires_at = ?3, "
                     "updated_at = ?4, "
                     "started_at = CASE WHEN started_at = 0 THEN ?4 ELSE started_at END "
                     "WHERE id = ?1");
        if (!st) {
            exec("ROLLBACK");
            return std::nullopt;
        }
        st.bind_text(1, id);
        st.bind_text(2, owner);
        st.bind_int(3, now + lease_ms);
        st.bind_int(4, now);
        if (st.step() != SQLITE_DONE) {
            std::println(stderr, "db: claim failed: {}", sqlite3_errmsg(db_));
            exec("ROLLBACK");
            return std::nullopt;
        }
    }

    if (!exec("COMMIT")) {
        exec("ROLLBACK");
        return std::nullopt;
    }
    return get_job(id);
}

bool JobDb::save_job(const TranscriptionJob& job, const std::string& expected_owner) {
    std::lock_guard lock(mutex_);
    return write_job(kUpdateJob, job, &expected_owner);
}

bool JobDb::renew_lease(const std::string& job_id, const std::string& owner, int64_t expires_at) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "UPDATE jobs SET lease_expires_at = ?3 WHERE id = ?1 AND owner = ?2");
    if (!st) return false;
    st.bind_text(1, job_id);
    st.bind_text(2, owner);
    st.bind_int(3, expires_at);
    return st.step() == SQLITE_DONE && sqlite3_changes(db_) == 1;
}

int JobDb::requeue_running() {
    std::lock_guard lock(mutex_);
    if (!exec("UPDATE jobs SET status = 'pending', owner = '', lease_expires_at = 0 "
              "WHERE status = 'running'"))
        return 0;
    return sqlite3_changes(db_);
}

bool JobDb::request_cancel(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_,
                 "UPDATE jobs SET cancel_requested = 1 "
                 "WHERE id = ?1 AND status NOT IN ('complete', 'failed')");
    if (!st) return false;
    st.bind_text(1, job_id);
    return st.step() == SQLITE_DONE && sqlite3_changes(db_) == 1;
}

bool JobDb::clear_cancel(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "UPDATE jobs SET cancel_requested = 0 WHERE id = ?1");
    if (!st) return false;
    st.bind_text(1, job_id);
    return st.step() == SQLITE_DONE;
}

bool JobDb::is_cancel_requested(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "SELECT cancel_requested FROM jobs WHERE id = ?1");
    if (!st) return false;
    st.bind_text(1, job_id);
    return st.step() == SQLITE_ROW && st.int64(0) != 0;
}

std::vector<TranscriptionJob> JobDb::query_jobs(const char* sql, const std::string* arg,
                                                int limit) {
    std::vector<TranscriptionJob> jobs;
    Statement st(db_, sql);
    if (!st) return jobs;
    int idx = 1;
    if (arg) st.bind_text(idx++, *arg);
    st.bind_int(idx, limit);
    while (st.step() == SQLITE_ROW) jobs.push_back(job_from_row(st));
    return jobs;
}

std::vector<TranscriptionJob> JobDb::list_jobs(std::optional<JobStatus> status, int limit) {
    std::lock_guard lock(mutex_);
    auto base = std::string("SELECT ") + kJobColumns + " FROM jobs ";
    if (status) {
        auto sql = base + "WHERE status = ?1 ORDER BY created_at DESC, rowid DESC LIMIT ?2";
        std::string s(to_string(*status));
        return query_jobs(sql.c_str(), &s, limit);
    }
    auto sql = base + "ORDER BY created_at DESC, rowid DESC LIMIT ?1";
    return query_jobs(sql.c_str(), nullptr, limit);
}

std::map<std::string, int> JobDb::count_by_status() {
    std::lock_guard lock(mutex_);
    std::map<std::string, int> counts;
    for (auto s : {JobStatus::Pending, JobStatus::Running, JobStatus::Retrying,
                   JobStatus::Failed, JobStatus::Complete})
        counts[std::string(to_string(s))] = 0;

    Statement st(db_, "SELECT status, COUNT(*) FROM jobs GROUP BY status");
    if (!st) return counts;
    while (st.step() == SQLITE_ROW) counts[st.text(0)] = static_cast<int>(st.int64(1));
    return counts;
}
