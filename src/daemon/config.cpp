#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("upload")) {
            auto& u = j["upload"];
            read_key(u, "chunk_size", cfg.upload.chunk_size);
            read_key(u, "max_file_size", cfg.upload.max_file_size);
            read_key(u, "session_ttl_hours", cfg.upload.session_ttl_hours);
            read_key(u, "reclaim_interval_minutes", cfg.upload.reclaim_interval_minutes);
            read_key(u, "allowed_mime_types", cfg.upload.allowed_mime_types);
        }

        if (j.contains("pipeline")) {
            auto& p = j["pipeline"];
            read_key(p, "segment_seconds", cfg.pipeline.segment_seconds);
            read_key(p, "max_request_bytes", cfg.pipeline.max_request_bytes);
            read_key(p, "max_request_seconds", cfg.pipeline.max_request_seconds);
            read_key(p, "max_duration_hours", cfg.pipeline.max_duration_hours);
            read_key(p, "sample_rate", cfg.pipeline.sample_rate);
            read_key(p, "inter_segment_delay_ms", cfg.pipeline.inter_segment_delay_ms);
            read_key(p, "transcode_attempts", cfg.pipeline.transcode_attempts);
            read_key(p, "transcode_retry_delay_ms", cfg.pipeline.transcode_retry_delay_ms);
            read_key(p, "detect_language_seconds", cfg.pipeline.detect_language_seconds);
            read_key(p, "max_job_retries", cfg.pipeline.max_job_retries);
            read_key(p, "enable_diarization", cfg.pipeline.enable_diarization);
            read_key(p, "media_tool", cfg.pipeline.media_tool);
            read_key(p, "output_formats", cfg.pipeline.output_formats);
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            read_key(r, "max_attempts", cfg.retry.max_attempts);
            read_key(r, "base_delay_ms", cfg.retry.base_delay_ms);
            read_key(r, "max_delay_ms", cfg.retry.max_delay_ms);
            read_key(r, "jitter", cfg.retry.jitter);
        }

        if (j.contains("provider")) {
            auto& p = j["provider"];
            read_key(p, "type", cfg.provider.type);
            read_key(p, "url", cfg.provider.url);
            read_key(p, "api_format", cfg.provider.api_format);
            read_key(p, "model", cfg.provider.model);
            read_key(p, "api_key_env", cfg.provider.api_key_env);
            read_key(p, "timeout_seconds", cfg.provider.timeout_seconds);
            read_key(p, "connect_timeout_seconds", cfg.provider.connect_timeout_seconds);
        }

        if (j.contains("workers")) {
            auto& w = j["workers"];
            read_key(w, "count", cfg.workers.count);
            read_key(w, "lease_seconds", cfg.workers.lease_seconds);
            read_key(w, "poll_interval_ms", cfg.workers.poll_interval_ms);
            read_key(w, "job_timeout_base_seconds", cfg.workers.job_timeout_base_seconds);
            read_key(w, "job_timeout_seconds_per_mb", cfg.workers.job_timeout_seconds_per_mb);
            read_key(w, "job_timeout_max_seconds", cfg.workers.job_timeout_max_seconds);
        }

        if (j.contains("storage")) {
            read_key(j["storage"], "data_dir", cfg.storage.data_dir);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.upload.chunk_size == 0) {
        std::println(stderr, "config: upload.chunk_size must be positive, using default");
        cfg.upload.chunk_size = Config{}.upload.chunk_size;
    }
    if (cfg.upload.chunk_size > Config::Upload::kMaxChunkSize) {
        std::println(stderr, "config: upload.chunk_size {} exceeds {}, clamping",
                     cfg.upload.chunk_size, Config::Upload::kMaxChunkSize);
        cfg.upload.chunk_size = Config::Upload::kMaxChunkSize;
    }
    if (cfg.pipeline.segment_seconds == 0) {
        std::println(stderr, "config: pipeline.segment_seconds must be positive, using default");
        cfg.pipeline.segment_seconds = Config{}.pipeline.segment_seconds;
    }
    if (cfg.workers.count == 0) cfg.workers.count = 1;

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
