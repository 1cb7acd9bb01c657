#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Upload {
        // A base64 put_chunk line for this size must fit the IPC line limit.
        static constexpr uint64_t kMaxChunkSize = 32ull * 1024 * 1024;

        uint64_t chunk_size = 5ull * 1024 * 1024;
        uint64_t max_file_size = 500ull * 1024 * 1024;
        uint32_t session_ttl_hours = 24;
        uint32_t reclaim_interval_minutes = 15;
        std::vector<std::string> allowed_mime_types = {
            "audio/mpeg", "audio/wav", "audio/wave", "audio/x-wav", "audio/mp4",
            "audio/m4a", "audio/aac", "audio/webm", "audio/ogg", "audio/opus",
            "audio/flac", "audio/x-flac", "audio/aiff", "audio/x-aiff",
            "audio/wma", "audio/x-ms-wma", "audio/amr", "audio/3gpp",
            "audio/mp2", "audio/x-mp3",
            "video/mp4", "video/quicktime", "video/x-msvideo", "video/webm",
            "video/x-ms-wmv", "video/3gpp", "video/x-matroska",
            "audio/*", "video/*",
        };
    } upload;

    struct Pipeline {
        uint32_t segment_seconds = 240;
        uint64_t max_request_bytes = 24ull * 1024 * 1024; // provider ceiling is 25 MiB
        uint32_t max_request_seconds = 1500;
        uint32_t max_duration_hours = 10;
        uint32_t sample_rate = 16000;
        uint32_t inter_segment_delay_ms = 3000;
        uint32_t transcode_attempts = 3;
        uint32_t transcode_retry_delay_ms = 2000;
        uint32_t detect_language_seconds = 30;
        uint32_t max_job_retries = 3;
        bool enable_diarization = true;
        std::string media_tool = "ffmpeg"; // "ffmpeg" or "native"
        std::vector<std::string> output_formats = {"txt", "json", "srt", "vtt"};
    } pipeline;

    struct Retry {
        uint32_t max_attempts = 5;
        uint32_t base_delay_ms = 2000;
        uint32_t max_delay_ms = 60000;
        double jitter = 0.2;
    } retry;

    struct Provider {
        std::string type = "http";
        std::string url = "https://api.openai.com";
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model = "whisper-1";
        std::string api_key_env = "OPENAI_API_KEY";
        uint32_t timeout_seconds = 300;
        uint32_t connect_timeout_seconds = 10;
    } provider;

    struct Workers {
        uint32_t count = 2;
        uint32_t lease_seconds = 900;
        uint32_t poll_interval_ms = 1000;
        uint32_t job_timeout_base_seconds = 600;
        uint32_t job_timeout_seconds_per_mb = 30;
        uint32_t job_timeout_max_seconds = 21600;

        // Larger uploads get proportionally more time, up to the cap.
        uint64_t job_timeout_seconds(uint64_t total_size) const {
            uint64_t mib = (total_size + (1ull << 20) - 1) >> 20;
            uint64_t budget = job_timeout_base_seconds + job_timeout_seconds_per_mb * mib;
            return budget < job_timeout_max_seconds ? budget : job_timeout_max_seconds;
        }
    } workers;

    struct Storage {
        std::string data_dir; // empty: platform data dir
    } storage;

    static Config load(const std::string& path);
    static Config load_default();
};
