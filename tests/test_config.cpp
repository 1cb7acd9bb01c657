#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ls_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) ==
                static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.upload.chunk_size == 5ull * 1024 * 1024);
        REQUIRE(cfg.upload.max_file_size == 500ull * 1024 * 1024);
        REQUIRE(cfg.upload.session_ttl_hours == 24);
        REQUIRE(cfg.pipeline.segment_seconds == 240);
        REQUIRE(cfg.pipeline.max_request_bytes == 24ull * 1024 * 1024);
        REQUIRE(cfg.pipeline.sample_rate == 16000);
        REQUIRE(cfg.pipeline.output_formats ==
                std::vector<std::string>{"txt", "json", "srt", "vtt"});
        REQUIRE(cfg.retry.max_attempts == 5);
        REQUIRE(cfg.retry.base_delay_ms == 2000);
        REQUIRE(cfg.retry.max_delay_ms == 60000);
        REQUIRE(cfg.provider.api_format == "openai");
        REQUIRE(cfg.workers.count == 2);
        REQUIRE(cfg.storage.data_dir.empty());
    }

    SECTION("JobTimeoutScalesWithSize") {
        Config cfg;
        REQUIRE(cfg.workers.job_timeout_seconds(0) == 600);
        REQUIRE(cfg.workers.job_timeout_seconds(1) == 630);
        REQUIRE(cfg.workers.job_timeout_seconds(100ull << 20) == 600 + 30 * 100);
        // Capped
        REQUIRE(cfg.workers.job_timeout_seconds(10000ull << 20) == 21600);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "upload": { "chunk_size": 1048576, "session_ttl_hours": 2,
                        "allowed_mime_types": ["audio/*"] },
            "pipeline": { "segment_seconds": 120, "media_tool": "native",
                          "output_formats": ["txt"], "enable_diarization": false },
            "retry": { "max_attempts": 7, "base_delay_ms": 100, "jitter": 0.1 },
            "provider": { "url": "http://10.0.0.1:9090", "api_format": "whisper.cpp" },
            "workers": { "count": 4, "lease_seconds": 60 },
            "storage": { "data_dir": "/var/lib/longscribe" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.upload.chunk_size == 1048576);
        REQUIRE(cfg.upload.session_ttl_hours == 2);
        REQUIRE(cfg.upload.allowed_mime_types == std::vector<std::string>{"audio/*"});
        REQUIRE(cfg.pipeline.segment_seconds == 120);
        REQUIRE(cfg.pipeline.media_tool == "native");
        REQUIRE(cfg.pipeline.output_formats == std::vector<std::string>{"txt"});
        REQUIRE_FALSE(cfg.pipeline.enable_diarization);
        REQUIRE(cfg.retry.max_attempts == 7);
        REQUIRE(cfg.retry.base_delay_ms == 100);
        REQUIRE(cfg.retry.jitter == 0.1);
        REQUIRE(cfg.provider.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.provider.api_format == "whisper.cpp");
        REQUIRE(cfg.workers.count == 4);
        REQUIRE(cfg.workers.lease_seconds == 60);
        REQUIRE(cfg.storage.data_dir == "/var/lib/longscribe");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "pipeline": { "segment_seconds": 300 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.pipeline.segment_seconds == 300);
        // Other fields retain defaults
        REQUIRE(cfg.pipeline.sample_rate == 16000);
        REQUIRE(cfg.upload.chunk_size == 5ull * 1024 * 1024);
        REQUIRE(cfg.provider.url == "https://api.openai.com");
    }

    SECTION("ZeroValuesFallBack") {
        TmpFile f(R"({ "upload": { "chunk_size": 0 }, "pipeline": { "segment_seconds": 0 },
                       "workers": { "count": 0 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.upload.chunk_size == 5ull * 1024 * 1024);
        REQUIRE(cfg.pipeline.segment_seconds == 240);
        REQUIRE(cfg.workers.count == 1);
    }

    SECTION("OversizedChunkIsClamped") {
        TmpFile f(R"({ "upload": { "chunk_size": 104857600 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.upload.chunk_size == Config::Upload::kMaxChunkSize);
        REQUIRE(cfg.upload.chunk_size == 32ull * 1024 * 1024);

        TmpFile ok(R"({ "upload": { "chunk_size": 33554432 } })");
        REQUIRE(Config::load(ok.path).upload.chunk_size == 32ull * 1024 * 1024);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.pipeline.segment_seconds == 240);
        REQUIRE(cfg.provider.type == "http");
    }

    SECTION("WrongTypeFallsBack") {
        TmpFile f(R"({ "pipeline": { "segment_seconds": "four minutes" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.pipeline.segment_seconds == 240);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ls_test_nonexistent_config_file.json");
        REQUIRE(cfg.provider.type == "http");
        REQUIRE(cfg.pipeline.sample_rate == 16000);
    }
}
