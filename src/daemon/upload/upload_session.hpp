#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// Expired is an aborted session that was reclaimed after its TTL.
enum class UploadStatus { Collecting, Finalizing, Completed, Aborted, Expired };

std::string_view to_string(UploadStatus s);
std::optional<UploadStatus> upload_status_from_string(std::string_view s);

struct UploadSession {
    std::string upload_id;
    std::string filename;
    uint64_t total_size = 0;
    std::string mime_type;
    uint64_t chunk_size = 0;
    int total_chunks = 0;

    std::set<int> received_chunks;
    uint64_t bytes_received = 0;
    UploadStatus status = UploadStatus::Collecting;

    int64_t created_at = 0;
    int64_t updated_at = 0;
    int64_t expires_at = 0;

    // Job options, copied into the job created on completion
    std::optional<std::string> language;
    bool enable_diarization = true;
    std::vector<std::string> output_formats;

    std::string job_id; // set once completed

    bool all_chunks_received() const {
        return static_cast<int>(received_chunks.size()) == total_chunks;
    }

    // Expected byte length of chunk `index`; the last chunk carries the remainder.
    uint64_t expected_chunk_size(int index) const {
        if (index + 1 < total_chunks) return chunk_size;
        return total_size - static_cast<uint64_t>(total_chunks - 1) * chunk_size;
    }
};

struct UploadStatusReport {
    std::string upload_id;
    UploadStatus status = UploadStatus::Collecting;
    uint64_t chunk_size = 0;
    int total_chunks = 0;
    std::vector<int> received_chunks; // ascending
    uint64_t total_size = 0;
    uint64_t bytes_received = 0;
    double progress = 0.0; // percent
    int64_t created_at = 0;
    int64_t expires_at = 0;
    std::string job_id;
};
