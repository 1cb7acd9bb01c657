#pragma once

#include "config.hpp"
#include "pipeline/job.hpp"
#include "storage/chunk_store.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct SegmentLimits {
    double segment_seconds = 240.0;
    uint64_t max_request_bytes = 24ull * 1024 * 1024;
    double max_request_seconds = 1500.0;
    uint32_t bytes_per_second = 32000; // of the canonical audio

    static SegmentLimits from_config(const Config::Pipeline& cfg);

    // Segment length actually used: the configured length, shortened when a
    // segment of that length would not fit in one provider request.
    double effective_segment_seconds() const;
};

// Splits [0, duration) into contiguous segments. One segment when the whole
// file fits in a single request, otherwise fixed-length segments with a
// shorter remainder. The last end offset equals duration exactly.
std::vector<Segment> plan_segments(double duration, uint64_t file_bytes, const SegmentLimits& limits);

// Cuts the canonical WAV at `audio_ref` along the planned boundaries and
// stores one WAV blob per segment under the job.
class Segmenter {
public:
    Segmenter(ChunkStore& store, SegmentLimits limits);

    std::expected<std::vector<Segment>, std::string> split(const std::string& job_id,
                                                           const std::string& audio_ref,
                                                           double& duration_out);

private:
    ChunkStore& store_;
    SegmentLimits limits_;
};
