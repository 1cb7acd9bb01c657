#include "pipeline/segmenter.hpp"

#include "audio/wav.hpp"

#include <algorithm>
#include <cmath>
#include <format>

SegmentLimits SegmentLimits::from_config(const Config::Pipeline& cfg) {
    return SegmentLimits{
        .segment_seconds = static_cast<double>(cfg.segment_seconds),
        .max_request_bytes = cfg.max_request_bytes,
        .max_request_seconds = static_cast<double>(cfg.max_request_seconds),
        .bytes_per_second = cfg.sample_rate * 2,
    };
}

double SegmentLimits::effective_segment_seconds() const {
    double len = segment_seconds;
    if (max_request_seconds > 0.0) len = std::min(len, max_request_seconds);
    if (bytes_per_second > 0) {
        // 44-byte header per segment file
        double fit = static_cast<double>(max_request_bytes > 44 ? max_request_bytes - 44 : 0) /
                     bytes_per_second;
        if (fit > 0.0) len = std::min(len, std::floor(fit));
    }
    return len > 0.0 ? len : segment_seconds;
}

std::vector<Segment> plan_segments(double duration, uint64_t file_bytes, const SegmentLimits& limits) {
    std::vector<Segment> segments;
    if (duration <= 0.0) return segments;

    if (file_bytes <= limits.max_request_bytes && duration <= limits.max_request_seconds) {
        segments.push_back(Segment{.index = 0, .start_offset = 0.0, .end_offset = duration});
        return segments;
    }

    double len = limits.effective_segment_seconds();
    // Tolerate rounding in duration so an exact multiple does not yield an empty tail
    auto count = static_cast<int>(std::ceil(duration / len - 1e-9));
    count = std::max(count, 1);

    segments.reserve(static_cast<size_t>(count));
    for (int k = 0; k < count; ++k) {
        double start = k * len;
        double end = (k + 1 == count) ? duration : std::min((k + 1) * len, duration);
        segments.push_back(Segment{.index = k, .start_offset = start, .end_offset = end});
    }
    return segments;
}

Segmenter::Segmenter(ChunkStore& store, SegmentLimits limits) : store_(store), limits_(limits) {}

std::expected<std::vector<Segment>, std::string>
Segmenter::split(const std::string& job_id, const std::string& audio_ref, double& duration_out) {
    auto path = store_.path_for(audio_ref);
    if (path.empty()) return std::unexpected("invalid audio reference");

    auto header = wav::read_header(path);
    if (!header) return std::unexpected(header.error());
    if (!header->is_canonical(header->sample_rate))
        return std::unexpected("audio is not mono 16-bit PCM");

    duration_out = header->duration_seconds();
    uint64_t file_bytes = header->data_offset + header->data_size;
    auto segments = plan_segments(duration_out, file_bytes, limits_);
    if (segments.empty()) return std::unexpected("audio has no samples");

    const double rate = header->sample_rate;
    const uint64_t frames = header->frame_count();
    for (auto& seg : segments) {
        uint64_t first = static_cast<uint64_t>(std::llround(seg.start_offset * rate));
        uint64_t last = &seg == &segments.back()
                            ? frames
                            : static_cast<uint64_t>(std::llround(seg.end_offset * rate));
        last = std::min(last, frames);

        auto samples = wav::read_frames(path, *header, first, last > first ? last - first : 0);
        if (!samples) return std::unexpected(samples.error());

        seg.storage_ref = ChunkStore::blob_ref(job_id, std::format("segment_{:04}.wav", seg.index));
        if (auto r = store_.write_blob(seg.storage_ref, wav::encode(*samples, header->sample_rate)); !r)
            return std::unexpected(r.error());
    }
    return segments;
}
