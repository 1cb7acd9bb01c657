#include "output/subtitle_output.hpp"

#include <algorithm>
#include <cmath>
#include <format>

std::string SubtitleOutput::format_timestamp(double seconds, Flavor flavor) {
    auto total_ms = static_cast<int64_t>(std::llround(std::max(seconds, 0.0) * 1000.0));
    int64_t ms = total_ms % 1000;
    int64_t s = (total_ms / 1000) % 60;
    int64_t m = (total_ms / 60000) % 60;
    int64_t h = total_ms / 3600000;
    char sep = flavor == Flavor::Srt ? ',' : '.';
    return std::format("{:02}:{:02}:{:02}{}{:03}", h, m, s, sep, ms);
}

std::expected<std::string, std::string> SubtitleOutput::render(const TranscriptDocument& doc) {
    std::string out;
    if (flavor_ == Flavor::Vtt) out += "WEBVTT\n\n";

    int number = 0;
    auto emit = [&](double start, double end, const std::string& text) {
        if (text.empty()) return;
        ++number;
        if (flavor_ == Flavor::Srt) out += std::format("{}\n", number);
        out += std::format("{} --> {}\n{}\n\n", format_timestamp(start, flavor_),
                           format_timestamp(end, flavor_), text);
    };

    for (const auto& seg : doc.segments) {
        if (seg.cues.empty()) {
            emit(seg.start_offset, seg.end_offset, seg.transcript_text);
            continue;
        }
        for (const auto& cue : seg.cues) {
            double start = seg.start_offset + cue.start;
            double end = std::min(seg.start_offset + cue.end, seg.end_offset);
            emit(start, std::max(end, start), cue.text);
        }
    }

    if (number == 0) return std::unexpected("no cues to render");
    return out;
}
