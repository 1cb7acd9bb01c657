#include "output/json_output.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<std::string, std::string> JsonOutput::render(const TranscriptDocument& doc) {
    json segments = json::array();
    for (const auto& s : doc.segments) {
        segments.push_back({
            {"index", s.index},
            {"start", s.start_offset},
            {"end", s.end_offset},
            {"text", s.transcript_text},
        });
    }

    json j = {
        {"transcript", doc.transcript},
        {"diarized_transcript", doc.diarized_transcript.empty() ? doc.transcript
                                                                : doc.diarized_transcript},
        {"segments", std::move(segments)},
        {"metadata", {
            {"filename", doc.filename},
            {"language", doc.language ? json(*doc.language) : json(nullptr)},
            {"duration", doc.duration_seconds},
            {"word_count", doc.word_count},
            {"segment_count", doc.segments.size()},
            {"speaker_count", doc.speaker_count},
        }},
    };

    try {
        return j.dump(2) + "\n";
    } catch (const json::exception& e) {
        // dump() rejects invalid UTF-8 coming back from the provider
        return std::unexpected(std::string("json: ") + e.what());
    }
}
