#pragma once

#include "pipeline/job.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// What the renderers see of a finished job.
struct TranscriptDocument {
    std::string transcript;          // merged, with part markers
    std::string diarized_transcript; // empty when diarization was skipped or failed
    std::vector<Segment> segments;   // index order
    std::optional<std::string> language;
    double duration_seconds = 0.0;
    int word_count = 0;
    int speaker_count = 0;
    std::string filename;

    static TranscriptDocument from_job(const TranscriptionJob& job);
};

class OutputRenderer {
public:
    virtual ~OutputRenderer() = default;
    virtual std::expected<std::string, std::string> render(const TranscriptDocument& doc) = 0;
    virtual std::string_view extension() const = 0;
    virtual std::string_view content_type() const = 0;
};

// nullptr for a format without a renderer.
std::unique_ptr<OutputRenderer> make_renderer(std::string_view format);
