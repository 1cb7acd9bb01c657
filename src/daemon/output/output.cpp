#include "output/output.hpp"

#include "output/json_output.hpp"
#include "output/subtitle_output.hpp"
#include "output/text_output.hpp"

#include <algorithm>

TranscriptDocument TranscriptDocument::from_job(const TranscriptionJob& job) {
    TranscriptDocument doc;
    doc.transcript = job.merged_transcript;
    doc.diarized_transcript = job.diarized_transcript;
    doc.segments = job.segments;
    std::ranges::sort(doc.segments, {}, &Segment::index);
    doc.language = job.detected_language;
    doc.duration_seconds = job.audio_duration_seconds;
    doc.word_count = job.word_count;
    doc.speaker_count = job.speaker_count;
    doc.filename = job.filename;
    return doc;
}

std::unique_ptr<OutputRenderer> make_renderer(std::string_view format) {
    if (format == "txt") return std::make_unique<TextOutput>();
    if (format == "json") return std::make_unique<JsonOutput>();
    if (format == "srt") return std::make_unique<SubtitleOutput>(SubtitleOutput::Flavor::Srt);
    if (format == "vtt") return std::make_unique<SubtitleOutput>(SubtitleOutput::Flavor::Vtt);
    return nullptr;
}
