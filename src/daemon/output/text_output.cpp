#include "output/text_output.hpp"

std::expected<std::string, std::string> TextOutput::render(const TranscriptDocument& doc) {
    const auto& text = doc.diarized_transcript.empty() ? doc.transcript : doc.diarized_transcript;
    if (text.empty()) return std::unexpected("transcript is empty");
    return text + "\n";
}
