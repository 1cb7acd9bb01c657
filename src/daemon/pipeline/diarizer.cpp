#include "pipeline/diarizer.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

namespace {

constexpr size_t kConversationMinChars = 1000;
constexpr int kSentencesPerTurn = 3;

constexpr std::array<std::string_view, 6> kConversationMarkers = {
    ": ", "- ", "Q:", "A:", "Speaker", "Person",
};

void push_trimmed(std::vector<std::string>& out, const std::string& s) {
    auto start = s.find_first_not_of(" \n");
    if (start == std::string::npos) return;
    auto end = s.find_last_not_of(" \n");
    out.push_back(s.substr(start, end - start + 1));
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        current += text[i];
        // A line break ends a sentence too, so part markers stay at the front of one
        bool boundary = text[i] == '\n' ||
                        ((text[i] == '.' || text[i] == '?' || text[i] == '!') &&
                         (i + 1 == text.size() || text[i + 1] == ' ' || text[i + 1] == '\n'));
        if (boundary) {
            push_trimmed(out, current);
            current.clear();
        }
    }
    push_trimmed(out, current);
    return out;
}

// Joined segment texts in index order, for jobs that have not been merged.
std::string joined_segments(const TranscriptionJob& job) {
    std::vector<const Segment*> ordered;
    for (const auto& seg : job.segments) ordered.push_back(&seg);
    std::ranges::sort(ordered, {}, [](const Segment* s) { return s->index; });

    std::string text;
    for (const auto* seg : ordered) {
        if (seg->transcript_text.empty()) continue;
        if (!text.empty()) text += ' ';
        text += seg->transcript_text;
    }
    return text;
}

} // namespace

std::expected<DiarizationResult, std::string> HeuristicDiarizer::diarize(const TranscriptionJob& job) {
    // The merged transcript carries the part markers, which must survive labelling
    std::string text = job.merged_transcript.empty() ? joined_segments(job) : job.merged_transcript;
    if (text.find_first_not_of(" \n") == std::string::npos)
        return std::unexpected("transcript is empty");

    bool conversational = text.size() > kConversationMinChars &&
                          std::ranges::any_of(kConversationMarkers, [&text](std::string_view m) {
                              return text.find(m) != std::string::npos;
                          });
    if (!conversational) return DiarizationResult{"Speaker 1: " + text, 1};

    auto sentences = split_sentences(text);
    std::string out;
    int speaker = 1;
    int in_turn = 0;
    std::string turn;
    for (const auto& s : sentences) {
        if (!turn.empty()) turn += ' ';
        turn += s;
        if (++in_turn == kSentencesPerTurn) {
            if (!out.empty()) out += "\n\n";
            out += "Speaker " + std::to_string(speaker) + ": " + turn;
            turn.clear();
            in_turn = 0;
            speaker = speaker == 1 ? 2 : 1;
        }
    }
    if (!turn.empty()) {
        if (!out.empty()) out += "\n\n";
        out += "Speaker " + std::to_string(speaker) + ": " + turn;
    }

    int speakers = sentences.size() > static_cast<size_t>(kSentencesPerTurn) ? 2 : 1;
    return DiarizationResult{std::move(out), speakers};
}
