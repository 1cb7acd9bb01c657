#pragma once

#include "pipeline/job.hpp"

#include <expected>
#include <string>

struct DiarizationResult {
    std::string transcript; // "Speaker N: ..." blocks separated by blank lines
    int speaker_count = 0;
};

class Diarizer {
public:
    virtual ~Diarizer() = default;
    virtual std::expected<DiarizationResult, std::string> diarize(const TranscriptionJob& job) = 0;
};

// Text-only speaker labelling. Long transcripts that read like a conversation
// get two alternating speakers, switching every few sentences; anything else
// is attributed to a single speaker.
class HeuristicDiarizer : public Diarizer {
public:
    std::expected<DiarizationResult, std::string> diarize(const TranscriptionJob& job) override;
};
