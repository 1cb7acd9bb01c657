#pragma once

#include "output/output.hpp"

#include <string>

// SubRip and WebVTT. One cue per provider timestamp when the provider
// returned them, otherwise one cue per segment.
class SubtitleOutput : public OutputRenderer {
public:
    enum class Flavor { Srt, Vtt };

    explicit SubtitleOutput(Flavor flavor) : flavor_(flavor) {}

    std::expected<std::string, std::string> render(const TranscriptDocument& doc) override;
    std::string_view extension() const override { return flavor_ == Flavor::Srt ? "srt" : "vtt"; }
    std::string_view content_type() const override {
        return flavor_ == Flavor::Srt ? "application/x-subrip" : "text/vtt";
    }

    // HH:MM:SS,mmm (srt) or HH:MM:SS.mmm (vtt)
    static std::string format_timestamp(double seconds, Flavor flavor);

private:
    Flavor flavor_;
};
