#pragma once

#include "output/output.hpp"

// Plain text: the diarized transcript when there is one, else the merged transcript.
class TextOutput : public OutputRenderer {
public:
    std::expected<std::string, std::string> render(const TranscriptDocument& doc) override;
    std::string_view extension() const override { return "txt"; }
    std::string_view content_type() const override { return "text/plain"; }
};
