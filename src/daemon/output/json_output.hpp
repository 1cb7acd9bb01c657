#pragma once

#include "output/output.hpp"

class JsonOutput : public OutputRenderer {
public:
    std::expected<std::string, std::string> render(const TranscriptDocument& doc) override;
    std::string_view extension() const override { return "json"; }
    std::string_view content_type() const override { return "application/json"; }
};
