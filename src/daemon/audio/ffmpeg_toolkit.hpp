#pragma once

#include "audio/media_toolkit.hpp"

#include <chrono>

// Runs the ffprobe and ffmpeg executables found on PATH.
class FfmpegToolkit : public MediaToolkit {
public:
    explicit FfmpegToolkit(std::chrono::seconds timeout = std::chrono::seconds(1800));

    std::expected<AudioInfo, MediaError> probe(const std::filesystem::path& input) override;
    std::expected<void, MediaError> transcode(const std::filesystem::path& input,
                                              const std::filesystem::path& output,
                                              uint32_t sample_rate) override;
    std::string name() const override { return "ffmpeg"; }

    // Exposed for tests: interprets `ffprobe -print_format json` output.
    static std::expected<AudioInfo, MediaError> parse_probe_output(const std::string& json_text);

private:
    std::chrono::seconds timeout_;
};
