#pragma once

#include "audio/media_toolkit.hpp"

// Handles RIFF/WAVE input without external tools: downmix plus linear resampling.
class NativeWavToolkit : public MediaToolkit {
public:
    std::expected<AudioInfo, MediaError> probe(const std::filesystem::path& input) override;
    std::expected<void, MediaError> transcode(const std::filesystem::path& input,
                                              const std::filesystem::path& output,
                                              uint32_t sample_rate) override;
    std::string name() const override { return "native"; }
};
