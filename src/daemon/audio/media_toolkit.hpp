#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

enum class MediaErrc {
    Corrupt, // undecodable input, retrying will not help
    Io,      // transient tool or filesystem failure
};

struct MediaError {
    MediaErrc kind;
    std::string message;
};

struct AudioInfo {
    double duration_seconds = 0.0;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::string codec;
};

// Decoding and normalization of uploaded media.
class MediaToolkit {
public:
    virtual ~MediaToolkit() = default;

    // Fails with Corrupt when the file has no decodable audio stream.
    virtual std::expected<AudioInfo, MediaError> probe(const std::filesystem::path& input) = 0;

    // Writes mono 16-bit PCM WAV at sample_rate to output.
    virtual std::expected<void, MediaError> transcode(const std::filesystem::path& input,
                                                      const std::filesystem::path& output,
                                                      uint32_t sample_rate) = 0;

    virtual std::string name() const = 0;
};
