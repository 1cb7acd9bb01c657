#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace wav {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

struct Header {
    uint16_t format = 0; // resolved through WAVE_FORMAT_EXTENSIBLE
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint64_t data_offset = 0;
    uint64_t data_size = 0;

    uint32_t frame_bytes() const { return channels * (bits_per_sample / 8u); }
    uint64_t frame_count() const { return frame_bytes() ? data_size / frame_bytes() : 0; }
    double duration_seconds() const {
        return sample_rate ? static_cast<double>(frame_count()) / sample_rate : 0.0;
    }
    bool is_canonical(uint32_t rate) const {
        return format == kFormatPcm && channels == 1 && bits_per_sample == 16 && sample_rate == rate;
    }
};

// Encodes mono int16 samples into a WAV file in memory.
inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(kFormatPcm);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Walks the RIFF chunks up to "data". data_size is clamped to the bytes present.
std::expected<Header, std::string> parse_header(std::span<const uint8_t> bytes);
std::expected<Header, std::string> read_header(const std::filesystem::path& path);

// Reads frames [first, first + count) of a mono 16-bit PCM file.
std::expected<std::vector<int16_t>, std::string>
read_frames(const std::filesystem::path& path, const Header& header, uint64_t first, uint64_t count);

// Decodes every frame of a PCM (8/16/24/32-bit) or float32 file, downmixed to mono.
std::expected<std::vector<float>, std::string> read_mono(const std::filesystem::path& path);

} // namespace wav
