#include "audio/wav.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <functional>

namespace wav {

namespace {

using ReadAt = std::function<bool(uint64_t offset, void* dst, size_t len)>;

uint16_t le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }
uint32_t le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::expected<Header, std::string> parse(const ReadAt& read_at, uint64_t total) {
    uint8_t riff[12];
    if (total < 12 || !read_at(0, riff, sizeof(riff))) return std::unexpected("file too short");
    if (std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0)
        return std::unexpected("not a RIFF/WAVE file");

    Header h;
    bool have_fmt = false;
    uint64_t pos = 12;

    while (pos + 8 <= total) {
        uint8_t chunk[8];
        if (!read_at(pos, chunk, sizeof(chunk))) return std::unexpected("truncated chunk header");
        uint32_t size = le32(chunk + 4);
        uint64_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16) return std::unexpected("fmt chunk too short");
            uint8_t fmt[40] = {};
            size_t n = std::min<size_t>(size, sizeof(fmt));
            if (!read_at(body, fmt, n)) return std::unexpected("truncated fmt chunk");
            h.format = le16(fmt);
            h.channels = le16(fmt + 2);
            h.sample_rate = le32(fmt + 4);
            h.bits_per_sample = le16(fmt + 14);
            if (h.format == kFormatExtensible) {
                if (n < 26) return std::unexpected("extensible fmt chunk too short");
                h.format = le16(fmt + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            h.data_offset = body;
            h.data_size = std::min<uint64_t>(size, total - body);
            if (h.channels == 0 || h.sample_rate == 0 || h.bits_per_sample == 0 ||
                h.bits_per_sample % 8 != 0)
                return std::unexpected("invalid fmt parameters");
            return h;
        }

        pos = body + size + (size & 1);
    }
    return std::unexpected("no data chunk");
}

std::ifstream open_input(const std::filesystem::path& path, uint64_t& size) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    size = in ? static_cast<uint64_t>(in.tellg()) : 0;
    return in;
}

} // namespace

std::expected<Header, std::string> parse_header(std::span<const uint8_t> bytes) {
    return parse(
        [bytes](uint64_t offset, void* dst, size_t len) {
            if (offset + len > bytes.size()) return false;
            std::memcpy(dst, bytes.data() + offset, len);
            return true;
        },
        bytes.size());
}

std::expected<Header, std::string> read_header(const std::filesystem::path& path) {
    uint64_t size = 0;
    auto in = open_input(path, size);
    if (!in) return std::unexpected(std::format("cannot open {}", path.string()));

    return parse(
        [&in](uint64_t offset, void* dst, size_t len) {
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(static_cast<char*>(dst), static_cast<std::streamsize>(len));
            return static_cast<bool>(in);
        },
        size);
}

std::expected<std::vector<int16_t>, std::string>
read_frames(const std::filesystem::path& path, const Header& header, uint64_t first, uint64_t count) {
    if (!header.is_canonical(header.sample_rate))
        return std::unexpected("expected mono 16-bit PCM");

    uint64_t frames = header.frame_count();
    if (first > frames) first = frames;
    count = std::min(count, frames - first);

    std::ifstream in(path, std::ios::binary);
    if (!in) return std::unexpected(std::format("cannot open {}", path.string()));

    std::vector<int16_t> samples(count);
    in.seekg(static_cast<std::streamoff>(header.data_offset + first * 2));
    in.read(reinterpret_cast<char*>(samples.data()), static_cast<std::streamsize>(count * 2));
    if (static_cast<uint64_t>(in.gcount()) != count * 2)
        return std::unexpected(std::format("short read from {}", path.string()));
    return samples;
}

std::expected<std::vector<float>, std::string> read_mono(const std::filesystem::path& path) {
    auto header = read_header(path);
    if (!header) return std::unexpected(header.error());
    const auto& h = *header;

    bool pcm = h.format == kFormatPcm && h.bits_per_sample >= 8 && h.bits_per_sample <= 32;
    bool flt = h.format == kFormatFloat && h.bits_per_sample == 32;
    if (!pcm && !flt) return std::unexpected(std::format("unsupported WAV format {}", h.format));

    std::ifstream in(path, std::ios::binary);
    if (!in) return std::unexpected(std::format("cannot open {}", path.string()));

    std::vector<uint8_t> raw(h.frame_count() * h.frame_bytes());
    in.seekg(static_cast<std::streamoff>(h.data_offset));
    in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (static_cast<uint64_t>(in.gcount()) != raw.size())
        return std::unexpected(std::format("short read from {}", path.string()));

    const uint32_t bytes = h.bits_per_sample / 8u;
    auto sample_at = [&](const uint8_t* p) -> float {
        if (flt) {
            float f;
            std::memcpy(&f, p, 4);
            return f;
        }
        switch (bytes) {
            case 1: return (static_cast<int>(p[0]) - 128) / 128.0f;
            case 2: return static_cast<int16_t>(le16(p)) / 32768.0f;
            case 3: {
                int32_t v = (p[0] << 8) | (p[1] << 16) | (p[2] << 24);
                return static_cast<float>(v >> 8) / 8388608.0f;
            }
            default: return static_cast<float>(static_cast<int32_t>(le32(p))) / 2147483648.0f;
        }
    };

    std::vector<float> mono(h.frame_count());
    for (uint64_t f = 0; f < mono.size(); ++f) {
        const uint8_t* frame = raw.data() + f * h.frame_bytes();
        float sum = 0.0f;
        for (uint16_t c = 0; c < h.channels; ++c) sum += sample_at(frame + c * bytes);
        mono[f] = sum / h.channels;
    }
    return mono;
}

} // namespace wav
