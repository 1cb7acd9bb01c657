#include "audio/native_wav_toolkit.hpp"

#include "audio/wav.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::vector<int16_t> resample(const std::vector<float>& in, uint32_t from, uint32_t to) {
    if (in.empty()) return {};
    size_t out_len = static_cast<size_t>(
        std::llround(static_cast<double>(in.size()) * to / static_cast<double>(from)));
    std::vector<int16_t> out(out_len);

    double step = static_cast<double>(from) / to;
    for (size_t i = 0; i < out_len; ++i) {
        double pos = i * step;
        size_t i0 = std::min(static_cast<size_t>(pos), in.size() - 1);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = pos - static_cast<double>(i0);
        double v = in[i0] + (in[i1] - in[i0]) * frac;
        out[i] = static_cast<int16_t>(std::clamp(v * 32767.0, -32768.0, 32767.0));
    }
    return out;
}

} // namespace

std::expected<AudioInfo, MediaError> NativeWavToolkit::probe(const fs::path& input) {
    std::error_code ec;
    if (!fs::is_regular_file(input, ec))
        return std::unexpected(MediaError{MediaErrc::Io, "cannot read " + input.filename().string()});

    auto h = wav::read_header(input);
    if (!h) return std::unexpected(MediaError{MediaErrc::Corrupt, h.error()});
    if (h->frame_count() == 0) return std::unexpected(MediaError{MediaErrc::Corrupt, "empty audio stream"});

    return AudioInfo{
        .duration_seconds = h->duration_seconds(),
        .sample_rate = h->sample_rate,
        .channels = h->channels,
        .codec = h->format == wav::kFormatFloat ? "pcm_f32le" : "pcm_s" + std::to_string(h->bits_per_sample) + "le",
    };
}

std::expected<void, MediaError> NativeWavToolkit::transcode(const fs::path& input,
                                                            const fs::path& output,
                                                            uint32_t sample_rate) {
    auto h = wav::read_header(input);
    if (!h) return std::unexpected(MediaError{MediaErrc::Corrupt, h.error()});

    auto mono = wav::read_mono(input);
    if (!mono) return std::unexpected(MediaError{MediaErrc::Corrupt, mono.error()});

    auto samples = resample(*mono, h->sample_rate, sample_rate);
    auto bytes = wav::encode(samples, sample_rate);

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) return std::unexpected(MediaError{MediaErrc::Io, "cannot write " + output.string()});
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) return std::unexpected(MediaError{MediaErrc::Io, "short write to " + output.string()});
    return {};
}
