#include "audio/ffmpeg_toolkit.hpp"

#include "platform/linux/subprocess.hpp"

#include <array>
#include <format>
#include <nlohmann/json.hpp>
#include <string_view>

using json = nlohmann::json;

namespace {

// stderr fragments that point at the environment rather than the input
constexpr std::array<std::string_view, 5> kIoMarkers = {
    "No space left on device",
    "Permission denied",
    "Input/output error",
    "Cannot allocate memory",
    "Resource temporarily unavailable",
};

MediaErrc classify_failure(const std::string& err) {
    for (auto marker : kIoMarkers) {
        if (err.find(marker) != std::string::npos) return MediaErrc::Io;
    }
    return MediaErrc::Corrupt;
}

std::string last_line(const std::string& s) {
    auto end = s.find_last_not_of("\r\n ");
    if (end == std::string::npos) return {};
    auto nl = s.rfind('\n', end);
    size_t start = nl == std::string::npos ? 0 : nl + 1;
    return s.substr(start, end - start + 1);
}

} // namespace

FfmpegToolkit::FfmpegToolkit(std::chrono::seconds timeout) : timeout_(timeout) {}

std::expected<AudioInfo, MediaError> FfmpegToolkit::parse_probe_output(const std::string& json_text) {
    try {
        auto j = json::parse(json_text);

        const json* audio = nullptr;
        if (j.contains("streams")) {
            for (const auto& s : j["streams"]) {
                if (s.value("codec_type", "") == "audio") {
                    audio = &s;
                    break;
                }
            }
        }
        if (!audio) return std::unexpected(MediaError{MediaErrc::Corrupt, "no audio stream"});

        AudioInfo info;
        info.codec = audio->value("codec_name", "");
        info.channels = static_cast<uint16_t>(audio->value("channels", 0));
        // ffprobe reports numbers as strings in these fields
        info.sample_rate = static_cast<uint32_t>(std::stoul(audio->value("sample_rate", "0")));

        std::string duration = audio->value("duration", "");
        if ((duration.empty() || duration == "N/A") && j.contains("format"))
            duration = j["format"].value("duration", "");
        if (duration.empty() || duration == "N/A")
            return std::unexpected(MediaError{MediaErrc::Corrupt, "unknown duration"});
        info.duration_seconds = std::stod(duration);

        if (info.duration_seconds <= 0.0)
            return std::unexpected(MediaError{MediaErrc::Corrupt, "empty audio stream"});
        return info;
    } catch (const json::exception& e) {
        return std::unexpected(MediaError{MediaErrc::Corrupt, std::string("bad ffprobe output: ") + e.what()});
    } catch (const std::logic_error& e) {
        return std::unexpected(MediaError{MediaErrc::Corrupt, std::string("bad ffprobe number: ") + e.what()});
    }
}

std::expected<AudioInfo, MediaError> FfmpegToolkit::probe(const std::filesystem::path& input) {
    auto r = run_process({"ffprobe", "-v", "error", "-print_format", "json",
                          "-show_format", "-show_streams", input.string()},
                         timeout_);
    if (!r) return std::unexpected(MediaError{MediaErrc::Io, "ffprobe: " + r.error()});
    if (r->exit_code == 127)
        return std::unexpected(MediaError{MediaErrc::Io, "ffprobe not found"});
    if (r->exit_code != 0)
        return std::unexpected(MediaError{classify_failure(r->err),
                                          std::format("ffprobe: {}", last_line(r->err))});
    return parse_probe_output(r->out);
}

std::expected<void, MediaError> FfmpegToolkit::transcode(const std::filesystem::path& input,
                                                         const std::filesystem::path& output,
                                                         uint32_t sample_rate) {
    auto r = run_process({"ffmpeg", "-nostdin", "-hide_banner", "-loglevel", "error", "-y",
                          "-i", input.string(), "-vn", "-map_metadata", "-1",
                          "-ac", "1", "-ar", std::to_string(sample_rate),
                          "-c:a", "pcm_s16le", "-f", "wav", output.string()},
                         timeout_);
    if (!r) return std::unexpected(MediaError{MediaErrc::Io, "ffmpeg: " + r.error()});
    if (r->exit_code == 127)
        return std::unexpected(MediaError{MediaErrc::Io, "ffmpeg not found"});
    if (r->exit_code != 0)
        return std::unexpected(MediaError{classify_failure(r->err),
                                          std::format("ffmpeg: {}", last_line(r->err))});
    return {};
}
