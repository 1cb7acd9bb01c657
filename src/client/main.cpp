#include "common/base64.hpp"
#include "common/content_hash.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <set>
#include <span>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Assembly and hashing of a large upload happen inside the complete call.
constexpr int kCompleteTimeoutMs = 10 * 60 * 1000;

struct Args {
    std::vector<std::string> positional;
    std::string mime;
    std::string language;
    std::string formats;
    std::string resume;
    std::string from_stage;
    std::string status_filter;
    std::string output_path;
    bool no_diarize = false;
    int limit = 20;
};

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  upload FILE [--mime TYPE] [--language L] [--no-diarize]");
    std::println(stderr, "              [--formats txt,json,srt,vtt] [--resume UPLOAD_ID]");
    std::println(stderr, "                                    Upload a recording and queue a job");
    std::println(stderr, "  status JOB                        Show job progress");
    std::println(stderr, "  fetch JOB FORMAT [-o FILE]        Write a finished output");
    std::println(stderr, "  cancel JOB                        Cancel a queued or running job");
    std::println(stderr, "  retry JOB [--from STAGE]          Re-queue a failed job");
    std::println(stderr, "  jobs [--status S] [--limit N]     List recent jobs");
    std::println(stderr, "  abort UPLOAD                      Abandon an upload session");
    std::println(stderr, "  health                            Show daemon health");
}

std::string guess_mime(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::vector<std::pair<std::string, std::string>> table = {
        {".mp3", "audio/mpeg"},  {".wav", "audio/wav"},        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},   {".ogg", "audio/ogg"},        {".opus", "audio/opus"},
        {".flac", "audio/flac"}, {".webm", "audio/webm"},      {".aiff", "audio/aiff"},
        {".wma", "audio/x-ms-wma"}, {".amr", "audio/amr"},     {".mp4", "video/mp4"},
        {".mov", "video/quicktime"}, {".mkv", "video/x-matroska"}, {".avi", "video/x-msvideo"},
    };
    for (const auto& [e, mime] : table) {
        if (e == ext) return mime;
    }
    return "application/octet-stream";
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        auto comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        if (comma > start) out.push_back(s.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

bool report_error(const json& response) {
    if (response.value("status", "") == "ok") return false;
    std::println(stderr, "Error: {} ({})", response.value("message", "unknown error"),
                 response.value("code", "ERROR"));
    return true;
}

int do_upload(IpcClient& client, const Args& args) {
    if (args.positional.empty()) {
        std::println(stderr, "upload: missing FILE");
        return 1;
    }
    std::filesystem::path path = args.positional[0];

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        std::println(stderr, "upload: {}: {}", path.string(), ec.message());
        return 1;
    }

    auto digest = hashing::sha256_file(path);
    if (!digest) {
        std::println(stderr, "upload: {}", digest.error());
        return 1;
    }

    json response;
    std::string upload_id = args.resume;
    uint64_t chunk_size = 0;
    int total_chunks = 0;
    std::set<int> received;

    if (upload_id.empty()) {
        json cmd = {
            {"cmd", "create_session"},
            {"filename", path.filename().string()},
            {"total_size", size},
            {"mime_type", args.mime.empty() ? guess_mime(path) : args.mime},
        };
        if (!args.language.empty()) cmd["language"] = args.language;
        if (args.no_diarize) cmd["enable_diarization"] = false;
        if (!args.formats.empty()) cmd["output_formats"] = split_list(args.formats);

        if (!client.request(cmd, response)) {
            std::println(stderr, "No response from daemon (timeout)");
            return 1;
        }
        if (report_error(response)) return 1;
        upload_id = response.value("upload_id", "");
        chunk_size = response.value("chunk_size", uint64_t{0});
        total_chunks = response.value("total_chunks", 0);
        std::println("Upload {} ({} chunks)", upload_id, total_chunks);
    } else {
        if (!client.request({{"cmd", "upload_status"}, {"upload_id", upload_id}}, response)) {
            std::println(stderr, "No response from daemon (timeout)");
            return 1;
        }
        if (report_error(response)) return 1;
        if (response.value("total_size", uint64_t{0}) != size) {
            std::println(stderr, "upload: {} does not match the size of upload {}",
                         path.string(), upload_id);
            return 1;
        }
        total_chunks = response.value("total_chunks", 0);
        for (int i : response.value("received_chunks", std::vector<int>{})) received.insert(i);
        chunk_size = response.value("chunk_size", uint64_t{0});
        std::println("Resuming upload {}: {}/{} chunks present", upload_id, received.size(),
                     total_chunks);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::println(stderr, "upload: cannot open {}", path.string());
        return 1;
    }

    std::vector<uint8_t> buf(chunk_size);
    for (int i = 0; i < total_chunks; ++i) {
        if (received.contains(i)) continue;

        uint64_t offset = static_cast<uint64_t>(i) * chunk_size;
        uint64_t len = std::min<uint64_t>(chunk_size, size - offset);
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(len))) {
            std::println(stderr, "upload: read error at chunk {}", i);
            return 1;
        }

        json cmd = {
            {"cmd", "put_chunk"},
            {"upload_id", upload_id},
            {"index", i},
            {"data", base64::encode(std::span<const uint8_t>(buf.data(), len))},
        };
        if (!client.request(cmd, response)) {
            std::println(stderr, "Upload interrupted at chunk {}; resume with --resume {}", i,
                         upload_id);
            return 1;
        }
        if (report_error(response)) return 1;
        std::println("  chunk {}/{}", i + 1, total_chunks);
    }

    if (!client.request({{"cmd", "complete"}, {"upload_id", upload_id}, {"sha256", *digest}},
                        response, kCompleteTimeoutMs)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (report_error(response)) return 1;
    std::println("{}", response.value("job_id", ""));
    return 0;
}

int do_status(IpcClient& client, const Args& args) {
    if (args.positional.empty()) {
        std::println(stderr, "status: missing JOB");
        return 1;
    }
    json response;
    if (!client.request({{"cmd", "job_status"}, {"job_id", args.positional[0]}}, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (report_error(response)) return 1;

    std::println("Job:      {}", response.value("job_id", ""));
    std::println("File:     {}", response.value("filename", ""));
    std::println("Status:   {} ({})", response.value("job_status", ""), response.value("stage", ""));
    std::println("Progress: {}/{} segments ({:.0f}%)", response.value("segments_done", 0),
                 response.value("segment_count", 0), response.value("progress", 0.0) * 100.0);
    if (response.contains("language") && response["language"].is_string()) {
        std::println("Language: {} ({:.0f}%)", response["language"].get<std::string>(),
                     response.value("language_confidence", 0.0) * 100.0);
    }
    if (auto err = response.value("error", ""); !err.empty()) std::println("Error:    {}", err);
    for (const auto& w : response.value("warnings", std::vector<std::string>{}))
        std::println("Warning:  {}", w);
    auto outputs = response.value("outputs", std::vector<std::string>{});
    if (!outputs.empty()) {
        std::string list;
        for (const auto& f : outputs) list += (list.empty() ? "" : ", ") + f;
        std::println("Outputs:  {}", list);
    }
    return 0;
}

int do_fetch(IpcClient& client, const Args& args) {
    if (args.positional.size() < 2) {
        std::println(stderr, "fetch: expected JOB FORMAT");
        return 1;
    }
    json response;
    json cmd = {{"cmd", "job_outputs"}, {"job_id", args.positional[0]},
                {"format", args.positional[1]}};
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (report_error(response)) return 1;

    auto content = response.value("content", "");
    if (args.output_path.empty()) {
        std::print("{}", content);
        return 0;
    }

    std::ofstream out(args.output_path, std::ios::binary | std::ios::trunc);
    if (!out || !out.write(content.data(), static_cast<std::streamsize>(content.size()))) {
        std::println(stderr, "fetch: cannot write {}", args.output_path);
        return 1;
    }
    std::println("Wrote {} ({} bytes)", args.output_path, content.size());
    return 0;
}

int do_simple(IpcClient& client, json cmd) {
    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (report_error(response)) return 1;
    response.erase("status");
    std::println("{}", response.empty() ? "OK" : response.dump(2));
    return 0;
}

int do_jobs(IpcClient& client, const Args& args) {
    json cmd = {{"cmd", "list_jobs"}, {"limit", args.limit}};
    if (!args.status_filter.empty()) cmd["filter"] = args.status_filter;

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (report_error(response)) return 1;

    for (const auto& job : response.value("jobs", json::array())) {
        std::println("{}  {:<9} {:<18} {:>4.0f}%  {}", job.value("job_id", ""),
                     job.value("job_status", ""), job.value("stage", ""),
                     job.value("progress", 0.0) * 100.0, job.value("filename", ""));
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    Args args;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string { return i + 1 < argc ? argv[++i] : ""; };
        if (arg == "--mime") {
            args.mime = next();
        } else if (arg == "--language") {
            args.language = next();
        } else if (arg == "--no-diarize") {
            args.no_diarize = true;
        } else if (arg == "--formats") {
            args.formats = next();
        } else if (arg == "--resume") {
            args.resume = next();
        } else if (arg == "--from") {
            args.from_stage = next();
        } else if (arg == "--status") {
            args.status_filter = next();
        } else if (arg == "--limit") {
            args.limit = std::atoi(next().c_str());
        } else if (arg == "-o" || arg == "--output") {
            args.output_path = next();
        } else {
            args.positional.push_back(arg);
        }
    }

    static const std::set<std::string> known = {"upload", "status", "fetch", "cancel",
                                                "retry",  "jobs",   "abort", "health"};
    if (!known.contains(command)) {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }
    if ((command == "cancel" || command == "retry" || command == "abort") &&
        args.positional.empty()) {
        std::println(stderr, "{}: missing id", command);
        return 1;
    }

    // Connect
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is longscribed running?");
        return 1;
    }

    if (command == "upload") return do_upload(client, args);
    if (command == "status") return do_status(client, args);
    if (command == "fetch") return do_fetch(client, args);
    if (command == "jobs") return do_jobs(client, args);
    if (command == "cancel")
        return do_simple(client, {{"cmd", "cancel_job"}, {"job_id", args.positional[0]}});
    if (command == "abort")
        return do_simple(client, {{"cmd", "abort"}, {"upload_id", args.positional[0]}});
    if (command == "health") return do_simple(client, {{"cmd", "health"}});

    json cmd = {{"cmd", "retry_job"}, {"job_id", args.positional[0]}};
    if (!args.from_stage.empty()) cmd["from_stage"] = args.from_stage;
    return do_simple(client, cmd);
}
