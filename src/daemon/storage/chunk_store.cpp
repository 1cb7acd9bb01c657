#include "storage/chunk_store.hpp"

#include "common/content_hash.hpp"
#include "util/ids.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

ChunkStore::ChunkStore(fs::path root) : root_(std::move(root)) {}

bool ChunkStore::init() {
    std::error_code ec;
    fs::create_directories(root_ / "uploads", ec);
    if (!ec) fs::create_directories(root_ / "blobs", ec);
    if (ec) {
        std::println(stderr, "store: cannot create {}: {}", root_.string(), ec.message());
        return false;
    }
    return true;
}

fs::path ChunkStore::chunk_path(const std::string& upload_id, int index) const {
    return root_ / "uploads" / upload_id / std::format("chunk_{:06}", index);
}

std::expected<void, std::string> ChunkStore::write_atomic(const fs::path& dest,
                                                          std::span<const uint8_t> data) {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) return std::unexpected(std::format("mkdir {}: {}", dest.parent_path().string(), ec.message()));

    fs::path tmp = dest;
    tmp += ".tmp-" + ids::generate();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return std::unexpected(std::format("open {}: {}", tmp.string(), std::strerror(errno)));
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return std::unexpected(std::format("write {} failed", tmp.string()));
        }
    }

    fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(std::format("rename {}: {}", dest.string(), ec.message()));
    }
    return {};
}

std::expected<void, std::string> ChunkStore::put_chunk(const std::string& upload_id, int index,
                                                       std::span<const uint8_t> data) {
    if (upload_id.empty() || upload_id.find('/') != std::string::npos || upload_id == "..")
        return std::unexpected("invalid upload id");
    return write_atomic(chunk_path(upload_id, index), data);
}

bool ChunkStore::has_chunk(const std::string& upload_id, int index) const {
    std::error_code ec;
    return fs::is_regular_file(chunk_path(upload_id, index), ec);
}

std::expected<AssembledFile, std::string> ChunkStore::assemble(const std::string& upload_id,
                                                               int total_chunks,
                                                               const std::string& dest_ref) {
    fs::path dest = path_for(dest_ref);
    if (dest.empty()) return std::unexpected("invalid destination reference");

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) return std::unexpected(std::format("mkdir: {}", ec.message()));

    fs::path tmp = dest;
    tmp += ".partial";
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return std::unexpected(std::format("open {}: {}", tmp.string(), std::strerror(errno)));

    Sha256 hasher;
    uint64_t total = 0;
    std::array<char, 64 * 1024> buf;

    for (int i = 0; i < total_chunks; ++i) {
        std::ifstream in(chunk_path(upload_id, i), std::ios::binary);
        if (!in) {
            out.close();
            fs::remove(tmp, ec);
            return std::unexpected(std::format("chunk {} unreadable", i));
        }
        while (in) {
            in.read(buf.data(), buf.size());
            auto n = in.gcount();
            if (n <= 0) break;
            out.write(buf.data(), n);
            hasher.update(std::span(reinterpret_cast<const uint8_t*>(buf.data()),
                                    static_cast<size_t>(n)));
            total += static_cast<uint64_t>(n);
        }
    }

    out.flush();
    if (!out || !hasher.ok()) {
        out.close();
        fs::remove(tmp, ec);
        return std::unexpected("assembly write failed");
    }
    out.close();

    fs::rename(tmp, dest, ec);
    if (ec) return std::unexpected(std::format("rename {}: {}", dest.string(), ec.message()));

    auto digest = hasher.hex_digest();
    if (digest.empty()) return std::unexpected("digest failed");
    return AssembledFile{.ref = dest_ref, .size = total, .sha256 = std::move(digest)};
}

void ChunkStore::remove_upload(const std::string& upload_id) {
    if (upload_id.empty() || upload_id.find('/') != std::string::npos || upload_id == "..") return;
    std::error_code ec;
    fs::remove_all(root_ / "uploads" / upload_id, ec);
    if (ec) std::println(stderr, "store: remove upload {}: {}", upload_id, ec.message());
}

std::vector<std::string> ChunkStore::upload_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (auto it = fs::directory_iterator(root_ / "uploads", ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->is_directory()) ids.push_back(it->path().filename().string());
    }
    return ids;
}

std::vector<std::string> ChunkStore::job_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (auto it = fs::directory_iterator(root_ / "blobs", ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->is_directory()) ids.push_back(it->path().filename().string());
    }
    return ids;
}

std::string ChunkStore::blob_ref(const std::string& job_id, const std::string& name) {
    return std::format("blobs/{}/{}", job_id, name);
}

fs::path ChunkStore::path_for(const std::string& ref) const {
    fs::path rel(ref);
    if (ref.empty() || rel.is_absolute()) return {};
    for (const auto& part : rel) {
        if (part == "..") return {};
    }
    return root_ / rel;
}

std::expected<void, std::string> ChunkStore::write_blob(const std::string& ref,
                                                        std::span<const uint8_t> data) {
    fs::path p = path_for(ref);
    if (p.empty()) return std::unexpected("invalid reference: " + ref);
    return write_atomic(p, data);
}

std::expected<void, std::string> ChunkStore::write_blob(const std::string& ref,
                                                        const std::string& text) {
    return write_blob(ref, std::span(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::expected<std::vector<uint8_t>, std::string> ChunkStore::read_blob(const std::string& ref) const {
    fs::path p = path_for(ref);
    if (p.empty()) return std::unexpected("invalid reference: " + ref);

    std::ifstream in(p, std::ios::binary | std::ios::ate);
    if (!in) return std::unexpected(std::format("open {}: {}", p.string(), std::strerror(errno)));

    auto size = in.tellg();
    std::vector<uint8_t> data(static_cast<size_t>(size));
    in.seekg(0);
    in.read(reinterpret_cast<char*>(data.data()), size);
    if (!in) return std::unexpected(std::format("read {} failed", p.string()));
    return data;
}

bool ChunkStore::exists(const std::string& ref) const {
    fs::path p = path_for(ref);
    std::error_code ec;
    return !p.empty() && fs::is_regular_file(p, ec);
}

void ChunkStore::remove_blob(const std::string& ref) {
    fs::path p = path_for(ref);
    if (p.empty()) return;
    std::error_code ec;
    fs::remove(p, ec);
}

void ChunkStore::remove_job_blobs(const std::string& job_id) {
    if (job_id.empty() || job_id.find('/') != std::string::npos || job_id == "..") return;
    std::error_code ec;
    fs::remove_all(root_ / "blobs" / job_id, ec);
}
