#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

// Result of concatenating an upload's chunks into one blob.
struct AssembledFile {
    std::string ref;
    uint64_t size = 0;
    std::string sha256;
};

// Durable blob storage on the local filesystem.
//
// Layout under the root:
//   uploads/<upload_id>/chunk_<index>   raw upload chunks
//   blobs/<job_id>/<name>               job artifacts (source, pcm, segments, outputs)
//
// Storage references are paths relative to the root ("blobs/<job>/<name>").
// Writes go to a temporary file first and are renamed into place, so a
// reader never sees a partial chunk or blob.
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path root);

    bool init();
    const std::filesystem::path& root() const { return root_; }

    std::expected<void, std::string> put_chunk(const std::string& upload_id, int index,
                                               std::span<const uint8_t> data);
    bool has_chunk(const std::string& upload_id, int index) const;

    // Streams chunks 0..total_chunks-1 into dest_ref, hashing as it goes.
    std::expected<AssembledFile, std::string> assemble(const std::string& upload_id,
                                                       int total_chunks,
                                                       const std::string& dest_ref);

    void remove_upload(const std::string& upload_id);
    std::vector<std::string> upload_ids() const;

    static std::string blob_ref(const std::string& job_id, const std::string& name);

    std::expected<void, std::string> write_blob(const std::string& ref,
                                                std::span<const uint8_t> data);
    std::expected<void, std::string> write_blob(const std::string& ref, const std::string& text);
    std::expected<std::vector<uint8_t>, std::string> read_blob(const std::string& ref) const;
    bool exists(const std::string& ref) const;
    void remove_blob(const std::string& ref);
    void remove_job_blobs(const std::string& job_id);
    std::vector<std::string> job_ids() const;

    // Absolute path of a reference. Empty when the reference escapes the root.
    std::filesystem::path path_for(const std::string& ref) const;

private:
    std::filesystem::path chunk_path(const std::string& upload_id, int index) const;
    std::expected<void, std::string> write_atomic(const std::filesystem::path& dest,
                                                  std::span<const uint8_t> data);

    std::filesystem::path root_;
};
