#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <openssl/evp.h>
#include <span>
#include <string>
#include <string_view>

// Incremental SHA-256 over OpenSSL's EVP interface.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    // False after a failed digest call or after hex_digest(); further calls are no-ops.
    bool ok() const { return ctx_ != nullptr; }

    void update(std::span<const uint8_t> data);
    void update(std::string_view data);

    // Finishes the digest. Returns an empty string on failure.
    std::string hex_digest();

private:
    void reset();

    EVP_MD_CTX* ctx_ = nullptr;
};

namespace hashing {

std::string sha256_hex(std::span<const uint8_t> data);
std::expected<std::string, std::string> sha256_file(const std::filesystem::path& path);

// Case-insensitive comparison of two hex digests.
bool digest_equal(std::string_view a, std::string_view b);

} // namespace hashing
