#include "content_hash.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <vector>

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        reset();
    }
}

Sha256::~Sha256() {
    reset();
}

void Sha256::reset() {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
}

void Sha256::update(std::span<const uint8_t> data) {
    if (!ctx_ || data.empty()) return;
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        reset();
    }
}

void Sha256::update(std::string_view data) {
    update(std::span(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::string Sha256::hex_digest() {
    if (!ctx_) return {};

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    bool done = EVP_DigestFinal_ex(ctx_, hash, &len) == 1;
    reset();
    if (!done) return {};

    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out += std::format("{:02x}", hash[i]);
    }
    return out;
}

namespace hashing {

std::string sha256_hex(std::span<const uint8_t> data) {
    Sha256 h;
    h.update(data);
    return h.hex_digest();
}

std::expected<std::string, std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }

    Sha256 h;
    std::vector<char> buf(1 << 16);
    while (f.read(buf.data(), static_cast<std::streamsize>(buf.size())) || f.gcount() > 0) {
        h.update(std::string_view(buf.data(), static_cast<size_t>(f.gcount())));
    }
    if (f.bad()) {
        return std::unexpected("read error on " + path.string());
    }

    auto digest = h.hex_digest();
    if (digest.empty()) {
        return std::unexpected(std::string("sha256 digest failed"));
    }
    return digest;
}

bool digest_equal(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace hashing
