#include "base64.hpp"

#include <openssl/evp.h>

namespace base64 {

std::string encode(std::span<const uint8_t> data) {
    if (data.empty()) return {};

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the bytes produced by '=' padding; drop them.
    size_t padding = 0;
    if (text.back() == '=') padding++;
    if (text.size() >= 2 && text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

} // namespace base64
