#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Chunk payloads travel over the JSON IPC channel base64-encoded.
namespace base64 {

std::string encode(std::span<const uint8_t> data);

// Returns nullopt on malformed input.
std::optional<std::vector<uint8_t>> decode(std::string_view text);

} // namespace base64
