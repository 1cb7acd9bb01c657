#pragma once

#include "pipeline/job.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

enum class ProviderErrc {
    RateLimited, // "too many requests"
    Transient,   // server-side or transport failure worth retrying
    Fatal,       // the request itself is bad; retrying will not help
};

std::string_view to_string(ProviderErrc kind);

struct ProviderError {
    ProviderErrc kind;
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after;
    long http_status = 0;
};

struct ProviderResult {
    std::string text;
    std::optional<std::string> language; // ISO 639-1 when known
    std::vector<Cue> cues;               // relative to the start of the submitted audio
    double processing_s = 0.0;
};

// External speech-to-text service. Implementations carry their own request timeout.
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    virtual std::expected<ProviderResult, ProviderError>
        transcribe(std::span<const uint8_t> wav, const std::optional<std::string>& language) = 0;

    virtual std::string name() const = 0;
};
