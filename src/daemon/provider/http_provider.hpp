#pragma once

#include "config.hpp"
#include "provider/provider.hpp"

#include <string>

class HttpProvider : public TranscriptionProvider {
public:
    // api_format: "openai" or "whisper.cpp"
    explicit HttpProvider(Config::Provider config);
    ~HttpProvider() override;

    HttpProvider(const HttpProvider&) = delete;
    HttpProvider& operator=(const HttpProvider&) = delete;

    std::expected<ProviderResult, ProviderError>
        transcribe(std::span<const uint8_t> wav, const std::optional<std::string>& language) override;

    std::string name() const override { return "http:" + config_.api_format; }

    // The pieces below are pure so they can be tested without a server.

    // Error class for a completed HTTP exchange; nullopt for 2xx.
    static std::optional<ProviderErrc> classify_http_status(long status);

    // Error class for a transport failure (libcurl result code).
    static ProviderErrc classify_transport_error(int curl_code);

    // Retry-After header value in delta-seconds form.
    static std::optional<std::chrono::milliseconds> parse_retry_after(std::string_view value);

    static std::expected<ProviderResult, ProviderError> parse_response(long status,
                                                                       const std::string& body);

    // Maps "english" or "EN" to "en"; nullopt when unrecognized.
    static std::optional<std::string> normalize_language(std::string_view language);

private:
    Config::Provider config_;
    std::string api_key_;
};
