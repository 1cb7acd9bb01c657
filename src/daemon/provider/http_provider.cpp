#include "provider/http_provider.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <utility>

using json = nlohmann::json;

namespace {

struct ResponseHeaders {
    std::optional<std::chrono::milliseconds> retry_after;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<ResponseHeaders*>(userdata);
    std::string_view line(buffer, size * nitems);

    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        std::string name(line.substr(0, colon));
        std::ranges::transform(name, name.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto value = line.substr(colon + 1);
        if (name == "retry-after") {
            if (auto d = HttpProvider::parse_retry_after(value)) headers->retry_after = d;
        } else if (name == "retry-after-ms") {
            if (auto d = HttpProvider::parse_retry_after(value))
                headers->retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(*d / 1000);
        }
    }
    return size * nitems;
}

std::string trim(std::string s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 24> kLanguageNames = {{
    {"english", "en"},   {"spanish", "es"},    {"french", "fr"},    {"german", "de"},
    {"italian", "it"},   {"portuguese", "pt"}, {"dutch", "nl"},     {"russian", "ru"},
    {"chinese", "zh"},   {"japanese", "ja"},   {"korean", "ko"},    {"arabic", "ar"},
    {"hindi", "hi"},     {"turkish", "tr"},    {"polish", "pl"},    {"swedish", "sv"},
    {"danish", "da"},    {"norwegian", "no"},  {"finnish", "fi"},   {"greek", "el"},
    {"czech", "cs"},     {"ukrainian", "uk"},  {"hebrew", "he"},    {"indonesian", "id"},
}};

std::string error_message(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("error")) {
        const auto& e = j["error"];
        if (e.is_string()) return e.get<std::string>();
        if (e.is_object() && e.contains("message") && e["message"].is_string())
            return e["message"].get<std::string>();
    }
    return {};
}

} // namespace

std::string_view to_string(ProviderErrc kind) {
    switch (kind) {
        case ProviderErrc::RateLimited: return "rate_limited";
        case ProviderErrc::Transient:   return "transient";
        case ProviderErrc::Fatal:       return "fatal";
    }
    return "unknown";
}

HttpProvider::HttpProvider(Config::Provider config) : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    if (!config_.api_key_env.empty()) {
        if (const char* key = std::getenv(config_.api_key_env.c_str())) api_key_ = key;
    }
    while (!config_.url.empty() && config_.url.back() == '/') config_.url.pop_back();
}

HttpProvider::~HttpProvider() {
    curl_global_cleanup();
}

std::optional<ProviderErrc> HttpProvider::classify_http_status(long status) {
    if (status >= 200 && status < 300) return std::nullopt;
    if (status == 429) return ProviderErrc::RateLimited;
    if (status == 408 || status == 425 || status >= 500) return ProviderErrc::Transient;
    return ProviderErrc::Fatal;
}

ProviderErrc HttpProvider::classify_transport_error(int curl_code) {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_BAD_FUNCTION_ARGUMENT:
            return ProviderErrc::Fatal;
        default:
            return ProviderErrc::Transient;
    }
}

std::optional<std::chrono::milliseconds> HttpProvider::parse_retry_after(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.remove_suffix(1);
    if (value.empty()) return std::nullopt;

    double seconds = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc{} || ptr != value.data() + value.size() || seconds < 0.0)
        return std::nullopt;
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

std::optional<std::string> HttpProvider::normalize_language(std::string_view language) {
    std::string lower(language);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    lower = trim(std::move(lower));
    if (lower.size() == 2 && std::ranges::all_of(lower, [](char c) { return c >= 'a' && c <= 'z'; }))
        return lower;

    auto it = std::ranges::find(kLanguageNames, std::string_view(lower),
                                &std::pair<std::string_view, std::string_view>::first);
    if (it == kLanguageNames.end()) return std::nullopt;
    return std::string(it->second);
}

std::expected<ProviderResult, ProviderError> HttpProvider::parse_response(long status,
                                                                          const std::string& body) {
    if (auto kind = classify_http_status(status)) {
        auto msg = error_message(body);
        return std::unexpected(ProviderError{
            .kind = *kind,
            .message = msg.empty() ? std::format("HTTP {}", status)
                                   : std::format("HTTP {}: {}", status, msg),
            .retry_after = std::nullopt,
            .http_status = status,
        });
    }

    try {
        auto j = json::parse(body);
        if (!j.contains("text")) {
            auto msg = error_message(body);
            return std::unexpected(ProviderError{
                .kind = ProviderErrc::Transient,
                .message = msg.empty() ? "response without text" : "server error: " + msg,
                .retry_after = std::nullopt,
                .http_status = status,
            });
        }

        ProviderResult result;
        result.text = trim(j["text"].get<std::string>());
        if (j.contains("language") && j["language"].is_string())
            result.language = normalize_language(j["language"].get<std::string>());

        if (j.contains("segments") && j["segments"].is_array()) {
            for (const auto& s : j["segments"]) {
                Cue cue{s.value("start", 0.0), s.value("end", 0.0), trim(s.value("text", ""))};
                if (!cue.text.empty()) result.cues.push_back(std::move(cue));
            }
        }
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrc::Transient,
            .message = std::string("JSON parse error: ") + e.what(),
            .retry_after = std::nullopt,
            .http_status = status,
        });
    }
}

std::expected<ProviderResult, ProviderError>
HttpProvider::transcribe(std::span<const uint8_t> wav, const std::optional<std::string>& language) {
    if (wav.empty()) {
        return std::unexpected(ProviderError{ProviderErrc::Fatal, "empty audio", std::nullopt, 0});
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(ProviderError{ProviderErrc::Transient, "curl_easy_init failed",
                                             std::nullopt, 0});
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    auto add_field = [&mime](const char* name, const std::string& value) {
        auto* p = curl_mime_addpart(mime);
        curl_mime_name(p, name);
        curl_mime_data(p, value.c_str(), CURL_ZERO_TERMINATED);
    };

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav.data()), wav.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (config_.api_format == "openai") {
        endpoint = config_.url + "/v1/audio/transcriptions";
        add_field("model", config_.model);
    } else {
        // whisper.cpp server format
        endpoint = config_.url + "/inference";
        add_field("temperature", "0.0");
    }
    add_field("response_format", "verbose_json");
    if (language && !language->empty()) add_field("language", *language);

    curl_slist* headers = nullptr;
    if (!api_key_.empty()) {
        auto auth = "Authorization: Bearer " + api_key_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    std::string response_body;
    ResponseHeaders response_headers;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    double processing_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(ProviderError{
            .kind = classify_transport_error(res),
            .message = std::string("curl error: ") + curl_easy_strerror(res),
            .retry_after = std::nullopt,
            .http_status = 0,
        });
    }

    auto result = parse_response(status, response_body);
    if (!result) {
        result.error().retry_after = response_headers.retry_after;
        return result;
    }
    result->processing_s = processing_s;
    return result;
}
