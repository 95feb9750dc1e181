#pragma once

#include <chrono>
#include <string>

#include "bountygate/advisory/AdvisoryTransport.hpp"

namespace bountygate {

class Logger;

struct GeminiSettings {
    std::string api_key;
    std::string model = "gemini-1.5-flash";
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta";
    long timeout_sec = 20;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_min{2000};
    std::chrono::milliseconds backoff_max{10000};
};

// ---------------------------------------------------------------------------
// Gemini generateContent over libcurl.
//
//   POST {endpoint}/models/{model}:generateContent
//   x-goog-api-key: <key>
//
// Transport errors, HTTP 429 and HTTP 5xx are retried with exponential
// back-off (backoff_min doubling, capped at backoff_max). Other HTTP errors
// and unparseable bodies fail immediately. curl_global_init() must have been
// called by main() before the first request.
// ---------------------------------------------------------------------------
class GeminiTransport : public AdvisoryTransport {
public:
    GeminiTransport(GeminiSettings settings, Logger& log);

    AdvisoryReply ask(const AdvisoryRequest& request) override;
    std::string model_name() const override { return settings_.model; }

    // Request body and reply extraction, exposed for tests.
    static std::string build_body(const AdvisoryRequest& request);
    static AdvisoryReply extract_text(const std::string& body);

private:
    struct HttpResult {
        bool transport_ok = false;
        long status = 0;
        std::string body;
        std::string error;
    };

    HttpResult post_once(const std::string& url, const std::string& body) const;
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    GeminiSettings settings_;
    Logger& log_;
};

} // namespace bountygate
