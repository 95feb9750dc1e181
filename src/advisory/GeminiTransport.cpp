#include "bountygate/advisory/GeminiTransport.hpp"

#include <algorithm>
#include <memory>
#include <thread>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "bountygate/infra/Logger.hpp"

namespace bountygate {

GeminiTransport::GeminiTransport(GeminiSettings settings, Logger& log)
    : settings_(std::move(settings)),
      log_(log) {
    if (settings_.max_attempts < 1) settings_.max_attempts = 1;
}

size_t GeminiTransport::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string GeminiTransport::build_body(const AdvisoryRequest& request) {
    nlohmann::json body = {
        {"contents", nlohmann::json::array({
            {{"role", "user"}, {"parts", nlohmann::json::array({{{"text", request.prompt}}})}}
        })},
        {"generationConfig", {
            {"temperature", request.temperature},
            {"maxOutputTokens", request.max_tokens}
        }}
    };
    if (!request.system_context.empty()) {
        body["systemInstruction"] = {
            {"parts", nlohmann::json::array({{{"text", request.system_context}}})}
        };
    }
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

AdvisoryReply GeminiTransport::extract_text(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return AdvisoryReply::failure("response is not a JSON object");
    }

    const auto cands = j.find("candidates");
    if (cands == j.end() || !cands->is_array() || cands->empty()) {
        if (j.contains("promptFeedback")) {
            return AdvisoryReply::failure("prompt rejected by model safety filter");
        }
        return AdvisoryReply::failure("response has no candidates");
    }

    const auto& first = (*cands)[0];
    if (!first.is_object() || !first.contains("content") || !first["content"].is_object()) {
        return AdvisoryReply::failure("candidate has no content");
    }
    const auto& parts = first["content"].value("parts", nlohmann::json::array());
    if (!parts.is_array()) {
        return AdvisoryReply::failure("candidate content has no parts");
    }

    std::string text;
    for (const auto& p : parts) {
        if (p.is_object() && p.contains("text") && p["text"].is_string()) {
            text += p["text"].get<std::string>();
        }
    }
    if (text.empty()) {
        return AdvisoryReply::failure("empty response from model");
    }
    return AdvisoryReply::success(std::move(text));
}

GeminiTransport::HttpResult GeminiTransport::post_once(const std::string& url,
                                                       const std::string& body) const {
    HttpResult result;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    std::string hdr_key = "x-goog-api-key: " + settings_.api_key;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, hdr_key.c_str());
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(curl.get(), CURLOPT_POST,           1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,      &result.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,        settings_.timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, std::min(settings_.timeout_sec, 10L));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,       1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        return result;
    }

    result.transport_ok = true;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
    return result;
}

AdvisoryReply GeminiTransport::ask(const AdvisoryRequest& request) {
    if (settings_.api_key.empty()) {
        return AdvisoryReply::failure("advisory API key not configured");
    }

    const std::string url = settings_.endpoint + "/models/" + settings_.model + ":generateContent";
    const std::string body = build_body(request);

    std::string last_error;
    auto backoff = settings_.backoff_min;

    for (int attempt = 1; attempt <= settings_.max_attempts; ++attempt) {
        HttpResult r = post_once(url, body);

        bool retryable = false;
        if (!r.transport_ok) {
            last_error = "transport error: " + r.error;
            retryable = true;
        } else if (r.status == 200) {
            AdvisoryReply reply = extract_text(r.body);
            if (reply.ok) {
                log_.debug("ADVISORY", "model reply received (" + std::to_string(reply.text.size()) + " bytes)");
            }
            return reply;
        } else {
            last_error = "HTTP " + std::to_string(r.status);
            retryable = (r.status == 429 || r.status >= 500);
        }

        if (!retryable || attempt == settings_.max_attempts) break;

        log_.warn("ADVISORY", "retry " + std::to_string(attempt) + "/" +
                              std::to_string(settings_.max_attempts) + " (" + last_error + ")");
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, settings_.backoff_max);
    }

    log_.error("ADVISORY", "request failed: " + last_error);
    return AdvisoryReply::failure(last_error);
}

} // namespace bountygate
