#include "../../include/ai/claude_reasoning_client.hpp"

#include "../../include/logging/async_logger.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>

using json = nlohmann::json;

namespace tradefinder::ai {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

ClaudeReasoningClient::ClaudeReasoningClient(ClaudeClientConfig config) : config_(std::move(config)) {
    ensure_curl_global_init();
}

std::string ClaudeReasoningClient::build_request_json(const ReasoningRequest& request) const {
    json body = {{"model", config_.model},
                 {"max_tokens", request.max_tokens},
                 {"temperature", request.temperature},
                 {"messages", json::array({{{"role", "user"}, {"content", request.input}}})}};
    if (!request.system_instructions.empty()) {
        body["system"] = request.system_instructions;
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool ClaudeReasoningClient::parse_response(const std::string& body, ReasoningResponse& response) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return false;

    auto content = doc.find("content");
    if (content == doc.end() || !content->is_array())
        return false;

    std::string text;
    for (const auto& block : *content) {
        if (block.is_object() && block.value("type", std::string()) == "text" && block.contains("text") &&
            block["text"].is_string()) {
            text += block["text"].get<std::string>();
        }
    }
    if (text.empty())
        return false;

    auto usage = doc.find("usage");
    if (usage != doc.end() && usage->is_object()) {
        response.input_tokens = usage->value("input_tokens", 0u);
        response.output_tokens = usage->value("output_tokens", 0u);
    }
    response.output = std::move(text);
    return true;
}

ReasoningResponse ClaudeReasoningClient::invoke(const ReasoningRequest& request) {
    ReasoningResponse response;
    response.request_id = request.request_id;

    if (!is_valid()) {
        response.error_kind = ReasoningError::Unavailable;
        response.error = "API key missing";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error_kind = ReasoningError::Unavailable;
        response.error = "curl_easy_init failed";
        return response;
    }

    auto start = std::chrono::steady_clock::now();

    std::string request_body = build_request_json(request);

    // Set headers
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "anthropic-version: 2023-06-01");
    std::string auth_header = "x-api-key: " + config_.api_key;
    headers = curl_slist_append(headers, auth_header.c_str());

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_URL, config_.api_url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connect_timeout_s);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // required with timeouts in threaded use

    CURLcode res = curl_easy_perform(curl);

    auto end = std::chrono::steady_clock::now();
    response.latency_ms =
        static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        response.error_kind = res == CURLE_OPERATION_TIMEDOUT ? ReasoningError::Timeout : ReasoningError::Unavailable;
        response.error = curl_easy_strerror(res);
        LOGF_WARN(Ai, "Request %s failed after %u ms: %s", request.request_id.c_str(), response.latency_ms,
                  response.error.c_str());
        return response;
    }

    if (response.http_code != 200) {
        if (response.http_code == 429) {
            response.error_kind = ReasoningError::RateLimited;
        } else if (response.http_code == 408 || response.http_code == 504) {
            response.error_kind = ReasoningError::Timeout;
        } else {
            response.error_kind = ReasoningError::Unavailable;
        }
        response.error = "HTTP " + std::to_string(response.http_code);
        LOGF_WARN(Ai, "Request %s: %s", request.request_id.c_str(), response.error.c_str());
        return response;
    }

    if (!parse_response(response_body, response)) {
        response.error_kind = ReasoningError::MalformedOutput;
        response.error = "Failed to parse response";
        return response;
    }

    LOGF_INFO(Ai, "Request %s ok in %u ms (%u in / %u out tokens)", request.request_id.c_str(), response.latency_ms,
              response.input_tokens, response.output_tokens);
    response.success = true;
    return response;
}

}  // namespace tradefinder::ai
