#pragma once

/**
 * Claude reasoning client - Anthropic Messages API over libcurl
 *
 * Sends the system instructions and the JSON payload as one user message
 * and returns the concatenated text blocks of the reply.
 *
 * Thread safety: each invoke() uses its own curl easy handle, so overlapping
 * pipeline runs can call it concurrently. curl_global_init runs once per
 * process.
 *
 * Environment:
 *   ANTHROPIC_API_KEY / CLAUDE_API_KEY  API key
 *   TRADE_FINDER_MODEL                  model override
 *   CLAUDE_API_URL                      endpoint override
 */

#include "reasoning_client.hpp"

#include <string>

namespace tradefinder {
namespace ai {

struct ClaudeClientConfig {
    std::string api_key;
    std::string api_url = "https://api.anthropic.com/v1/messages";
    std::string model = "claude-sonnet-4-20250514";
    long connect_timeout_s = 10;
};

class ClaudeReasoningClient : public ReasoningClient {
public:
    explicit ClaudeReasoningClient(ClaudeClientConfig config);

    bool is_valid() const { return !config_.api_key.empty(); }
    const std::string& model() const { return config_.model; }

    ReasoningResponse invoke(const ReasoningRequest& request) override;

    // Exposed for tests
    std::string build_request_json(const ReasoningRequest& request) const;
    static bool parse_response(const std::string& body, ReasoningResponse& response);

private:
    ClaudeClientConfig config_;
};

}  // namespace ai
}  // namespace tradefinder
