#pragma once

/**
 * Reasoning client - AI collaborator interface
 *
 * Results come back in a response struct rather than as exceptions;
 * the pipeline decides what a failed response means for its run.
 */

#include <cstdint>
#include <string>

namespace tradefinder {
namespace ai {

struct ReasoningRequest {
    std::string request_id;
    std::string system_instructions;
    std::string input; // JSON payload
    int max_tokens = 16000;
    double temperature = 0.7;
    int64_t timeout_ms = 120000;
};

enum class ReasoningError : uint8_t { None, Timeout, RateLimited, Unavailable, MalformedOutput };

inline const char* reasoning_error_to_string(ReasoningError e) {
    switch (e) {
    case ReasoningError::None:
        return "NONE";
    case ReasoningError::Timeout:
        return "TIMEOUT";
    case ReasoningError::RateLimited:
        return "RATE_LIMITED";
    case ReasoningError::Unavailable:
        return "UNAVAILABLE";
    case ReasoningError::MalformedOutput:
        return "MALFORMED_OUTPUT";
    }
    return "UNKNOWN";
}

struct ReasoningResponse {
    bool success = false;
    ReasoningError error_kind = ReasoningError::None;
    std::string error;
    long http_code = 0;
    uint32_t latency_ms = 0;
    uint32_t input_tokens = 0;
    uint32_t output_tokens = 0;
    std::string request_id;
    std::string output; // model text
};

class ReasoningClient {
public:
    virtual ~ReasoningClient() = default;

    // Must be safe to call from several threads at once
    virtual ReasoningResponse invoke(const ReasoningRequest& request) = 0;
};

}  // namespace ai
}  // namespace tradefinder
