#pragma once

/**
 * Error types for the trade finder
 *
 * Thrown by handlers and collaborators, caught at the handler dispatch
 * boundary and turned into schedule statistics. Duplicate signals are not
 * errors and have no exception type.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tradefinder {

/**
 * Bad schedule expression, unknown handler reference, unusable config.
 * A task that fails with this never becomes live.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * A collaborator (AI, market data, record store) was unavailable for this run.
 * The run aborts; the next natural fire is the retry.
 */
class TransientCollaboratorError : public std::runtime_error {
public:
    enum class Kind : uint8_t { Timeout, RateLimited, Unavailable };

    TransientCollaboratorError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

    static const char* kind_name(Kind kind) {
        switch (kind) {
        case Kind::Timeout:
            return "TIMEOUT";
        case Kind::RateLimited:
            return "RATE_LIMITED";
        case Kind::Unavailable:
            return "UNAVAILABLE";
        }
        return "UNKNOWN";
    }

private:
    Kind kind_;
};

// Invalid or missing fields in AI output
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

class AlertDeliveryError : public std::runtime_error {
public:
    explicit AlertDeliveryError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace tradefinder
