#pragma once

/**
 * AdminResult - outcome of an administrative operation
 *
 * Admin operations report NotFound / Validation / Conflict as values; only
 * collaborator failures (store unavailable) are thrown.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace tradefinder {
namespace admin {

enum class AdminOutcome : uint8_t { Ok, Created, NotFound, Validation, Conflict };

inline const char* admin_outcome_to_string(AdminOutcome o) {
    switch (o) {
    case AdminOutcome::Ok:
        return "OK";
    case AdminOutcome::Created:
        return "CREATED";
    case AdminOutcome::NotFound:
        return "NOT_FOUND";
    case AdminOutcome::Validation:
        return "VALIDATION";
    case AdminOutcome::Conflict:
        return "CONFLICT";
    }
    return "VALIDATION";
}

template <typename T>
struct AdminResult {
    AdminOutcome outcome = AdminOutcome::Ok;
    std::string message;
    std::optional<T> value;

    bool ok() const { return outcome == AdminOutcome::Ok || outcome == AdminOutcome::Created; }

    static AdminResult success(T v, AdminOutcome o = AdminOutcome::Ok) {
        AdminResult r;
        r.outcome = o;
        r.value = std::move(v);
        return r;
    }

    static AdminResult failure(AdminOutcome o, std::string msg) {
        AdminResult r;
        r.outcome = o;
        r.message = std::move(msg);
        return r;
    }
};

}  // namespace admin
}  // namespace tradefinder
