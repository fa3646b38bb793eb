#include "../../include/scheduler/handler_dispatcher.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/time_utils.hpp"

namespace tradefinder::scheduler {

void HandlerDispatcher::register_handler(const std::string& handler_ref, Handler handler) {
    if (handler_ref.empty()) {
        throw ConfigurationError("handler reference must not be empty");
    }
    if (!handler) {
        throw ConfigurationError("handler '" + handler_ref + "' has no callable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_.emplace(handler_ref, std::move(handler)).second) {
        throw ConfigurationError("handler '" + handler_ref + "' already registered");
    }
    LOGF_DEBUG(Dispatch, "Registered handler %s", handler_ref.c_str());
}

void HandlerDispatcher::register_nullary(const std::string& handler_ref, std::function<void()> handler) {
    if (!handler) {
        throw ConfigurationError("handler '" + handler_ref + "' has no callable");
    }
    register_handler(handler_ref, [fn = std::move(handler)](const ParameterBag&) { fn(); });
}

Handler HandlerDispatcher::resolve(const std::string& handler_ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(handler_ref);
    if (it == handlers_.end()) {
        throw ConfigurationError("unknown handler reference '" + handler_ref + "'");
    }
    return it->second;
}

bool HandlerDispatcher::contains(const std::string& handler_ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(handler_ref) > 0;
}

std::vector<std::string> HandlerDispatcher::handler_refs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> refs;
    refs.reserve(handlers_.size());
    for (const auto& [ref, handler] : handlers_) {
        refs.push_back(ref);
    }
    return refs;
}

DispatchOutcome HandlerDispatcher::invoke(const std::string& handler_ref, const ParameterBag& parameters) const {
    DispatchOutcome outcome;
    uint64_t start = util::now_ns();

    try {
        // Copy out of the registry so the handler runs without the lock held
        Handler handler = resolve(handler_ref);
        handler(parameters);
        outcome.success = true;
    } catch (const std::exception& e) {
        outcome.error = e.what();
        if (outcome.error.empty()) {
            outcome.error = "handler failed";
        }
        LOGF_WARN(Dispatch, "Handler %s failed: %s", handler_ref.c_str(), outcome.error.c_str());
    } catch (...) {
        // Non-std throws must not unwind into the worker thread
        outcome.error = "unknown exception";
        LOGF_WARN(Dispatch, "Handler %s failed: %s", handler_ref.c_str(), outcome.error.c_str());
    }

    outcome.duration_ms = (util::now_ns() - start) / 1'000'000;
    return outcome;
}

}  // namespace tradefinder::scheduler
