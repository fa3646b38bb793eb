#pragma once

/**
 * HandlerDispatcher - named handler registry
 *
 * Maps handler references ("tradeFinder.findTrades") to callables.
 * Registration happens once at startup; lookups are resolved eagerly when
 * a task is scheduled so a broken reference never becomes a runtime-only
 * failure.
 *
 * invoke() is the failure boundary: any exception a handler throws is
 * caught here and returned as a DispatchOutcome.
 *
 * Usage:
 *   HandlerDispatcher dispatcher;
 *   dispatcher.register_handler("tradeFinder.findTrades",
 *       [&](const ParameterBag& p) { pipeline.find_trades(p); });
 *   dispatcher.register_nullary("tradeLifecycle.expireTrades",
 *       [&] { lifecycle.sweep_expired(); });
 *   auto outcome = dispatcher.invoke("tradeFinder.findTrades", params);
 */

#include "schedule_config.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tradefinder {
namespace scheduler {

using Handler = std::function<void(const ParameterBag&)>;

struct DispatchOutcome {
    bool success = false;
    std::string error;
    uint64_t duration_ms = 0;
};

class HandlerDispatcher {
public:
    HandlerDispatcher() = default;

    HandlerDispatcher(const HandlerDispatcher&) = delete;
    HandlerDispatcher& operator=(const HandlerDispatcher&) = delete;

    // Throws ConfigurationError on empty reference, empty callable or duplicate
    void register_handler(const std::string& handler_ref, Handler handler);

    // Zero-arg handler; parameters are ignored at invoke time
    void register_nullary(const std::string& handler_ref, std::function<void()> handler);

    // Throws ConfigurationError if handler_ref is unknown
    Handler resolve(const std::string& handler_ref) const;

    bool contains(const std::string& handler_ref) const;
    std::vector<std::string> handler_refs() const;

    /**
     * Run the handler with the given parameters.
     * Never throws for handler failures; unknown references also come back
     * as an unsuccessful outcome.
     */
    DispatchOutcome invoke(const std::string& handler_ref, const ParameterBag& parameters) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
};

}  // namespace scheduler
}  // namespace tradefinder
