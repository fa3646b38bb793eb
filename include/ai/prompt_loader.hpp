#pragma once

#include "../logging/async_logger.hpp"
#include "../util/string_utils.hpp"

#include <fstream>
#include <iterator>
#include <string>

namespace tradefinder {
namespace ai {

constexpr const char* DEFAULT_TRADE_FINDER_PROMPT =
    "You are an expert trading AI analyzing market structure. "
    "Identify high-confidence trade setups based on liquidity sweeps, CISD patterns, and FVG entries. "
    "Return your analysis as JSON with status, direction, confidence, entry, stop, targets, and narrative.";

/**
 * Read a prompt file; fall back to `fallback` if it is missing or empty.
 */
inline std::string load_prompt_with_fallback(const std::string& path, const std::string& fallback) {
    if (path.empty())
        return fallback;

    std::ifstream in(path);
    if (!in.is_open()) {
        LOGF_WARN(Ai, "Prompt file %s not found, using built-in prompt", path.c_str());
        return fallback;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (util::trim(content).empty()) {
        LOGF_WARN(Ai, "Prompt file %s is empty, using built-in prompt", path.c_str());
        return fallback;
    }
    return content;
}

}  // namespace ai
}  // namespace tradefinder
