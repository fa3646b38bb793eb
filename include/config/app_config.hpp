#pragma once

/**
 * Trade finder application configuration
 *
 * Every field is optional; missing fields keep the defaults below.
 *
 * Format:
 * {
 *   "trade_finder": {
 *     "enabled": true,
 *     "symbols": ["NQ", "ES", "YM", "GC", "RTY"],
 *     "event_lookback_minutes": 90,
 *     "ohlc_candle_count": 100,
 *     "timeframes": ["5m", "15m", "1h", "4h"],
 *     "trade_expiry_hours": 4,
 *     "analysis_profile": "SILVER_BULLET_WINDOW",
 *     "system_prompt_file": "prompts/trade_finder_system.txt",
 *     "confidence_threshold_high": 80,
 *     "confidence_threshold_medium": 60,
 *     "ai_timeout_ms": 120000,
 *     "manual_levels": {"NQ": {"pdh": 21500.0}}
 *   },
 *   "scheduler": {"worker_threads": 4, "fire_immediately": true, "seed_defaults": true},
 *   "store": {"data_dir": "data", "market_data_dir": ""},
 *   "ai": {"api_url": "...", "model": "...", "max_tokens": 16000, "temperature": 0.7},
 *   "alert": {"webhook_url": "", "timeout_ms": 10000},
 *   "logging": {"min_level": "info"}
 * }
 *
 * Environment overrides (applied after the file):
 *   ANTHROPIC_API_KEY / CLAUDE_API_KEY, TRADE_FINDER_MODEL, CLAUDE_API_URL,
 *   TRADE_FINDER_ALERT_WEBHOOK
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tradefinder {
namespace config {

struct TradeFinderSettings {
    bool enabled = true;
    std::vector<std::string> symbols{"NQ", "ES", "YM", "GC", "RTY"};
    int event_lookback_minutes = 90;
    int ohlc_candle_count = 100;
    std::vector<std::string> timeframes{"5m", "15m", "1h", "4h"};
    int trade_expiry_hours = 4;
    std::string analysis_profile = "SILVER_BULLET_WINDOW";
    std::string system_prompt_file = "prompts/trade_finder_system.txt";
    int confidence_threshold_high = 80;
    int confidence_threshold_medium = 60;
    int64_t ai_timeout_ms = 120000;
    nlohmann::json manual_levels; // null = none
};

struct SchedulerSettings {
    int worker_threads = 4;
    bool fire_immediately = true;
    bool seed_defaults = true;
};

struct StoreSettings {
    std::string data_dir = "data"; // empty = memory only
    std::string market_data_dir;   // empty = data_dir
};

struct AiSettings {
    std::string api_key; // environment only, never read from the file
    std::string api_url = "https://api.anthropic.com/v1/messages";
    std::string model = "claude-sonnet-4-20250514";
    int max_tokens = 16000;
    double temperature = 0.7;
};

struct AlertSettings {
    std::string webhook_url; // empty = alerts logged only
    long timeout_ms = 10000;
};

struct LoggingSettings {
    std::string min_level = "info";
};

struct AppConfig {
    TradeFinderSettings trade_finder;
    SchedulerSettings scheduler;
    StoreSettings store;
    AiSettings ai;
    AlertSettings alert;
    LoggingSettings logging;

    // Throws ConfigurationError if the file cannot be read or is invalid
    static AppConfig load(const std::string& filename);

    // Throws ConfigurationError on bad types or values
    static AppConfig parse(const nlohmann::json& doc);

    void apply_env();

    // Throws ConfigurationError
    void validate() const;

    const std::string& market_data_dir() const {
        return store.market_data_dir.empty() ? store.data_dir : store.market_data_dir;
    }
};

}  // namespace config
}  // namespace tradefinder
