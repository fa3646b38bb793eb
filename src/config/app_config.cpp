#include "../../include/config/app_config.hpp"

#include "../../include/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace tradefinder::config {

namespace {

template <typename T>
void read_field(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null())
        return;
    out = it->get<T>();
}

void read_symbols(const json& section, const char* key, std::vector<std::string>& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null())
        return;
    out.clear();
    if (it->is_string()) {
        // "NQ,ES,YM" form
        out = util::split_symbols(it->get<std::string>());
        return;
    }
    for (const auto& item : *it) {
        std::string s = util::to_upper(util::trim(item.get<std::string>()));
        if (!s.empty())
            out.push_back(s);
    }
}

const json& section_of(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end() || it->is_null())
        return empty;
    if (!it->is_object()) {
        throw ConfigurationError(std::string("config section '") + name + "' must be an object");
    }
    return *it;
}

}  // namespace

AppConfig AppConfig::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ConfigurationError("Config file is not a JSON object: " + filename);
    }
    return parse(doc);
}

AppConfig AppConfig::parse(const json& doc) {
    AppConfig config;
    try {
        const json& tf = section_of(doc, "trade_finder");
        read_field(tf, "enabled", config.trade_finder.enabled);
        read_symbols(tf, "symbols", config.trade_finder.symbols);
        read_field(tf, "event_lookback_minutes", config.trade_finder.event_lookback_minutes);
        read_field(tf, "ohlc_candle_count", config.trade_finder.ohlc_candle_count);
        read_field(tf, "timeframes", config.trade_finder.timeframes);
        read_field(tf, "trade_expiry_hours", config.trade_finder.trade_expiry_hours);
        read_field(tf, "analysis_profile", config.trade_finder.analysis_profile);
        read_field(tf, "system_prompt_file", config.trade_finder.system_prompt_file);
        read_field(tf, "confidence_threshold_high", config.trade_finder.confidence_threshold_high);
        read_field(tf, "confidence_threshold_medium", config.trade_finder.confidence_threshold_medium);
        read_field(tf, "ai_timeout_ms", config.trade_finder.ai_timeout_ms);
        if (tf.contains("manual_levels")) {
            config.trade_finder.manual_levels = tf["manual_levels"];
        }

        const json& sched = section_of(doc, "scheduler");
        read_field(sched, "worker_threads", config.scheduler.worker_threads);
        read_field(sched, "fire_immediately", config.scheduler.fire_immediately);
        read_field(sched, "seed_defaults", config.scheduler.seed_defaults);

        const json& st = section_of(doc, "store");
        read_field(st, "data_dir", config.store.data_dir);
        read_field(st, "market_data_dir", config.store.market_data_dir);

        const json& ai = section_of(doc, "ai");
        read_field(ai, "api_url", config.ai.api_url);
        read_field(ai, "model", config.ai.model);
        read_field(ai, "max_tokens", config.ai.max_tokens);
        read_field(ai, "temperature", config.ai.temperature);

        const json& al = section_of(doc, "alert");
        read_field(al, "webhook_url", config.alert.webhook_url);
        read_field(al, "timeout_ms", config.alert.timeout_ms);

        const json& lg = section_of(doc, "logging");
        read_field(lg, "min_level", config.logging.min_level);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
}

void AppConfig::apply_env() {
    const char* key = std::getenv("ANTHROPIC_API_KEY");
    if (!key) {
        key = std::getenv("CLAUDE_API_KEY");
    }
    if (key && *key) {
        ai.api_key = key;
    }

    const char* model = std::getenv("TRADE_FINDER_MODEL");
    if (model && *model) {
        ai.model = model;
    }

    const char* url = std::getenv("CLAUDE_API_URL");
    if (url && *url) {
        ai.api_url = url;
    }

    const char* webhook = std::getenv("TRADE_FINDER_ALERT_WEBHOOK");
    if (webhook && *webhook) {
        alert.webhook_url = webhook;
    }
}

void AppConfig::validate() const {
    const auto& tf = trade_finder;
    if (tf.event_lookback_minutes <= 0) {
        throw ConfigurationError("trade_finder.event_lookback_minutes must be positive");
    }
    if (tf.ohlc_candle_count <= 0) {
        throw ConfigurationError("trade_finder.ohlc_candle_count must be positive");
    }
    if (tf.trade_expiry_hours <= 0) {
        throw ConfigurationError("trade_finder.trade_expiry_hours must be positive");
    }
    if (tf.confidence_threshold_medium < 0 || tf.confidence_threshold_high > 100 ||
        tf.confidence_threshold_medium > tf.confidence_threshold_high) {
        throw ConfigurationError("confidence thresholds must satisfy 0 <= medium <= high <= 100");
    }
    if (tf.ai_timeout_ms <= 0) {
        throw ConfigurationError("trade_finder.ai_timeout_ms must be positive");
    }
    if (!tf.manual_levels.is_null() && !tf.manual_levels.is_object()) {
        throw ConfigurationError("trade_finder.manual_levels must be an object");
    }
    if (scheduler.worker_threads <= 0) {
        throw ConfigurationError("scheduler.worker_threads must be positive");
    }
    if (ai.max_tokens <= 0) {
        throw ConfigurationError("ai.max_tokens must be positive");
    }
    if (alert.timeout_ms <= 0) {
        throw ConfigurationError("alert.timeout_ms must be positive");
    }
}

}  // namespace tradefinder::config
