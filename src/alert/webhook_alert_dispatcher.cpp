#include "../../include/alert/webhook_alert_dispatcher.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/time_utils.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <mutex>

using json = nlohmann::json;

namespace tradefinder::alert {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

}  // namespace

WebhookAlertDispatcher::WebhookAlertDispatcher(std::string url, long timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string WebhookAlertDispatcher::summary_text(AlertTier tier, const signal::IdentifiedTrade& trade) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), "[%s] %s %s %d%% @ %s (%s) stop %s", alert_tier_to_string(tier),
                  trade.symbol.c_str(), trade.direction.c_str(), trade.confidence, trade.entry_zone.c_str(),
                  trade.entry_zone_type.c_str(), trade.stop_placement.c_str());
    return buf;
}

std::string WebhookAlertDispatcher::build_body(AlertTier tier, const signal::IdentifiedTrade& trade) {
    json body = {{"tier", alert_tier_to_string(tier)},
                 {"trade_id", trade.id},
                 {"symbol", trade.symbol},
                 {"direction", trade.direction},
                 {"confidence", trade.confidence},
                 {"entry_zone_type", trade.entry_zone_type},
                 {"entry_zone", trade.entry_zone},
                 {"entry_price", trade.entry_price},
                 {"stop_placement", trade.stop_placement},
                 {"stop_price", trade.stop_price},
                 {"targets", trade.targets},
                 {"narrative", trade.narrative},
                 {"session_label", trade.session_label},
                 {"expires_at", util::format_iso8601_utc(trade.expires_at)},
                 {"text", summary_text(tier, trade)}};
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

void WebhookAlertDispatcher::dispatch(AlertTier tier, const signal::IdentifiedTrade& trade) {
    if (tier == AlertTier::LogOnly) {
        return;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw AlertDeliveryError("curl_easy_init failed");
    }

    std::string request_body = build_body(tier, trade);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw AlertDeliveryError(std::string("webhook: ") + curl_easy_strerror(res));
    }
    if (http_code < 200 || http_code >= 300) {
        throw AlertDeliveryError("webhook: HTTP " + std::to_string(http_code));
    }
    LOGF_INFO(Alert, "Sent %s alert for %s (%s)", alert_tier_to_string(tier), trade.id.c_str(),
              trade.symbol.c_str());
}

}  // namespace tradefinder::alert
