#include "audit/alert_notifier.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace secplane {

namespace {
constexpr const char* kAuthorizationHeader = "Authorization";
constexpr const char* kJsonContentType = "application/json";
}

// ============================================================================
// LogAlertNotifier
// ============================================================================

bool LogAlertNotifier::notify(const AuditEvent& event) {
    utils::log::warn(std::format("ALERT {} org={} source={} action={}",
        event_type_to_string(event.event_type), event.organization_id,
        event.source_address, event.action));
    return true;
}

// ============================================================================
// WebhookAlertNotifier
// ============================================================================

WebhookAlertNotifier::WebhookAlertNotifier(const Config& config)
    : config_(config) {
    std::string url = config_.url;

    if (url.starts_with("https://")) {
        use_ssl_ = true;
        url = url.substr(8);
        port_ = 443;
    } else if (url.starts_with("http://")) {
        use_ssl_ = false;
        url = url.substr(7);
        port_ = 80;
    }

    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        host_ = url.substr(0, path_pos);
        path_ = url.substr(path_pos);
    } else {
        host_ = url;
        path_ = "/";
    }

    const auto port_pos = host_.find(':');
    if (port_pos != std::string::npos) {
        port_ = utils::parse_int<int>(host_.substr(port_pos + 1), port_);
        host_ = host_.substr(0, port_pos);
    }
}

std::string WebhookAlertNotifier::name() const {
    return "webhook:" + config_.url;
}

bool WebhookAlertNotifier::notify(const AuditEvent& event) {
    const std::string payload = std::format(
        "{{\"alert\":\"security_event\",\"event\":{}}}", audit_event_to_json(event));

    const std::string scheme_host =
        std::format("{}{}:{}", use_ssl_ ? "https://" : "http://", host_, port_);

    bool success = false;
    for (int attempt = 0; attempt < config_.max_retries && !success; ++attempt) {
        try {
            httplib::Client client(scheme_host);
            client.set_connection_timeout(config_.timeout);
            client.set_read_timeout(config_.timeout);

            httplib::Headers headers;
            if (!config_.auth_header.empty()) {
                headers.emplace(kAuthorizationHeader, config_.auth_header);
            }

            const auto res = client.Post(path_, headers, payload, kJsonContentType);
            if (res && res->status >= 200 && res->status < 300) {
                success = true;
            } else if (res) {
                utils::log::debug(std::format("Alert webhook attempt {} returned HTTP {}",
                                              attempt + 1, res->status));
            } else {
                utils::log::debug(std::format("Alert webhook attempt {} failed: {}",
                                              attempt + 1, httplib::to_string(res.error())));
            }
        } catch (const std::exception& e) {
            utils::log::debug(std::format("Alert webhook attempt {} threw: {}", attempt + 1, e.what()));
        }
    }

    if (success) {
        alerts_sent_.fetch_add(1, std::memory_order_relaxed);
    } else {
        send_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Alert webhook failed after {} attempts: {}",
                                     config_.max_retries, config_.url));
    }
    return success;
}

} // namespace secplane
