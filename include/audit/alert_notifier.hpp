#pragma once

#include "audit/audit_event.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace secplane {

/**
 * @brief Out-of-band delivery of CRITICAL audit events
 *
 * notify() returns false when delivery failed. Implementations must not
 * throw for transport errors; the audit write never depends on them.
 */
class IAlertNotifier {
public:
    virtual ~IAlertNotifier() = default;

    [[nodiscard]] virtual bool notify(const AuditEvent& event) = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

/// Writes the alert to the process log (default when no webhook is set)
class LogAlertNotifier : public IAlertNotifier {
public:
    [[nodiscard]] bool notify(const AuditEvent& event) override;
    [[nodiscard]] std::string name() const override { return "log"; }
};

/**
 * @brief HTTP POST of the event JSON to a configured URL
 *
 * Uses cpp-httplib. Retries up to max_retries times with the same
 * timeout on each attempt.
 */
class WebhookAlertNotifier : public IAlertNotifier {
public:
    struct Config {
        std::string url;
        std::string auth_header;
        std::chrono::milliseconds timeout{5000};
        int max_retries = 3;
    };

    explicit WebhookAlertNotifier(const Config& config);

    [[nodiscard]] bool notify(const AuditEvent& event) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t send_failures() const { return send_failures_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t alerts_sent() const { return alerts_sent_.load(std::memory_order_relaxed); }

private:
    Config config_;

    // Parsed from URL
    std::string host_;
    std::string path_;
    int port_ = 443;
    bool use_ssl_ = true;

    std::atomic<uint64_t> send_failures_{0};
    std::atomic<uint64_t> alerts_sent_{0};
};

} // namespace secplane
