#pragma once

#include "audit/audit_log_service.hpp"
#include "core/error.hpp"
#include "core/task_executor.hpp"
#include "core/types.hpp"
#include "db/isecurity_store.hpp"
#include "security/field_encryptor.hpp"
#include "security/mfa_credential.hpp"
#include "security/totp.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace secplane {

struct MfaSetup {
    std::string secret;                     // Base32, shown once
    std::string provisioning_uri;
    std::vector<std::string> backup_codes;  // Plaintext, shown once
};

struct MfaStatus {
    MfaState state = MfaState::UNSET;
    bool enabled = false;
    bool verified = false;
    size_t remaining_backup_codes = 0;
};

/**
 * @brief TOTP second factor: Unset → PendingSetup → Enabled
 *
 * setup() stores a fresh secret (FieldEncryptor envelope) and hashed
 * backup codes without enabling anything. The first verify() that
 * matches the current secret moves the credential to Enabled. Once
 * enabled, verify() accepts a TOTP code or an unused backup code.
 *
 * A TOTP step is accepted at most once per user. Calls for the same
 * user are serialized so a backup code cannot be spent twice.
 * Every transition and attempt is audited: MEDIUM normally, HIGH once
 * a user reaches the repeated-failure threshold inside the window.
 */
class MfaService {
public:
    struct Config {
        Totp::Config totp;
        size_t backup_code_count = 10;
        int repeated_failure_threshold = 3;
        std::chrono::seconds failure_window{900};
        std::chrono::milliseconds store_timeout{2000};
    };

    MfaService(std::shared_ptr<ISecurityStore> store,
               std::shared_ptr<TaskExecutor> executor,
               std::shared_ptr<FieldEncryptor> encryptor,
               std::shared_ptr<AuditLogService> audit,
               const Config& config);

    /// @param account_name label shown in the authenticator app (defaults to the user id)
    [[nodiscard]] Result<MfaSetup> setup(const Caller& caller, const std::string& account_name = {});

    /**
     * @return ok(true) on a valid code, ok(false) on an invalid one.
     *         Errors (not set up, storage, tampered secret) are returned.
     */
    [[nodiscard]] Result<bool> verify(const Caller& caller, std::string_view code);

    [[nodiscard]] Result<void> disable(const Caller& caller);

    [[nodiscard]] Result<std::vector<std::string>> regenerate_backup_codes(const Caller& caller);

    [[nodiscard]] Result<MfaStatus> status(const Caller& caller);

    /// XXXX-XXXX codes over [A-Z0-9]
    [[nodiscard]] static std::vector<std::string> generate_backup_codes(size_t count);

    /// Uppercase, with spaces and dashes removed
    [[nodiscard]] static std::string normalize_backup_code(std::string_view code);

    /// Drop failure windows that ended before now; returns how many
    size_t evict_expired_failures(std::chrono::steady_clock::time_point now);

    [[nodiscard]] size_t tracked_failure_windows() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    static constexpr size_t kLockStripes = 64;
    static constexpr uint64_t kFailureEvictionInterval = 1000;

    [[nodiscard]] std::mutex& lock_for(const std::string& user_id);

    [[nodiscard]] std::optional<MfaCredential> load(const std::string& user_id);
    void store(const MfaCredential& credential);

    /// Returns true if code matched (and removed) one of the backup hashes
    [[nodiscard]] static bool consume_backup_code(MfaCredential& credential, std::string_view code);

    /// Failure count inside the window after recording this one
    int record_failure(const std::string& user_id);
    void clear_failures(const std::string& user_id);
    /// Caller must hold failures_mutex_
    size_t erase_expired_failures(std::chrono::steady_clock::time_point now);

    [[nodiscard]] Result<void> audit(const Caller& caller, AuditEventType type, Severity severity,
                                     const std::string& action, glz::json_t metadata = {});

    [[nodiscard]] static Result<void> check_caller(const Caller& caller);

    std::shared_ptr<ISecurityStore> store_;
    std::shared_ptr<TaskExecutor> executor_;
    std::shared_ptr<FieldEncryptor> encryptor_;
    std::shared_ptr<AuditLogService> audit_;
    Config config_;

    std::array<std::mutex, kLockStripes> user_locks_;

    struct FailureWindow {
        std::chrono::steady_clock::time_point window_start;
        int count = 0;
    };
    mutable std::mutex failures_mutex_;
    std::unordered_map<std::string, FailureWindow> failures_;
    uint64_t failure_records_ = 0;
};

} // namespace secplane
