#include "security/mfa_service.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>

namespace secplane {

namespace {

constexpr std::string_view kBackupAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr size_t kBackupCodeLength = 8;
constexpr size_t kMaxCodeLength = 32;

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

} // anonymous namespace

MfaService::MfaService(std::shared_ptr<ISecurityStore> store,
                       std::shared_ptr<TaskExecutor> executor,
                       std::shared_ptr<FieldEncryptor> encryptor,
                       std::shared_ptr<AuditLogService> audit,
                       const Config& config)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      encryptor_(std::move(encryptor)),
      audit_(std::move(audit)),
      config_(config) {}

// ============================================================================
// Helpers
// ============================================================================

std::vector<std::string> MfaService::generate_backup_codes(size_t count) {
    std::vector<std::string> codes;
    codes.reserve(count);

    // Rejection sampling keeps every symbol equally likely
    constexpr unsigned kLimit = 256 - (256 % kBackupAlphabet.size());

    for (size_t i = 0; i < count; ++i) {
        std::string raw;
        raw.reserve(kBackupCodeLength);
        while (raw.size() < kBackupCodeLength) {
            for (const uint8_t b : FieldEncryptor::random_bytes(kBackupCodeLength * 2)) {
                if (b >= kLimit) continue;
                raw += kBackupAlphabet[b % kBackupAlphabet.size()];
                if (raw.size() == kBackupCodeLength) break;
            }
        }
        codes.push_back(std::format("{}-{}", raw.substr(0, 4), raw.substr(4)));
    }
    return codes;
}

std::string MfaService::normalize_backup_code(std::string_view code) {
    std::string out;
    out.reserve(code.size());
    for (const char c : code) {
        if (c == '-' || c == ' ') continue;
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

bool MfaService::consume_backup_code(MfaCredential& credential, std::string_view code) {
    const std::string candidate = FieldEncryptor::hash(normalize_backup_code(code));

    // Compare against every hash so timing does not reveal the position
    std::optional<size_t> match;
    for (size_t i = 0; i < credential.backup_code_hashes.size(); ++i) {
        if (FieldEncryptor::secure_compare(candidate, credential.backup_code_hashes[i]) && !match) {
            match = i;
        }
    }
    if (!match) return false;

    credential.backup_code_hashes.erase(credential.backup_code_hashes.begin() +
                                        static_cast<std::ptrdiff_t>(*match));
    return true;
}

std::mutex& MfaService::lock_for(const std::string& user_id) {
    return user_locks_[std::hash<std::string>{}(user_id) % kLockStripes];
}

std::optional<MfaCredential> MfaService::load(const std::string& user_id) {
    auto store = store_;
    return executor_->run_bounded([store, user_id] { return store->get_mfa(user_id); },
                                  config_.store_timeout);
}

void MfaService::store(const MfaCredential& credential) {
    auto store = store_;
    executor_->run_bounded([store, credential] { store->put_mfa(credential); },
                           config_.store_timeout);
}

int MfaService::record_failure(const std::string& user_id) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(failures_mutex_);
    // Periodic eviction: users who only ever fail are never cleared
    if (++failure_records_ % kFailureEvictionInterval == 0) {
        erase_expired_failures(now);
    }

    auto& w = failures_[user_id];
    if (w.count == 0 || now - w.window_start >= config_.failure_window) {
        w.window_start = now;
        w.count = 0;
    }
    return ++w.count;
}

void MfaService::clear_failures(const std::string& user_id) {
    std::lock_guard lock(failures_mutex_);
    failures_.erase(user_id);
}

size_t MfaService::evict_expired_failures(std::chrono::steady_clock::time_point now) {
    std::lock_guard lock(failures_mutex_);
    return erase_expired_failures(now);
}

size_t MfaService::erase_expired_failures(std::chrono::steady_clock::time_point now) {
    return static_cast<size_t>(std::erase_if(failures_, [this, now](const auto& kv) {
        return now - kv.second.window_start >= config_.failure_window;
    }));
}

size_t MfaService::tracked_failure_windows() const {
    std::lock_guard lock(failures_mutex_);
    return failures_.size();
}

Result<void> MfaService::audit(const Caller& caller, AuditEventType type, Severity severity,
                               const std::string& action, glz::json_t metadata) {
    AuditEvent event;
    event.organization_id = caller.organization_id;
    event.actor_user_id = caller.user_id;
    event.event_type = type;
    event.severity = severity;
    event.resource_type = "mfa_credential";
    event.resource_id = caller.user_id;
    event.action = action;
    event.source_address = caller.source_address;
    event.metadata = std::move(metadata);

    auto recorded = audit_->record(std::move(event));
    if (recorded.is_error()) {
        return Result<void>::error(recorded.error_category(), recorded.error_message());
    }
    return Result<void>::ok();
}

Result<void> MfaService::check_caller(const Caller& caller) {
    if (caller.user_id.empty() || caller.organization_id.empty()) {
        return Result<void>::error(ErrorCategory::VALIDATION_ERROR,
                                   "user id and organization id are required");
    }
    return Result<void>::ok();
}

// ============================================================================
// Setup
// ============================================================================

Result<MfaSetup> MfaService::setup(const Caller& caller, const std::string& account_name) {
    if (auto ok = check_caller(caller); ok.is_error()) {
        return Result<MfaSetup>::error(ok.error_category(), ok.error_message());
    }

    std::lock_guard user_lock(lock_for(caller.user_id));
    try {
        const auto existing = load(caller.user_id);
        if (existing && existing->organization_id != caller.organization_id) {
            return Result<MfaSetup>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                                           "credential belongs to another organization");
        }
        if (existing && existing->state() == MfaState::ENABLED) {
            return Result<MfaSetup>::error(ErrorCategory::VALIDATION_ERROR,
                                           "MFA is already enabled; disable it first");
        }

        MfaSetup result;
        result.secret = Totp::generate_secret(config_.totp.secret_bytes);
        result.provisioning_uri = Totp::provisioning_uri(
            account_name.empty() ? caller.user_id : account_name, result.secret, config_.totp);
        result.backup_codes = generate_backup_codes(config_.backup_code_count);

        const auto now = utils::now();
        MfaCredential credential;
        credential.user_id = caller.user_id;
        credential.organization_id = caller.organization_id;
        credential.enabled = false;
        credential.verified = false;
        credential.encrypted_secret = encryptor_->encrypt(result.secret);
        for (const auto& code : result.backup_codes) {
            credential.backup_code_hashes.push_back(FieldEncryptor::hash(normalize_backup_code(code)));
        }
        credential.created_at = existing ? existing->created_at : now;
        credential.updated_at = now;

        store(credential);
        clear_failures(caller.user_id);

        if (auto audited = audit(caller, AuditEventType::MFA_SETUP_STARTED, Severity::MEDIUM,
                                 "MFA setup started"); audited.is_error()) {
            return Result<MfaSetup>::error(audited.error_category(), audited.error_message());
        }

        utils::log::info(std::format("MFA setup started for user {}", caller.user_id));
        return Result<MfaSetup>::ok(std::move(result));
    } catch (const SecurityError& e) {
        utils::log::error(std::format("MFA setup failed for user {}: {}", caller.user_id, e.what()));
        return Result<MfaSetup>::from_exception(e);
    }
}

// ============================================================================
// Verification
// ============================================================================

Result<bool> MfaService::verify(const Caller& caller, std::string_view code) {
    if (auto ok = check_caller(caller); ok.is_error()) {
        return Result<bool>::error(ok.error_category(), ok.error_message());
    }
    const std::string trimmed = utils::trim(std::string(code));
    if (trimmed.empty() || trimmed.size() > kMaxCodeLength) {
        return Result<bool>::error(ErrorCategory::VALIDATION_ERROR, "code is required");
    }

    std::lock_guard user_lock(lock_for(caller.user_id));
    try {
        auto credential = load(caller.user_id);
        if (!credential || credential->state() == MfaState::UNSET) {
            return Result<bool>::error(ErrorCategory::NOT_FOUND, "MFA is not set up");
        }
        if (credential->organization_id != caller.organization_id) {
            return Result<bool>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                                       "credential belongs to another organization");
        }

        const MfaState state_before = credential->state();
        const std::string secret = encryptor_->decrypt(credential->encrypted_secret);

        bool accepted = false;
        bool used_backup = false;
        bool replayed = false;

        if (all_digits(trimmed) && trimmed.size() == static_cast<size_t>(config_.totp.digits)) {
            if (const auto step = Totp::verify(secret, trimmed, utils::now(), config_.totp)) {
                if (credential->last_used_step && *step <= *credential->last_used_step) {
                    replayed = true;
                } else {
                    credential->last_used_step = *step;
                    accepted = true;
                }
            }
        }

        // Backup codes only stand in for an already enabled factor
        if (!accepted && !replayed && state_before == MfaState::ENABLED) {
            used_backup = consume_backup_code(*credential, trimmed);
            accepted = used_backup;
        }

        if (!accepted) {
            const int failures = record_failure(caller.user_id);
            const bool repeated = failures >= config_.repeated_failure_threshold;
            glz::json_t meta;
            meta["consecutive_failures"] = static_cast<double>(failures);
            meta["phase"] = std::string(state_before == MfaState::ENABLED ? "login" : "setup");
            if (replayed) meta["replay"] = true;

            utils::log::warn(std::format("MFA verification failed for user {} ({} in window)",
                                         caller.user_id, failures));
            if (auto audited = audit(caller, AuditEventType::MFA_FAILED,
                                     repeated ? Severity::HIGH : Severity::MEDIUM,
                                     "invalid MFA code", std::move(meta)); audited.is_error()) {
                return Result<bool>::error(audited.error_category(), audited.error_message());
            }
            return Result<bool>::ok(false);
        }

        if (state_before == MfaState::PENDING_SETUP) {
            credential->enabled = true;
            credential->verified = true;
        }
        credential->updated_at = utils::now();
        store(*credential);
        clear_failures(caller.user_id);

        AuditEventType type = AuditEventType::MFA_VERIFIED;
        std::string action = "MFA code verified";
        if (state_before == MfaState::PENDING_SETUP) {
            type = AuditEventType::MFA_ENABLED;
            action = "MFA enabled";
        } else if (used_backup) {
            type = AuditEventType::BACKUP_CODE_USED;
            action = "MFA backup code used";
        }

        glz::json_t meta;
        if (used_backup) {
            meta["remaining_backup_codes"] = static_cast<double>(credential->backup_code_hashes.size());
        }
        if (auto audited = audit(caller, type, Severity::MEDIUM, action, std::move(meta));
            audited.is_error()) {
            return Result<bool>::error(audited.error_category(), audited.error_message());
        }
        return Result<bool>::ok(true);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("MFA verification error for user {}: {}",
                                      caller.user_id, error_category_to_string(e.category())));
        return Result<bool>::from_exception(e);
    }
}

// ============================================================================
// Disable / regenerate / status
// ============================================================================

Result<void> MfaService::disable(const Caller& caller) {
    if (auto ok = check_caller(caller); ok.is_error()) return ok;

    std::lock_guard user_lock(lock_for(caller.user_id));
    try {
        const auto credential = load(caller.user_id);
        if (!credential || credential->state() == MfaState::UNSET) {
            return Result<void>::error(ErrorCategory::NOT_FOUND, "MFA is not set up");
        }
        if (credential->organization_id != caller.organization_id) {
            return Result<void>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                                       "credential belongs to another organization");
        }

        auto store = store_;
        const auto user_id = caller.user_id;
        executor_->run_bounded([store, user_id] { store->remove_mfa(user_id); }, config_.store_timeout);
        clear_failures(caller.user_id);

        utils::log::info(std::format("MFA disabled for user {}", caller.user_id));
        return audit(caller, AuditEventType::MFA_DISABLED, Severity::MEDIUM, "MFA disabled");
    } catch (const SecurityError& e) {
        return Result<void>::from_exception(e);
    }
}

Result<std::vector<std::string>> MfaService::regenerate_backup_codes(const Caller& caller) {
    using R = Result<std::vector<std::string>>;
    if (auto ok = check_caller(caller); ok.is_error()) {
        return R::error(ok.error_category(), ok.error_message());
    }

    std::lock_guard user_lock(lock_for(caller.user_id));
    try {
        auto credential = load(caller.user_id);
        if (!credential || credential->state() != MfaState::ENABLED) {
            return R::error(ErrorCategory::VALIDATION_ERROR, "MFA is not enabled");
        }
        if (credential->organization_id != caller.organization_id) {
            return R::error(ErrorCategory::AUTHORIZATION_FAILURE,
                            "credential belongs to another organization");
        }

        auto codes = generate_backup_codes(config_.backup_code_count);
        credential->backup_code_hashes.clear();
        for (const auto& code : codes) {
            credential->backup_code_hashes.push_back(FieldEncryptor::hash(normalize_backup_code(code)));
        }
        credential->updated_at = utils::now();
        store(*credential);

        if (auto audited = audit(caller, AuditEventType::MFA_BACKUP_CODES_REGENERATED, Severity::MEDIUM,
                                 "MFA backup codes regenerated"); audited.is_error()) {
            return R::error(audited.error_category(), audited.error_message());
        }
        return R::ok(std::move(codes));
    } catch (const SecurityError& e) {
        return R::from_exception(e);
    }
}

Result<MfaStatus> MfaService::status(const Caller& caller) {
    if (auto ok = check_caller(caller); ok.is_error()) {
        return Result<MfaStatus>::error(ok.error_category(), ok.error_message());
    }
    try {
        const auto credential = load(caller.user_id);
        MfaStatus result;
        if (credential) {
            if (credential->organization_id != caller.organization_id) {
                return Result<MfaStatus>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                                                "credential belongs to another organization");
            }
            result.state = credential->state();
            result.enabled = credential->enabled;
            result.verified = credential->verified;
            result.remaining_backup_codes = credential->backup_code_hashes.size();
        }
        return Result<MfaStatus>::ok(result);
    } catch (const SecurityError& e) {
        return Result<MfaStatus>::from_exception(e);
    }
}

} // namespace secplane
