#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace secplane {

enum class MfaState : uint8_t {
    UNSET,
    PENDING_SETUP,
    ENABLED
};

inline const char* mfa_state_to_string(MfaState state) {
    switch (state) {
        case MfaState::UNSET:         return "unset";
        case MfaState::PENDING_SETUP: return "pending_setup";
        case MfaState::ENABLED:       return "enabled";
    }
    return "unset";
}

/**
 * @brief Per-user MFA row
 *
 * The TOTP secret is only ever held here as a FieldEncryptor envelope.
 * Backup codes are stored as SHA-256 hashes and erased once used.
 */
struct MfaCredential {
    std::string user_id;
    std::string organization_id;
    bool enabled = false;
    bool verified = false;
    std::string encrypted_secret;
    std::vector<std::string> backup_code_hashes;
    std::optional<uint64_t> last_used_step;  // Highest accepted TOTP step (replay guard)
    TimePoint created_at{};
    TimePoint updated_at{};

    [[nodiscard]] MfaState state() const {
        if (enabled && verified) return MfaState::ENABLED;
        if (!encrypted_secret.empty()) return MfaState::PENDING_SETUP;
        return MfaState::UNSET;
    }
};

} // namespace secplane
