#pragma once

#include "security/ikey_manager.hpp"

#include <shared_mutex>
#include <string>
#include <vector>

namespace secplane {

/**
 * @brief Key manager deriving data keys from a master secret
 *
 * Each key generation is PBKDF2-HMAC-SHA256(master, salt || ":" || generation).
 * Derivation happens once per generation at construction or rotation;
 * keys live in process memory only and are wiped on destruction.
 * Rotation keeps retired generations so older envelopes still decrypt.
 */
class DerivedKeyManager : public IKeyManager {
public:
    static constexpr int kMinIterations = 100000;

    struct Config {
        std::string salt = "secplane-field-encryption";
        int iterations = kMinIterations;
    };

    /// @throws SecurityError(VALIDATION_ERROR) on an empty secret or too few iterations
    explicit DerivedKeyManager(std::string master_secret);
    DerivedKeyManager(std::string master_secret, const Config& config);
    ~DerivedKeyManager() override;

    DerivedKeyManager(const DerivedKeyManager&) = delete;
    DerivedKeyManager& operator=(const DerivedKeyManager&) = delete;

    /// Read the master secret from an environment variable
    /// @throws SecurityError(VALIDATION_ERROR) when the variable is unset or empty
    [[nodiscard]] static std::string secret_from_env(const std::string& env_var_name);

    [[nodiscard]] std::optional<DataKey> active_key() const override;
    [[nodiscard]] std::optional<DataKey> find_key(const std::string& key_id) const override;
    std::string rotate() override;
    [[nodiscard]] std::vector<std::string> key_ids() const override;

private:
    [[nodiscard]] DataKey derive(uint32_t generation) const;

    std::string master_secret_;
    Config config_;

    mutable std::shared_mutex mutex_;
    std::vector<DataKey> keys_;   // Oldest first; back() is active
};

} // namespace secplane
