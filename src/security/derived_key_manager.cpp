#include "security/derived_key_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <mutex>

namespace secplane {

namespace {

constexpr int kKeyLen = 32;

} // anonymous namespace

DerivedKeyManager::DerivedKeyManager(std::string master_secret)
    : DerivedKeyManager(std::move(master_secret), Config{}) {}

DerivedKeyManager::DerivedKeyManager(std::string master_secret, const Config& config)
    : master_secret_(std::move(master_secret)), config_(config) {
    if (master_secret_.empty()) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "master secret must not be empty");
    }
    if (config_.iterations < kMinIterations) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR,
            std::format("PBKDF2 iterations must be >= {}, got {}", kMinIterations, config_.iterations));
    }

    keys_.push_back(derive(1));
    utils::log::info(std::format("DerivedKeyManager: derived key '{}' ({} PBKDF2 iterations)",
        keys_.back().key_id, config_.iterations));
}

DerivedKeyManager::~DerivedKeyManager() {
    for (auto& key : keys_) {
        OPENSSL_cleanse(key.bytes.data(), key.bytes.size());
    }
    OPENSSL_cleanse(master_secret_.data(), master_secret_.size());
}

std::string DerivedKeyManager::secret_from_env(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    if (!value || !*value) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR,
            std::format("environment variable '{}' is not set", env_var_name));
    }
    return value;
}

IKeyManager::DataKey DerivedKeyManager::derive(uint32_t generation) const {
    const std::string salt = std::format("{}:{}", config_.salt, generation);

    DataKey key;
    key.key_id = std::format("k{}", generation);
    key.generation = generation;
    key.bytes.resize(kKeyLen);

    if (PKCS5_PBKDF2_HMAC(master_secret_.data(), static_cast<int>(master_secret_.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          config_.iterations, EVP_sha256(),
                          kKeyLen, key.bytes.data()) != 1) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "PBKDF2 key derivation failed");
    }
    return key;
}

std::optional<IKeyManager::DataKey> DerivedKeyManager::active_key() const {
    std::shared_lock lock(mutex_);
    if (keys_.empty()) return std::nullopt;
    return keys_.back();
}

std::optional<IKeyManager::DataKey> DerivedKeyManager::find_key(const std::string& key_id) const {
    std::shared_lock lock(mutex_);
    const auto it = std::find_if(keys_.begin(), keys_.end(),
                                 [&key_id](const DataKey& k) { return k.key_id == key_id; });
    if (it == keys_.end()) return std::nullopt;
    return *it;
}

std::string DerivedKeyManager::rotate() {
    std::unique_lock lock(mutex_);
    keys_.push_back(derive(keys_.back().generation + 1));
    utils::log::info(std::format("DerivedKeyManager: rotated to key '{}'", keys_.back().key_id));
    return keys_.back().key_id;
}

std::vector<std::string> DerivedKeyManager::key_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(keys_.size());
    for (const auto& key : keys_) ids.push_back(key.key_id);
    return ids;
}

} // namespace secplane
