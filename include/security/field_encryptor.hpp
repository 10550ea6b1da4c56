#pragma once

#include "security/ikey_manager.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace secplane {

/**
 * @brief Authenticated field encryption (AES-256-GCM)
 *
 * Envelope format: ENC:v1:<key_id>:<base64(iv || ciphertext || tag)>
 * with a 12-byte IV drawn from RAND_bytes on every call and a 16-byte tag.
 *
 * Fails closed: decrypt() never returns plaintext for an envelope whose
 * tag, bytes or key id do not check out. It throws
 * SecurityError(DECRYPTION_FAILURE) for those and
 * SecurityError(NOT_ENCRYPTED) for input that is not an envelope.
 */
class FieldEncryptor {
public:
    static constexpr std::string_view kPrefix = "ENC:v1:";

    using Record = std::unordered_map<std::string, std::string>;

    explicit FieldEncryptor(std::shared_ptr<IKeyManager> key_manager);

    [[nodiscard]] std::string encrypt(std::string_view plaintext) const;
    [[nodiscard]] std::string decrypt(std::string_view envelope) const;

    [[nodiscard]] static bool is_encrypted(std::string_view value);

    // ---- Bulk helpers: only the named fields are touched -------------------
    // Missing fields are skipped. decrypt_fields leaves plain (non-envelope)
    // values as they are but throws on a damaged envelope.

    void encrypt_fields(Record& record, const std::vector<std::string>& fields) const;
    void decrypt_fields(Record& record, const std::vector<std::string>& fields) const;

    /// JSON object variant; non-string field values are left untouched
    void encrypt_fields(glz::json_t& record, const std::vector<std::string>& fields) const;
    void decrypt_fields(glz::json_t& record, const std::vector<std::string>& fields) const;

    // ---- One-way and comparison primitives ---------------------------------

    /// SHA-256, lowercase hex
    [[nodiscard]] static std::string hash(std::string_view data);

    /// Constant-time comparison; length mismatch still costs a full pass
    [[nodiscard]] static bool secure_compare(std::string_view a, std::string_view b);

    // ---- Secure randomness -------------------------------------------------

    [[nodiscard]] static std::vector<uint8_t> random_bytes(size_t count);

    /// Hex token of byte_count random bytes
    [[nodiscard]] static std::string generate_token(size_t byte_count = 32);

    /// Uniformly distributed decimal code
    [[nodiscard]] static std::string generate_otp(size_t digits = 6);

private:
    std::shared_ptr<IKeyManager> key_manager_;
};

} // namespace secplane
