#include "security/field_encryptor.hpp"
#include "core/base64.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <format>
#include <memory>

namespace secplane {

namespace {

// AES-256-GCM constants
constexpr int kIvLen = 12;
constexpr int kTagLen = 16;
constexpr size_t kKeyLen = 32;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

[[noreturn]] void fail_decrypt(const std::string& why) {
    throw SecurityError(ErrorCategory::DECRYPTION_FAILURE, "decryption failed: " + why);
}

} // anonymous namespace

FieldEncryptor::FieldEncryptor(std::shared_ptr<IKeyManager> key_manager)
    : key_manager_(std::move(key_manager)) {
    if (!key_manager_) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "FieldEncryptor requires a key manager");
    }
}

bool FieldEncryptor::is_encrypted(std::string_view value) {
    return value.starts_with(kPrefix);
}

std::string FieldEncryptor::encrypt(std::string_view plaintext) const {
    const auto key_info = key_manager_->active_key();
    if (!key_info || key_info->bytes.size() < kKeyLen) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "no active encryption key");
    }

    // Fresh IV per call; never caller-supplied
    uint8_t iv[kIvLen];
    if (RAND_bytes(iv, kIvLen) != 1) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "RAND_bytes failed");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
           && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1
           && EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_info->bytes.data(), iv) == 1;

    if (ok && !plaintext.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                reinterpret_cast<const uint8_t*>(plaintext.data()),
                static_cast<int>(plaintext.size())) == 1;
        ciphertext_len = len;
    }
    ok = ok && EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) == 1;
    if (ok) ciphertext_len += len;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen, tag) == 1;

    if (!ok) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "AES-256-GCM encryption failed");
    }

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), iv, iv + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    std::string result(kPrefix);
    result += key_info->key_id;
    result += ':';
    result += base64::encode(packed);
    return result;
}

std::string FieldEncryptor::decrypt(std::string_view envelope) const {
    if (!is_encrypted(envelope)) {
        throw SecurityError(ErrorCategory::NOT_ENCRYPTED, "value is not an encrypted envelope");
    }

    const auto rest = envelope.substr(kPrefix.size());
    const size_t colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        fail_decrypt("malformed envelope");
    }

    const std::string key_id(rest.substr(0, colon));
    const auto key_info = key_manager_->find_key(key_id);
    if (!key_info || key_info->bytes.size() < kKeyLen) {
        fail_decrypt(std::format("unknown key '{}'", key_id));
    }

    const auto packed = base64::decode(rest.substr(colon + 1));
    if (!packed) {
        fail_decrypt("corrupted encoding");
    }
    if (packed->size() < static_cast<size_t>(kIvLen + kTagLen)) {
        fail_decrypt("payload too short");
    }

    const uint8_t* iv = packed->data();
    const size_t ct_len = packed->size() - kIvLen - kTagLen;
    const uint8_t* ct = packed->data() + kIvLen;
    uint8_t tag[kTagLen];
    std::copy(packed->data() + kIvLen + ct_len, packed->data() + packed->size(), tag);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
           && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1
           && EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_info->bytes.data(), iv) == 1;

    if (ok && ct_len > 0) {
        ok = EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, static_cast<int>(ct_len)) == 1;
        plaintext_len = len;
    }
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen, tag) == 1;

    // Tag verification happens here; nothing is returned unless it passes
    ok = ok && EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) == 1;
    if (!ok) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        fail_decrypt("authentication tag mismatch");
    }
    plaintext_len += len;

    return std::string(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<size_t>(plaintext_len));
}

// ============================================================================
// Bulk field helpers
// ============================================================================

void FieldEncryptor::encrypt_fields(Record& record, const std::vector<std::string>& fields) const {
    for (const auto& field : fields) {
        const auto it = record.find(field);
        if (it == record.end() || is_encrypted(it->second)) continue;
        it->second = encrypt(it->second);
    }
}

void FieldEncryptor::decrypt_fields(Record& record, const std::vector<std::string>& fields) const {
    for (const auto& field : fields) {
        const auto it = record.find(field);
        if (it == record.end() || !is_encrypted(it->second)) continue;
        it->second = decrypt(it->second);
    }
}

void FieldEncryptor::encrypt_fields(glz::json_t& record, const std::vector<std::string>& fields) const {
    if (!record.is_object()) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "encrypt_fields expects a JSON object");
    }
    auto& obj = record.get_object();
    for (const auto& field : fields) {
        const auto it = obj.find(field);
        if (it == obj.end() || !it->second.is_string()) continue;
        const auto& value = it->second.get<std::string>();
        if (is_encrypted(value)) continue;
        it->second = encrypt(value);
    }
}

void FieldEncryptor::decrypt_fields(glz::json_t& record, const std::vector<std::string>& fields) const {
    if (!record.is_object()) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "decrypt_fields expects a JSON object");
    }
    auto& obj = record.get_object();
    for (const auto& field : fields) {
        const auto it = obj.find(field);
        if (it == obj.end() || !it->second.is_string()) continue;
        const auto& value = it->second.get<std::string>();
        if (!is_encrypted(value)) continue;
        it->second = decrypt(value);
    }
}

// ============================================================================
// Hashing, comparison, randomness
// ============================================================================

std::string FieldEncryptor::hash(std::string_view data) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const uint8_t*>(data.data()), data.size(), digest);
    return utils::bytes_to_hex(digest, SHA256_DIGEST_LENGTH);
}

bool FieldEncryptor::secure_compare(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        // Dummy pass so the time spent does not reveal where lengths diverge
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= static_cast<unsigned char>(b[i]);
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> FieldEncryptor::random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "RAND_bytes failed");
    }
    return bytes;
}

std::string FieldEncryptor::generate_token(size_t byte_count) {
    const auto bytes = random_bytes(byte_count);
    return utils::bytes_to_hex(bytes.data(), bytes.size());
}

std::string FieldEncryptor::generate_otp(size_t digits) {
    std::string otp;
    otp.reserve(digits);
    while (otp.size() < digits) {
        for (const uint8_t b : random_bytes(digits)) {
            // Reject 250..255 so every digit is equally likely
            if (b >= 250) continue;
            otp += static_cast<char>('0' + (b % 10));
            if (otp.size() == digits) break;
        }
    }
    return otp;
}

} // namespace secplane
