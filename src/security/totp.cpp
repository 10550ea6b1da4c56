#include "security/totp.hpp"
#include "security/field_encryptor.hpp"
#include "core/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <format>

namespace secplane {

namespace {

constexpr std::string_view kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

constexpr uint32_t kPow10[] = {
    1u, 10u, 100u, 1000u, 10000u, 100000u, 1000000u, 10000000u, 100000000u, 1000000000u
};

} // anonymous namespace

// ============================================================================
// Base32 (RFC 4648, no padding on output, padding tolerated on input)
// ============================================================================

std::string Totp::base32_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (const uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            result += kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F];
            bits -= 5;
        }
    }
    if (bits > 0) {
        result += kBase32Alphabet[(buffer << (5 - bits)) & 0x1F];
    }
    return result;
}

std::optional<std::vector<uint8_t>> Totp::base32_decode(std::string_view encoded) {
    std::vector<uint8_t> result;
    result.reserve(encoded.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (const char raw : encoded) {
        if (raw == '=' || raw == ' ') continue;
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        const auto pos = kBase32Alphabet.find(c);
        if (pos == std::string_view::npos) return std::nullopt;

        buffer = (buffer << 5) | static_cast<uint32_t>(pos);
        bits += 5;
        if (bits >= 8) {
            result.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return result;
}

std::string Totp::generate_secret(size_t byte_count) {
    return base32_encode(FieldEncryptor::random_bytes(byte_count));
}

// ============================================================================
// HOTP / TOTP
// ============================================================================

uint64_t Totp::time_step(std::chrono::system_clock::time_point at, int period_seconds) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        at.time_since_epoch()).count();
    return seconds <= 0 ? 0 : static_cast<uint64_t>(seconds) / static_cast<uint64_t>(period_seconds);
}

std::string Totp::hotp(const std::vector<uint8_t>& key, uint64_t counter, int digits) {
    if (digits < 6 || digits > 9) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR,
            std::format("TOTP digits must be 6-9, got {}", digits));
    }

    uint8_t message[8];
    for (int i = 7; i >= 0; --i) {
        message[i] = static_cast<uint8_t>(counter & 0xFF);
        counter >>= 8;
    }

    uint8_t mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
              message, sizeof(message), mac, &mac_len) || mac_len < 20) {
        throw SecurityError(ErrorCategory::INTERNAL_ERROR, "HMAC-SHA1 failed");
    }

    // Dynamic truncation
    const int offset = mac[mac_len - 1] & 0x0F;
    const uint32_t binary =
        (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
        (static_cast<uint32_t>(mac[offset + 1]) << 16) |
        (static_cast<uint32_t>(mac[offset + 2]) << 8) |
        static_cast<uint32_t>(mac[offset + 3]);

    return std::format("{:0{}}", binary % kPow10[digits], digits);
}

std::string Totp::code_at(std::string_view secret_b32,
                          std::chrono::system_clock::time_point at,
                          const Config& config) {
    const auto key = base32_decode(secret_b32);
    if (!key || key->empty()) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "invalid TOTP secret");
    }
    return hotp(*key, time_step(at, config.period_seconds), config.digits);
}

std::optional<uint64_t> Totp::verify(std::string_view secret_b32,
                                     std::string_view code,
                                     std::chrono::system_clock::time_point now,
                                     const Config& config) {
    if (code.size() != static_cast<size_t>(config.digits)) return std::nullopt;
    for (const char c : code) {
        if (c < '0' || c > '9') return std::nullopt;
    }

    const auto key = base32_decode(secret_b32);
    if (!key || key->empty()) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "invalid TOTP secret");
    }

    const uint64_t current = time_step(now, config.period_seconds);
    std::optional<uint64_t> matched;
    for (int delta = -config.skew_steps; delta <= config.skew_steps; ++delta) {
        if (delta < 0 && current < static_cast<uint64_t>(-delta)) continue;
        const uint64_t step = current + static_cast<int64_t>(delta);
        const auto expected = hotp(*key, step, config.digits);
        if (CRYPTO_memcmp(expected.data(), code.data(), expected.size()) == 0 && !matched) {
            matched = step;
        }
    }
    return matched;
}

// ============================================================================
// Provisioning URI
// ============================================================================

std::string Totp::url_encode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += c;
        } else {
            out += std::format("%{:02X}", static_cast<unsigned int>(uc));
        }
    }
    return out;
}

std::string Totp::provisioning_uri(std::string_view account,
                                   std::string_view secret_b32,
                                   const Config& config) {
    const auto issuer = url_encode(config.issuer);
    return std::format(
        "otpauth://totp/{}:{}?secret={}&issuer={}&algorithm=SHA1&digits={}&period={}",
        issuer, url_encode(account), secret_b32, issuer,
        config.digits, config.period_seconds);
}

} // namespace secplane
