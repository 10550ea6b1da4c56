#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace secplane {

/**
 * @brief RFC 6238 time-based one-time passwords (HMAC-SHA1)
 *
 * Secrets are exchanged in RFC 4648 base32 without padding, which is
 * what authenticator apps expect in an otpauth:// URI.
 */
class Totp {
public:
    struct Config {
        std::string issuer = "SecPlane";
        int digits = 6;
        int period_seconds = 30;
        int skew_steps = 2;             // ±2 steps (±60s at 30s period)
        size_t secret_bytes = 20;       // 160-bit, RFC 4226 recommendation
    };

    [[nodiscard]] static std::string base32_encode(const std::vector<uint8_t>& data);
    [[nodiscard]] static std::optional<std::vector<uint8_t>> base32_decode(std::string_view encoded);

    /// Random secret, base32 encoded
    [[nodiscard]] static std::string generate_secret(size_t byte_count = 20);

    [[nodiscard]] static uint64_t time_step(std::chrono::system_clock::time_point at,
                                            int period_seconds);

    /// HOTP value for one counter, zero-padded to digits
    [[nodiscard]] static std::string hotp(const std::vector<uint8_t>& key,
                                          uint64_t counter, int digits);

    [[nodiscard]] static std::string code_at(std::string_view secret_b32,
                                             std::chrono::system_clock::time_point at,
                                             const Config& config);

    /**
     * @brief Check a code against every step in [now - skew, now + skew]
     * @return The matching time step, or std::nullopt
     *
     * All candidate steps are compared in constant time and the loop does
     * not exit early, so timing does not reveal which step matched.
     */
    [[nodiscard]] static std::optional<uint64_t> verify(std::string_view secret_b32,
                                                        std::string_view code,
                                                        std::chrono::system_clock::time_point now,
                                                        const Config& config);

    /// otpauth://totp/Issuer:account?secret=...&issuer=...&algorithm=SHA1&digits=6&period=30
    [[nodiscard]] static std::string provisioning_uri(std::string_view account,
                                                      std::string_view secret_b32,
                                                      const Config& config);

private:
    [[nodiscard]] static std::string url_encode(std::string_view s);
};

} // namespace secplane
