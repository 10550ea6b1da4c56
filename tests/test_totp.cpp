#include <catch2/catch_test_macros.hpp>
#include "security/totp.hpp"
#include "core/error.hpp"

#include <chrono>

using namespace secplane;

namespace {

// RFC 4226 / RFC 6238 SHA-1 test secret "12345678901234567890"
const std::vector<uint8_t> kRfcKey = {'1','2','3','4','5','6','7','8','9','0',
                                      '1','2','3','4','5','6','7','8','9','0'};
constexpr const char* kRfcSecretB32 = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

std::chrono::system_clock::time_point at_seconds(int64_t s) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(s));
}

} // anonymous namespace

TEST_CASE("Totp: base32 encode matches RFC secret", "[totp]") {
    CHECK(Totp::base32_encode(kRfcKey) == kRfcSecretB32);
    CHECK(Totp::base32_encode({}).empty());
    CHECK(Totp::base32_encode({'f'}) == "MY");
    CHECK(Totp::base32_encode({'f', 'o', 'o', 'b', 'a', 'r'}) == "MZXW6YTBOI");
}

TEST_CASE("Totp: base32 decode", "[totp]") {
    const auto decoded = Totp::base32_decode(kRfcSecretB32);
    REQUIRE(decoded.has_value());
    CHECK(*decoded == kRfcKey);

    // Lowercase and padding are tolerated
    const auto lower = Totp::base32_decode("mzxw6ytboi======");
    REQUIRE(lower.has_value());
    CHECK(std::string(lower->begin(), lower->end()) == "foobar");

    CHECK_FALSE(Totp::base32_decode("MZXW6YTB0I").has_value());   // '0' is not base32
    CHECK_FALSE(Totp::base32_decode("MZ!W").has_value());
}

TEST_CASE("Totp: HOTP RFC 4226 vectors", "[totp]") {
    CHECK(Totp::hotp(kRfcKey, 0, 6) == "755224");
    CHECK(Totp::hotp(kRfcKey, 1, 6) == "287082");
    CHECK(Totp::hotp(kRfcKey, 2, 6) == "359152");
    CHECK(Totp::hotp(kRfcKey, 9, 6) == "520489");
}

TEST_CASE("Totp: RFC 6238 SHA-1 vectors (8 digits)", "[totp]") {
    Totp::Config cfg;
    cfg.digits = 8;
    CHECK(Totp::code_at(kRfcSecretB32, at_seconds(59), cfg) == "94287082");
    CHECK(Totp::code_at(kRfcSecretB32, at_seconds(1111111109), cfg) == "07081804");
    CHECK(Totp::code_at(kRfcSecretB32, at_seconds(1234567890), cfg) == "89005924");
}

TEST_CASE("Totp: time step", "[totp]") {
    CHECK(Totp::time_step(at_seconds(0), 30) == 0);
    CHECK(Totp::time_step(at_seconds(29), 30) == 0);
    CHECK(Totp::time_step(at_seconds(30), 30) == 1);
    CHECK(Totp::time_step(at_seconds(1111111109), 30) == 37037036);
}

TEST_CASE("Totp: verify accepts codes inside the skew window", "[totp]") {
    Totp::Config cfg;
    const auto now = at_seconds(1111111109);
    const uint64_t step = Totp::time_step(now, cfg.period_seconds);

    const auto current = Totp::code_at(kRfcSecretB32, now, cfg);
    const auto matched = Totp::verify(kRfcSecretB32, current, now, cfg);
    REQUIRE(matched.has_value());
    CHECK(*matched == step);

    const auto earlier = Totp::code_at(kRfcSecretB32, now - std::chrono::seconds(60), cfg);
    CHECK(Totp::verify(kRfcSecretB32, earlier, now, cfg) == step - 2);

    const auto later = Totp::code_at(kRfcSecretB32, now + std::chrono::seconds(60), cfg);
    CHECK(Totp::verify(kRfcSecretB32, later, now, cfg) == step + 2);
}

TEST_CASE("Totp: verify rejects codes outside the window", "[totp]") {
    Totp::Config cfg;
    const auto now = at_seconds(1111111109);

    const auto stale = Totp::code_at(kRfcSecretB32, now - std::chrono::seconds(300), cfg);
    const auto current = Totp::code_at(kRfcSecretB32, now, cfg);
    if (stale != current) {
        CHECK_FALSE(Totp::verify(kRfcSecretB32, stale, now, cfg).has_value());
    }

    CHECK_FALSE(Totp::verify(kRfcSecretB32, "12345", now, cfg).has_value());
    CHECK_FALSE(Totp::verify(kRfcSecretB32, "12a456", now, cfg).has_value());
    CHECK_FALSE(Totp::verify(kRfcSecretB32, "", now, cfg).has_value());
}

TEST_CASE("Totp: verify near epoch does not underflow", "[totp]") {
    Totp::Config cfg;
    const auto now = at_seconds(10);
    const auto code = Totp::code_at(kRfcSecretB32, now, cfg);
    CHECK(Totp::verify(kRfcSecretB32, code, now, cfg) == 0u);
}

TEST_CASE("Totp: invalid secret throws", "[totp]") {
    Totp::Config cfg;
    CHECK_THROWS_AS(Totp::code_at("not base32!", at_seconds(59), cfg), SecurityError);
    CHECK_THROWS_AS(Totp::verify("", "123456", at_seconds(59), cfg), SecurityError);
}

TEST_CASE("Totp: generated secrets", "[totp]") {
    const auto secret = Totp::generate_secret(20);
    CHECK(secret.size() == 32);
    const auto decoded = Totp::base32_decode(secret);
    REQUIRE(decoded.has_value());
    CHECK(decoded->size() == 20);
    CHECK(Totp::generate_secret() != Totp::generate_secret());
}

TEST_CASE("Totp: provisioning URI", "[totp]") {
    Totp::Config cfg;
    cfg.issuer = "Acme Corp";
    const auto uri = Totp::provisioning_uri("alice@example.com", kRfcSecretB32, cfg);

    CHECK(uri.starts_with("otpauth://totp/Acme%20Corp:alice%40example.com?"));
    CHECK(uri.find("secret=GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ") != std::string::npos);
    CHECK(uri.find("issuer=Acme%20Corp") != std::string::npos);
    CHECK(uri.find("algorithm=SHA1") != std::string::npos);
    CHECK(uri.find("digits=6") != std::string::npos);
    CHECK(uri.find("period=30") != std::string::npos);
}
