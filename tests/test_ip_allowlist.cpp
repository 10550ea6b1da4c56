#include <catch2/catch_test_macros.hpp>
#include "security/ip_allowlist.hpp"

using namespace secplane;

namespace {

OrgSecuritySettings allowlisted(std::vector<std::string> entries, bool allow_loopback = true) {
    OrgSecuritySettings s;
    s.organization_id = "org-a";
    s.ip_allowlist_enabled = true;
    s.allowed_addresses = std::move(entries);
    s.allow_loopback = allow_loopback;
    return s;
}

} // anonymous namespace

TEST_CASE("IpAllowlist: empty allowlist admits nothing", "[ip_allowlist]") {
    std::vector<std::string> allowlist;
    CHECK_FALSE(IpAllowlist::matches_any("10.0.0.1", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("8.8.8.8", allowlist));
}

TEST_CASE("IpAllowlist: exact IP match", "[ip_allowlist]") {
    std::vector<std::string> allowlist = {"192.168.1.100"};
    CHECK(IpAllowlist::matches_any("192.168.1.100", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("192.168.1.101", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("10.0.0.1", allowlist));
}

TEST_CASE("IpAllowlist: CIDR /8 range matches", "[ip_allowlist]") {
    std::vector<std::string> allowlist = {"10.0.0.0/8"};
    CHECK(IpAllowlist::matches_any("10.0.0.1", allowlist));
    CHECK(IpAllowlist::matches_any("10.255.255.255", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("11.0.0.1", allowlist));
}

TEST_CASE("IpAllowlist: CIDR /24 range rejects out-of-range IP", "[ip_allowlist]") {
    std::vector<std::string> allowlist = {"192.168.1.0/24"};
    CHECK(IpAllowlist::matches_any("192.168.1.1", allowlist));
    CHECK(IpAllowlist::matches_any("192.168.1.254", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("192.168.2.1", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("192.168.0.1", allowlist));
}

TEST_CASE("IpAllowlist: unnormalized network is normalized", "[ip_allowlist]") {
    std::vector<std::string> allowlist = {"172.16.5.9/12"};
    CHECK(IpAllowlist::matches_any("172.16.0.1", allowlist));
    CHECK(IpAllowlist::matches_any("172.31.255.255", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("172.32.0.1", allowlist));
}

TEST_CASE("IpAllowlist: /0 and /32 boundaries", "[ip_allowlist]") {
    CHECK(IpAllowlist::matches_any("203.0.113.7", {"0.0.0.0/0"}));
    CHECK(IpAllowlist::matches_any("203.0.113.7", {"203.0.113.7/32"}));
    CHECK_FALSE(IpAllowlist::matches_any("203.0.113.8", {"203.0.113.7/32"}));
}

TEST_CASE("IpAllowlist: IPv6 entries match exactly", "[ip_allowlist]") {
    std::vector<std::string> allowlist = {"2001:db8::1"};
    CHECK(IpAllowlist::matches_any("2001:db8::1", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("2001:db8::2", allowlist));
}

TEST_CASE("IpAllowlist: invalid client address never matches", "[ip_allowlist]") {
    std::vector<std::string> allowlist = {"10.0.0.0/8"};
    CHECK_FALSE(IpAllowlist::matches_any("not-an-ip", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("", allowlist));
    CHECK_FALSE(IpAllowlist::matches_any("10.0.0.256", allowlist));
}

TEST_CASE("IpAllowlist: entry validation", "[ip_allowlist]") {
    CHECK(IpAllowlist::is_valid_entry("10.0.0.1"));
    CHECK(IpAllowlist::is_valid_entry("10.0.0.0/8"));
    CHECK(IpAllowlist::is_valid_entry("::1"));
    CHECK(IpAllowlist::is_valid_entry("2001:db8::ff00:42:8329"));

    CHECK_FALSE(IpAllowlist::is_valid_entry(""));
    CHECK_FALSE(IpAllowlist::is_valid_entry("10.0.0"));
    CHECK_FALSE(IpAllowlist::is_valid_entry("10.0.0.0/33"));
    CHECK_FALSE(IpAllowlist::is_valid_entry("10.0.0.0/"));
    CHECK_FALSE(IpAllowlist::is_valid_entry("example.com"));
    CHECK_FALSE(IpAllowlist::is_valid_entry("1.2.3.4.5"));
}

TEST_CASE("IpAllowlist: loopback detection", "[ip_allowlist]") {
    CHECK(IpAllowlist::is_loopback("127.0.0.1"));
    CHECK(IpAllowlist::is_loopback("127.10.20.30"));
    CHECK(IpAllowlist::is_loopback("::1"));
    CHECK(IpAllowlist::is_loopback("localhost"));
    CHECK(IpAllowlist::is_loopback("::ffff:127.0.0.1"));
    CHECK_FALSE(IpAllowlist::is_loopback("10.0.0.1"));
    CHECK_FALSE(IpAllowlist::is_loopback("128.0.0.1"));
}

TEST_CASE("IpAllowlist: organization with allowlisting disabled allows all", "[ip_allowlist]") {
    OrgSecuritySettings s;
    s.ip_allowlist_enabled = false;
    s.allowed_addresses = {"10.0.0.1"};
    CHECK(IpAllowlist::is_allowed(s, "8.8.8.8"));
    CHECK(IpAllowlist::is_allowed(s, "garbage"));
}

TEST_CASE("IpAllowlist: organization with allowlisting enabled", "[ip_allowlist]") {
    const auto s = allowlisted({"10.0.0.0/8", "192.168.1.100"});
    CHECK(IpAllowlist::is_allowed(s, "10.5.5.5"));
    CHECK(IpAllowlist::is_allowed(s, "192.168.1.100"));
    CHECK_FALSE(IpAllowlist::is_allowed(s, "8.8.8.8"));
}

TEST_CASE("IpAllowlist: loopback bypass follows the organization flag", "[ip_allowlist]") {
    CHECK(IpAllowlist::is_allowed(allowlisted({"10.0.0.0/8"}, true), "127.0.0.1"));
    CHECK(IpAllowlist::is_allowed(allowlisted({"10.0.0.0/8"}, true), "::1"));
    CHECK_FALSE(IpAllowlist::is_allowed(allowlisted({"10.0.0.0/8"}, false), "127.0.0.1"));
    CHECK_FALSE(IpAllowlist::is_allowed(allowlisted({}, false), "127.0.0.1"));
}
