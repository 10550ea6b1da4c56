#pragma once

#include "tenant/security_settings.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace secplane {

class IpAllowlist {
public:
    struct CidrRange {
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    static bool parse_ip(std::string_view ip, uint32_t& out);
    static bool parse_cidr(std::string_view cidr, CidrRange& out);
    static bool ip_matches_cidr(uint32_t ip, const CidrRange& range);

    /// 127.0.0.0/8, ::1, "localhost" and IPv4-mapped ::ffff:127.x
    [[nodiscard]] static bool is_loopback(std::string_view ip);

    /// IPv4 address, IPv4 CIDR range, or an IPv6 literal (exact match only)
    [[nodiscard]] static bool is_valid_entry(std::string_view entry);

    /**
     * @brief Check an address against allowlist entries
     * @param ip Client address (e.g., "10.0.1.5")
     * @param allowlist Exact addresses or CIDR ranges (e.g., "10.0.0.0/8")
     * @return true if ip equals an entry or falls inside a range.
     *         An empty allowlist admits nothing.
     */
    [[nodiscard]] static bool matches_any(std::string_view ip,
                                          const std::vector<std::string>& allowlist);

    /**
     * @brief Organization-level decision
     *
     * Allowlisting disabled → allowed. Enabled → loopback passes when
     * allow_loopback is set, otherwise the address must match an entry.
     */
    [[nodiscard]] static bool is_allowed(const OrgSecuritySettings& settings, std::string_view ip);
};

} // namespace secplane
