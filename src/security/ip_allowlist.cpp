#include "security/ip_allowlist.hpp"

namespace secplane {

bool IpAllowlist::parse_ip(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    bool has_digit = false;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (!has_digit || val > 255 || octet_idx > 3) return false;
            octets[octet_idx++] = val;
            val = 0;
            has_digit = false;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
            if (val > 255) return false;
            has_digit = true;
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

bool IpAllowlist::parse_cidr(std::string_view cidr, CidrRange& out) {
    const auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        // No prefix → /32 (exact match)
        if (!parse_ip(cidr, out.network)) return false;
        out.mask = 0xFFFFFFFFu;
        return true;
    }

    if (!parse_ip(cidr.substr(0, slash), out.network)) return false;
    if (slash + 1 == cidr.size()) return false;

    uint32_t prefix = 0;
    for (size_t i = slash + 1; i < cidr.size(); ++i) {
        if (cidr[i] < '0' || cidr[i] > '9') return false;
        prefix = prefix * 10 + static_cast<uint32_t>(cidr[i] - '0');
        if (prefix > 32) return false;
    }
    out.mask = (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
    out.network &= out.mask;  // normalize
    return true;
}

bool IpAllowlist::ip_matches_cidr(uint32_t ip, const CidrRange& range) {
    return (ip & range.mask) == range.network;
}

bool IpAllowlist::is_loopback(std::string_view ip) {
    return ip == "::1" ||
           ip == "localhost" ||
           ip.starts_with("127.") ||
           ip.starts_with("::ffff:127.");
}

bool IpAllowlist::is_valid_entry(std::string_view entry) {
    if (entry.empty()) return false;
    CidrRange range;
    if (parse_cidr(entry, range)) return true;

    // IPv6 literal: hex digits, colons and an optional embedded IPv4 tail
    if (entry.find(':') == std::string_view::npos) return false;
    for (const char c : entry) {
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
                        (c >= 'A' && c <= 'F') || c == ':' || c == '.';
        if (!ok) return false;
    }
    return true;
}

bool IpAllowlist::matches_any(std::string_view ip,
                              const std::vector<std::string>& allowlist) {
    uint32_t client_ip = 0;
    const bool is_v4 = parse_ip(ip, client_ip);

    for (const auto& entry : allowlist) {
        if (entry == ip) return true;
        CidrRange range;
        if (is_v4 && parse_cidr(entry, range) && ip_matches_cidr(client_ip, range)) {
            return true;
        }
    }
    return false;
}

bool IpAllowlist::is_allowed(const OrgSecuritySettings& settings, std::string_view ip) {
    if (!settings.ip_allowlist_enabled) return true;
    if (settings.allow_loopback && is_loopback(ip)) return true;
    return matches_any(ip, settings.allowed_addresses);
}

} // namespace secplane
