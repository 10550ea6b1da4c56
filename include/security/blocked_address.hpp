#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace secplane {

struct BlockedAddress {
    std::string address;                    // Unique key
    std::string reason;
    std::optional<std::string> blocked_by;  // Empty for automatic blocks
    TimePoint blocked_at{};
    std::optional<TimePoint> expires_at;    // Empty = indefinite
    bool automatic = false;                 // Raised by threat scoring

    [[nodiscard]] bool is_expired(TimePoint now) const {
        return expires_at.has_value() && *expires_at <= now;
    }
};

} // namespace secplane
