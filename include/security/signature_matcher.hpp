#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace secplane {

/**
 * @brief Attack-signature scan over request payloads
 *
 * Each signature is a single forward scan over a lowercased copy of the
 * input, so cost stays linear in the scanned length. Only the first
 * max_scan_bytes of every input are examined. Stops at the first
 * signature that hits.
 */
class SignatureMatcher {
public:
    static constexpr size_t kDefaultMaxScanBytes = 8192;

    /// Detector over lowercased input
    using Detector = bool (*)(std::string_view text);

    struct Signature {
        const char* name;
        Detector detect;
    };

    /// Built-in set: SQL boolean/equality injection, script tags,
    /// path traversal, code-execution keywords
    explicit SignatureMatcher(size_t max_scan_bytes = kDefaultMaxScanBytes);

    /// Name of the first matching signature across the given inputs
    [[nodiscard]] std::optional<std::string> first_match(
        const std::vector<std::string_view>& inputs) const;

    [[nodiscard]] size_t size() const { return signatures_.size(); }
    [[nodiscard]] size_t max_scan_bytes() const { return max_scan_bytes_; }

private:
    std::vector<Signature> signatures_;
    size_t max_scan_bytes_;
};

} // namespace secplane
