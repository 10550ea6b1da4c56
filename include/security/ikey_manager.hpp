#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace secplane {

/**
 * @brief Source of the data keys behind FieldEncryptor envelopes
 *
 * Rotation adds a new active key. Retired keys stay resolvable by id so
 * values written under them remain readable.
 */
class IKeyManager {
public:
    struct DataKey {
        std::string key_id;             // Written into ENC:v1:<key_id>:...
        std::vector<uint8_t> bytes;     // AES-256 key
        uint32_t generation = 0;
    };

    virtual ~IKeyManager() = default;

    [[nodiscard]] virtual std::optional<DataKey> active_key() const = 0;
    [[nodiscard]] virtual std::optional<DataKey> find_key(const std::string& key_id) const = 0;

    /// @return id of the new active key
    virtual std::string rotate() = 0;

    /// Oldest first
    [[nodiscard]] virtual std::vector<std::string> key_ids() const = 0;
};

} // namespace secplane
