#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace secplane {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SecPlaneConfig config;

        static LoadResult ok(SecPlaneConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to secplane.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const SecPlaneConfig& config);

private:
    static ThreatConfig extract_threat(const toml::table& root);
    static DenylistConfig extract_denylist(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static MfaConfig extract_mfa(const toml::table& root);
    static EncryptionConfig extract_encryption(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static SettingsConfig extract_settings(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static SecPlaneConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(SecPlaneConfig config);
};

} // namespace secplane
