#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace ldapauth {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AuthConfig config;

        static LoadResult ok(AuthConfig cfg) {
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
     * @param config_path Path to the auth TOML file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// All problems with a config, empty when valid.
    [[nodiscard]] static std::vector<std::string> validate_config(const AuthConfig& config);

private:
    static LdapConfig extract_ldap(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static AuthConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AuthConfig config);
};

} // namespace ldapauth
