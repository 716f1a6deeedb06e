#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace ldapauth {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// LdapConfig accessors
// ============================================================================

const std::optional<std::string>* LdapConfig::find(std::string_view key) const {
    if (key == "uri") return &uri;
    if (key == "bind_user") return &bind_user;
    if (key == "bind_password") return &bind_password;
    if (key == "basedn") return &basedn;
    if (key == "user_filter") return &user_filter;
    if (key == "user_name_attr") return &user_name_attr;
    if (key == "superuser_filter") return &superuser_filter;
    if (key == "data_profiler_filter") return &data_profiler_filter;
    if (key == "cacert") return &cacert;
    if (key == "search_scope") return &search_scope;
    if (key == "group_member_attr") return &group_member_attr;
    return nullptr;
}

Result<std::string> LdapConfig::require(std::string_view key) const {
    const auto* slot = find(key);
    if (!slot || !slot->has_value()) {
        return Result<std::string>::error(
            AuthError::configuration_missing(std::format("ldap.{}", key)));
    }
    return Result<std::string>::ok(**slot);
}

std::vector<std::string> LdapConfig::missing_required() const {
    std::vector<std::string> missing;
    for (const auto key : kRequiredKeys) {
        const auto* slot = find(key);
        if (!slot || !slot->has_value()) {
            missing.push_back(std::format("ldap.{}", key));
        }
    }
    return missing;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LdapConfig ConfigLoader::extract_ldap(const toml::table& root) {
    LdapConfig cfg;
    const auto* ldap = root["ldap"].as_table();
    if (!ldap) return cfg;
    const auto& l = *ldap;

    cfg.uri = toml_optional_string(l, "uri");
    cfg.bind_user = toml_optional_string(l, "bind_user");
    cfg.bind_password = toml_optional_string(l, "bind_password");
    cfg.basedn = toml_optional_string(l, "basedn");
    cfg.user_filter = toml_optional_string(l, "user_filter");
    cfg.user_name_attr = toml_optional_string(l, "user_name_attr");
    cfg.superuser_filter = toml_optional_string(l, "superuser_filter");
    cfg.data_profiler_filter = toml_optional_string(l, "data_profiler_filter");
    cfg.cacert = toml_optional_string(l, "cacert");
    cfg.search_scope = toml_optional_string(l, "search_scope");
    cfg.group_member_attr = toml_optional_string(l, "group_member_attr");

    // Accept both a TOML bool and the "true"/"false" strings of ini-style configs
    if (auto b = l["ignore_malformed_schema"].value<bool>()) {
        cfg.ignore_malformed_schema = *b;
    } else if (auto s = toml_optional_string(l, "ignore_malformed_schema")) {
        cfg.ignore_malformed_schema = utils::to_lower(*s) == "true";
    }

    cfg.start_tls = l["start_tls"].value_or(false);
    cfg.timeout = std::chrono::milliseconds(l["timeout_ms"].value_or(int64_t{5000}));
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.ttl = std::chrono::seconds(c["ttl_seconds"].value_or(int64_t{86400}));
    cfg.max_entries = static_cast<size_t>(c["max_entries"].value_or(int64_t{10000}));
    cfg.num_shards = static_cast<size_t>(c["num_shards"].value_or(int64_t{16}));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

AuthConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AuthConfig config;
    config.ldap = extract_ldap(root);
    config.cache = extract_cache(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AuthConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AuthConfig& config) {
    std::vector<std::string> errors;
    const auto& ldap = config.ldap;

    for (const auto& key : ldap.missing_required()) {
        errors.push_back(std::format("{} is required (configuration missing)", key));
    }

    if (ldap.uri && !utils::starts_with_icase(*ldap.uri, "ldap://") &&
        !utils::starts_with_icase(*ldap.uri, "ldaps://")) {
        errors.push_back(std::format(
            "ldap.uri must start with ldap:// or ldaps://, got '{}'", *ldap.uri));
    }
    // Simple binds carry the password, so the connection must be encrypted
    if (ldap.uri && utils::starts_with_icase(*ldap.uri, "ldap://") && !ldap.start_tls) {
        errors.push_back(std::format(
            "ldap.uri '{}' is not encrypted: use ldaps:// or set ldap.start_tls = true",
            *ldap.uri));
    }

    // Optional keys may be absent, but when present they must be usable
    if (ldap.cacert && ldap.cacert->empty()) {
        errors.push_back("ldap.cacert must not be empty when set");
    }
    if (ldap.group_member_attr && ldap.group_member_attr->empty()) {
        errors.push_back("ldap.group_member_attr must not be empty when set");
    }

    if (ldap.timeout.count() <= 0) {
        errors.push_back(std::format("ldap.timeout_ms must be > 0, got {}", ldap.timeout.count()));
    }

    if (config.cache.ttl.count() < 0 || config.cache.ttl > CacheConfig::kMaxTtl) {
        errors.push_back(std::format("cache.ttl_seconds must be between 0 and {}, got {}",
                                     CacheConfig::kMaxTtl.count(), config.cache.ttl.count()));
    }
    if (config.cache.max_entries == 0) {
        errors.push_back("cache.max_entries must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace ldapauth
