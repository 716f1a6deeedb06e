#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ldapauth {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief [ldap] section
 *
 * String keys are optional so that an absent key (default or unrestricted
 * behaviour) can be told apart from a key set to "".
 */
struct LdapConfig {
    std::optional<std::string> uri;
    std::optional<std::string> bind_user;
    std::optional<std::string> bind_password;
    std::optional<std::string> basedn;
    std::optional<std::string> user_filter;
    std::optional<std::string> user_name_attr;
    std::optional<std::string> superuser_filter;
    std::optional<std::string> data_profiler_filter;
    std::optional<std::string> cacert;
    std::optional<std::string> search_scope;      // "SUBTREE", anything else = one level
    std::optional<std::string> group_member_attr; // default "memberOf"
    std::optional<bool> ignore_malformed_schema;

    bool start_tls = false;
    std::chrono::milliseconds timeout{5000};

    static constexpr std::string_view kDefaultGroupMemberAttr = "memberOf";

    /// Keys that must be present for try_login to work at all.
    static constexpr std::string_view kRequiredKeys[] = {
        "uri", "bind_user", "bind_password", "basedn", "user_filter", "user_name_attr",
    };

    /// Look up any [ldap] string key by name.
    [[nodiscard]] const std::optional<std::string>* find(std::string_view key) const;

    /// Value of a required key, or CONFIGURATION_MISSING(key).
    [[nodiscard]] Result<std::string> require(std::string_view key) const;

    /// Required keys that are absent, in declaration order.
    [[nodiscard]] std::vector<std::string> missing_required() const;

    [[nodiscard]] std::string member_attr() const {
        return group_member_attr.value_or(std::string(kDefaultGroupMemberAttr));
    }

    [[nodiscard]] bool subtree_search() const {
        return search_scope.has_value() && *search_scope == "SUBTREE";
    }
};

struct CacheConfig {
    /// One year; keeps steady_clock::now() + ttl from overflowing.
    static constexpr std::chrono::seconds kMaxTtl{366 * 24 * 3600};

    std::chrono::seconds ttl{86400};
    size_t max_entries = 10000;
    size_t num_shards = 16;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// AuthConfig - Complete parsed configuration
// ============================================================================

struct AuthConfig {
    LdapConfig ldap;
    CacheConfig cache;
    LoggingConfig logging;
};

} // namespace ldapauth
