#pragma once

#include "auth/group_membership.hpp"
#include "auth/iuser_store.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "directory/connection_cache.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ldapauth {

/**
 * @brief An authenticated principal and what it may do
 *
 * Built once per login session and immutable afterwards. Holds a read-only
 * reference to the user record; owns no directory connection.
 */
class Identity {
public:
    Identity(std::shared_ptr<const UserRecord> user,
             bool superuser,
             bool data_profiler,
             std::vector<std::string> ldap_groups);

    // Session-framework contract: an Identity only exists after a login
    [[nodiscard]] bool is_active() const { return true; }
    [[nodiscard]] bool is_authenticated() const { return true; }
    [[nodiscard]] bool is_anonymous() const { return false; }

    [[nodiscard]] const std::string& get_id() const { return user_->id; }

    /// Access to data profiling tools
    [[nodiscard]] bool has_data_profiling_access() const { return data_profiler_; }

    /// Access to everything
    [[nodiscard]] bool is_superuser() const { return superuser_; }

    /// CNs of the directory groups the user belongs to
    [[nodiscard]] const std::vector<std::string>& ldap_groups() const { return ldap_groups_; }

    [[nodiscard]] const UserRecord& user() const { return *user_; }

private:
    std::shared_ptr<const UserRecord> user_;
    bool superuser_;
    bool data_profiler_;
    std::vector<std::string> ldap_groups_;
};

/**
 * @brief Computes an Identity's flags and groups from the directory
 *
 * An unset or empty superuser_filter / data_profiler_filter grants the
 * capability to everyone. Missing basedn, user_filter or user_name_attr
 * leaves the group list empty instead of failing. All lookups share one
 * service-account binding.
 */
class IdentityResolver {
public:
    IdentityResolver(const LdapConfig& config,
                     ConnectionCache& connections,
                     GroupMembership& membership);

    [[nodiscard]] Result<Identity> resolve(std::shared_ptr<const UserRecord> user);

private:
    class ServiceBinding;

    Result<bool> resolve_flag(const std::optional<std::string>& group_filter,
                              const char* capability,
                              ServiceBinding& service,
                              const std::string& username);

    Result<std::vector<std::string>> resolve_groups(ServiceBinding& service,
                                                    const std::string& username);

    const LdapConfig& config_;
    ConnectionCache& connections_;
    GroupMembership& membership_;
};

} // namespace ldapauth
