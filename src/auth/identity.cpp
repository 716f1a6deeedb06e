#include "auth/identity.hpp"
#include "core/utils.hpp"
#include "directory/directory_client.hpp"

#include <format>

namespace ldapauth {

// ============================================================================
// Identity
// ============================================================================

Identity::Identity(std::shared_ptr<const UserRecord> user,
                   bool superuser,
                   bool data_profiler,
                   std::vector<std::string> ldap_groups)
    : user_(std::move(user)),
      superuser_(superuser),
      data_profiler_(data_profiler),
      ldap_groups_(std::move(ldap_groups)) {}

// ============================================================================
// IdentityResolver
// ============================================================================

/// Service-account session, created on first use and shared by all lookups.
class IdentityResolver::ServiceBinding {
public:
    ServiceBinding(const LdapConfig& config, ConnectionCache& connections)
        : config_(config), connections_(connections) {}

    Result<RebindingSession*> get() {
        if (session_) return Result<RebindingSession*>::ok(&*session_);

        auto bind_user = config_.require("bind_user");
        if (bind_user.is_error()) return Result<RebindingSession*>::forward(bind_user);
        auto bind_password = config_.require("bind_password");
        if (bind_password.is_error()) return Result<RebindingSession*>::forward(bind_password);

        session_.emplace(connections_, bind_user.value(), bind_password.value());
        return Result<RebindingSession*>::ok(&*session_);
    }

private:
    const LdapConfig& config_;
    ConnectionCache& connections_;
    std::optional<RebindingSession> session_;
};

IdentityResolver::IdentityResolver(const LdapConfig& config,
                                   ConnectionCache& connections,
                                   GroupMembership& membership)
    : config_(config), connections_(connections), membership_(membership) {}

Result<bool> IdentityResolver::resolve_flag(const std::optional<std::string>& group_filter,
                                            const char* capability,
                                            ServiceBinding& service,
                                            const std::string& username) {
    if (!group_filter || group_filter->empty()) {
        utils::log::debug(std::format(
            "Missing configuration for {} settings or empty. Skipping.", capability));
        return Result<bool>::ok(true);
    }

    auto basedn = config_.require("basedn");
    if (basedn.is_error()) return Result<bool>::forward(basedn);
    auto user_name_attr = config_.require("user_name_attr");
    if (user_name_attr.is_error()) return Result<bool>::forward(user_name_attr);

    auto session = service.get();
    if (session.is_error()) return Result<bool>::forward(session);

    return membership_.group_contains_user(*session.value(),
        {basedn.value(), *group_filter, user_name_attr.value(), username});
}

Result<std::vector<std::string>> IdentityResolver::resolve_groups(ServiceBinding& service,
                                                                  const std::string& username) {
    using GroupsResult = Result<std::vector<std::string>>;

    if (!config_.basedn || !config_.user_filter || !config_.user_name_attr) {
        utils::log::debug("Missing configuration for ldap settings. Skipping group lookup");
        return GroupsResult::ok({});
    }

    auto session = service.get();
    if (session.is_error()) return GroupsResult::forward(session);

    return membership_.groups_for_user(*session.value(),
        {*config_.basedn, *config_.user_filter, *config_.user_name_attr, username});
}

Result<Identity> IdentityResolver::resolve(std::shared_ptr<const UserRecord> user) {
    utils::Timer timer;
    ServiceBinding service(config_, connections_);
    const auto& username = user->username;

    auto superuser = resolve_flag(config_.superuser_filter, "superuser", service, username);
    if (superuser.is_error()) return Result<Identity>::forward(superuser);

    auto data_profiler = resolve_flag(config_.data_profiler_filter, "data profiler",
                                      service, username);
    if (data_profiler.is_error()) return Result<Identity>::forward(data_profiler);

    auto groups = resolve_groups(service, username);
    if (groups.is_error()) return Result<Identity>::forward(groups);

    utils::log::debug(std::format("Resolved identity for {} (superuser={}, data_profiler={}, "
                                  "{} groups) in {}ms",
                                  username, utils::booltostr(superuser.value()),
                                  utils::booltostr(data_profiler.value()),
                                  groups.value().size(), timer.elapsed_ms().count()));

    return Result<Identity>::ok(Identity(std::move(user), superuser.value(),
                                         data_profiler.value(), std::move(groups.value())));
}

} // namespace ldapauth
