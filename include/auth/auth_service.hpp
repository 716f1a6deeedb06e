#pragma once

#include "auth/authenticator.hpp"
#include "auth/group_membership.hpp"
#include "auth/identity.hpp"
#include "auth/iuser_store.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "directory/connection_cache.hpp"
#include "directory/idirectory_connector.hpp"
#include "metrics/imetrics_sink.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ldapauth {

/**
 * @brief Entry point of the auth core
 *
 * Owns the connection and membership caches and wires them to the injected
 * directory connector, user store and metrics sink. Create one at startup
 * and share it between request threads; every operation is thread-safe.
 */
class AuthService {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Validate configuration and build the service
     *
     * user_store defaults to a MemoryUserStore, metrics to a NullMetricsSink.
     *
     * @return CONFIGURATION_MISSING naming the first absent required key
     */
    [[nodiscard]] static Result<std::unique_ptr<AuthService>> create(
        AuthConfig config,
        std::shared_ptr<IDirectoryConnector> connector,
        std::shared_ptr<IUserStore> user_store = nullptr,
        std::shared_ptr<IMetricsSink> metrics = nullptr);

    /// Use create(); the tag keeps construction to validated configs.
    AuthService(PrivateTag,
                AuthConfig config,
                std::shared_ptr<IDirectoryConnector> connector,
                std::shared_ptr<IUserStore> user_store,
                std::shared_ptr<IMetricsSink> metrics);

    AuthService(const AuthService&) = delete;
    AuthService& operator=(const AuthService&) = delete;

    /// Check a username/password pair against the directory. No side effects
    /// beyond caching and metrics.
    [[nodiscard]] Result<Authenticated> try_login(const std::string& username,
                                                  const std::string& password);

    /// try_login, then find or create the local user record and build its Identity.
    [[nodiscard]] Result<Identity> login(const std::string& username,
                                         const std::string& password);

    /**
     * @brief Rebuild the Identity of a stored user (session restore)
     * @return empty optional for "", "None" or an unknown id
     */
    [[nodiscard]] Result<std::optional<Identity>> load_user(const std::string& id);

    /// Forget cached bindings for a DN, e.g. after a password change.
    size_t invalidate_credentials(const std::string& dn);

    void clear_caches();

    [[nodiscard]] const AuthConfig& config() const { return config_; }
    [[nodiscard]] const ConnectionCache& connections() const { return connections_; }

private:
    void record_outcome(AuthErrorCode code, double elapsed_ms);

    // Declaration order matters: the components below hold references to config_
    AuthConfig config_;
    std::shared_ptr<IUserStore> users_;
    std::shared_ptr<IMetricsSink> metrics_;
    ConnectionCache connections_;
    GroupMembership membership_;
    Authenticator authenticator_;
    IdentityResolver resolver_;
};

} // namespace ldapauth
