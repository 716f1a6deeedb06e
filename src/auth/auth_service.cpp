#include "auth/auth_service.hpp"
#include "auth/memory_user_store.hpp"
#include "core/utils.hpp"

#include <format>

namespace ldapauth {

namespace {

constexpr std::string_view kLoginStat = "ldap_auth.login";
constexpr std::string_view kLoginDurationStat = "ldap_auth.login.duration_ms";

DirectoryServerOptions to_server_options(const LdapConfig& ldap) {
    DirectoryServerOptions server;
    server.uri = ldap.uri.value_or("");
    server.ca_cert_file = ldap.cacert;
    server.start_tls = ldap.start_tls;
    server.timeout = ldap.timeout;
    server.ignore_malformed_schema = ldap.ignore_malformed_schema.value_or(false);
    return server;
}

ConnectionCache::Config to_connection_config(const CacheConfig& cache) {
    ConnectionCache::Config cfg;
    cfg.ttl = cache.ttl;
    cfg.max_entries = cache.max_entries;
    cfg.num_shards = cache.num_shards;
    return cfg;
}

GroupMembership::Config to_membership_config(const AuthConfig& config) {
    GroupMembership::Config cfg;
    cfg.ttl = config.cache.ttl;
    cfg.max_entries = config.cache.max_entries;
    cfg.num_shards = config.cache.num_shards;
    cfg.member_attribute = config.ldap.member_attr();
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<AuthService>> AuthService::create(
    AuthConfig config,
    std::shared_ptr<IDirectoryConnector> connector,
    std::shared_ptr<IUserStore> user_store,
    std::shared_ptr<IMetricsSink> metrics) {

    using CreateResult = Result<std::unique_ptr<AuthService>>;

    const auto missing = config.ldap.missing_required();
    if (!missing.empty()) {
        for (const auto& key : missing) {
            utils::log::error(std::format("{} is required but not configured", key));
        }
        return CreateResult::error(AuthError::configuration_missing(missing.front()));
    }

    if (!connector) {
        return CreateResult::error(AuthErrorCode::CONFIGURATION_MISSING,
                                   "No directory connector provided");
    }
    if (!user_store) user_store = std::make_shared<MemoryUserStore>();
    if (!metrics) metrics = std::make_shared<NullMetricsSink>();

    utils::log::info(std::format("LDAP auth using {} (search scope {}, cache ttl {}s)",
                                 *config.ldap.uri,
                                 config.ldap.subtree_search() ? "SUBTREE" : "LEVEL",
                                 config.cache.ttl.count()));

    return CreateResult::ok(std::make_unique<AuthService>(
        PrivateTag{}, std::move(config), std::move(connector), std::move(user_store),
        std::move(metrics)));
}

AuthService::AuthService(PrivateTag,
                         AuthConfig config,
                         std::shared_ptr<IDirectoryConnector> connector,
                         std::shared_ptr<IUserStore> user_store,
                         std::shared_ptr<IMetricsSink> metrics)
    : config_(std::move(config)),
      users_(std::move(user_store)),
      metrics_(std::move(metrics)),
      connections_(std::move(connector), to_server_options(config_.ldap),
                   to_connection_config(config_.cache)),
      membership_(to_membership_config(config_)),
      authenticator_(config_.ldap, connections_),
      resolver_(config_.ldap, connections_, membership_) {}

// ============================================================================
// Login
// ============================================================================

void AuthService::record_outcome(AuthErrorCode code, double elapsed_ms) {
    const std::vector<std::string> tags = {
        std::format("outcome:{}", code == AuthErrorCode::NONE ? "success" : error_code_name(code))
    };
    metrics_->incr(kLoginStat, 1, tags);
    metrics_->gauge(kLoginDurationStat, elapsed_ms, tags);
}

Result<Authenticated> AuthService::try_login(const std::string& username,
                                             const std::string& password) {
    utils::Timer timer;

    if (username.empty() || password.empty()) {
        // An empty password would turn the user bind into an anonymous bind
        utils::log::info("Rejected login with empty username or password");
        record_outcome(AuthErrorCode::INVALID_CREDENTIALS, 0.0);
        return Result<Authenticated>::error(AuthError::invalid_credentials());
    }

    auto result = authenticator_.try_login(username, password);
    const auto elapsed = static_cast<double>(timer.elapsed_ms().count());

    if (result.is_ok()) {
        utils::log::info(std::format("User {} authenticated as {}", username, result.value().dn));
        record_outcome(AuthErrorCode::NONE, elapsed);
    } else {
        const auto& err = result.error();
        if (err.code == AuthErrorCode::INVALID_CREDENTIALS) {
            utils::log::info(std::format("Login failed for {}: {}", username, err.message));
        } else {
            utils::log::error(std::format("Login failed for {} ({}): {}",
                                          username, error_code_name(err.code), err.message));
        }
        record_outcome(err.code, elapsed);
    }
    return result;
}

Result<Identity> AuthService::login(const std::string& username, const std::string& password) {
    auto authenticated = try_login(username, password);
    if (authenticated.is_error()) return Result<Identity>::forward(authenticated);

    auto user = users_->find_by_username(username);
    if (!user) {
        auto created = users_->create_user(username);
        users_->persist(*created);
        utils::log::info(std::format("Created local user {} (id {})", username, created->id));
        user = std::move(created);
    }

    return resolver_.resolve(std::move(user));
}

Result<std::optional<Identity>> AuthService::load_user(const std::string& id) {
    using LoadResult = Result<std::optional<Identity>>;

    if (id.empty() || id == "None") {
        return LoadResult::ok(std::nullopt);
    }

    auto user = users_->find_by_id(id);
    if (!user) {
        utils::log::debug(std::format("No local user with id {}", id));
        return LoadResult::ok(std::nullopt);
    }

    auto identity = resolver_.resolve(std::move(user));
    if (identity.is_error()) return LoadResult::forward(identity);
    return LoadResult::ok(std::move(identity.value()));
}

// ============================================================================
// Cache control
// ============================================================================

size_t AuthService::invalidate_credentials(const std::string& dn) {
    return connections_.invalidate(dn);
}

void AuthService::clear_caches() {
    connections_.clear();
    membership_.clear();
    utils::log::info("Cleared connection and group membership caches");
}

} // namespace ldapauth
