#include "directory/connection_cache.hpp"
#include "auth/credential_hasher.hpp"
#include "core/utils.hpp"

#include <format>

namespace ldapauth {

namespace {

constexpr char kKeySeparator = '\x1f';

TimedCache<std::string, BindingPtr>::Config to_cache_config(const ConnectionCache::Config& config) {
    TimedCache<std::string, BindingPtr>::Config cfg;
    cfg.max_entries = config.max_entries;
    cfg.num_shards = config.num_shards;
    cfg.default_ttl = config.ttl;
    return cfg;
}

} // anonymous namespace

ConnectionCache::ConnectionCache(std::shared_ptr<IDirectoryConnector> connector,
                                 DirectoryServerOptions server)
    : ConnectionCache(std::move(connector), std::move(server), Config{}) {}

ConnectionCache::ConnectionCache(std::shared_ptr<IDirectoryConnector> connector,
                                 DirectoryServerOptions server,
                                 const Config& config)
    : connector_(std::move(connector)),
      server_(std::move(server)),
      config_(config),
      cache_(to_cache_config(config)) {}

std::string ConnectionCache::make_key(const std::string& dn, const std::string& fingerprint) {
    std::string key;
    key.reserve(dn.size() + fingerprint.size() + 1);
    key += dn;
    key += kKeySeparator;
    key += fingerprint;
    return key;
}

Result<BindingPtr> ConnectionCache::get_connection(const std::string& dn,
                                                   const std::string& credential) {
    std::string fingerprint = CredentialHasher::instance().fingerprint(credential);
    const auto key = make_key(dn, fingerprint);

    if (auto cached = cache_.get(key)) {
        if ((*cached)->is_bound()) {
            return Result<BindingPtr>::ok(std::move(*cached));
        }
        utils::log::debug(std::format("Discarding unbound cached binding #{} for {}",
                                      (*cached)->id, dn));
        cache_.invalidate(key);
    }

    auto opened = open_binding(dn, credential, std::move(fingerprint));
    if (opened.is_ok()) {
        cache_.put(key, opened.value(), config_.ttl);
    }
    return opened;
}

Result<BindingPtr> ConnectionCache::open_binding(const std::string& dn,
                                                 const std::string& credential,
                                                 std::string fingerprint) {
    utils::Timer timer;
    auto session = connector_->open(server_, dn, credential);
    if (session.is_error()) {
        utils::log::error(std::format("Cannot bind to ldap server {} as {}: {}",
                                      server_.uri, dn, session.error_message()));
        return Result<BindingPtr>::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
                                         "Cannot bind to ldap server");
    }

    auto binding = std::make_shared<DirectoryBinding>();
    binding->id = next_id_.fetch_add(1, std::memory_order_relaxed);
    binding->server_uri = server_.uri;
    binding->ca_cert_file = server_.ca_cert_file;
    binding->bound_dn = dn;
    binding->credential_fingerprint = std::move(fingerprint);
    binding->session = std::move(session.value());

    utils::log::debug(std::format("Bound {} as binding #{} in {}ms",
                                  dn, binding->id, timer.elapsed_ms().count()));
    return Result<BindingPtr>::ok(std::move(binding));
}

void ConnectionCache::release(const DirectoryBinding& binding) {
    cache_.invalidate(make_key(binding.bound_dn, binding.credential_fingerprint));
}

size_t ConnectionCache::invalidate(const std::string& dn) {
    std::string prefix = dn;
    prefix += kKeySeparator;
    const size_t removed = cache_.invalidate_if([&prefix](const std::string& key) {
        return key.starts_with(prefix);
    });
    if (removed > 0) {
        utils::log::info(std::format("Invalidated {} cached binding(s) for {}", removed, dn));
    }
    return removed;
}

void ConnectionCache::clear() {
    cache_.clear();
}

} // namespace ldapauth
