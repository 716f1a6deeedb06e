#pragma once

#include "cache/timed_cache.hpp"
#include "core/error.hpp"
#include "directory/directory_types.hpp"
#include "directory/idirectory_connector.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ldapauth {

/**
 * @brief A bound directory session plus what it was bound with
 *
 * Only ever published fully bound. The raw credential is not kept; the
 * fingerprint identifies it in cache keys. The session is unbound when the
 * last holder drops the binding.
 */
struct DirectoryBinding {
    uint64_t id = 0;
    std::string server_uri;
    std::optional<std::string> ca_cert_file;
    std::string bound_dn;
    std::string credential_fingerprint;
    std::shared_ptr<IDirectorySession> session;

    DirectoryBinding() = default;
    DirectoryBinding(const DirectoryBinding&) = delete;
    DirectoryBinding& operator=(const DirectoryBinding&) = delete;

    ~DirectoryBinding() {
        if (session) session->unbind();
    }

    [[nodiscard]] bool is_bound() const { return session && session->is_bound(); }
};

using BindingPtr = std::shared_ptr<const DirectoryBinding>;

/**
 * @brief Memoizes bound sessions keyed by (DN, credential fingerprint)
 *
 * A miss opens a TLS-configured session and binds; only successful binds are
 * cached. Entries past their TTL, and entries whose session has since been
 * unbound, are rebuilt transparently on the next request.
 *
 * Caching user binds means a changed password keeps working until the entry
 * expires or invalidate(dn) is called. Keep the TTL short where that matters.
 */
class ConnectionCache {
public:
    struct Config {
        std::chrono::seconds ttl{86400};
        size_t max_entries = 1024;
        size_t num_shards = 8;
    };

    ConnectionCache(std::shared_ptr<IDirectoryConnector> connector,
                    DirectoryServerOptions server);
    ConnectionCache(std::shared_ptr<IDirectoryConnector> connector,
                    DirectoryServerOptions server,
                    const Config& config);

    /**
     * @brief Cached or freshly bound session for dn/credential
     * @return DIRECTORY_UNREACHABLE if the bind does not succeed, whatever
     *         the reason (network, TLS, rejected credentials)
     */
    [[nodiscard]] Result<BindingPtr> get_connection(const std::string& dn,
                                                    const std::string& credential);

    /// Drop a binding from the cache; it unbinds once no caller holds it.
    void release(const DirectoryBinding& binding);

    /// Drop every cached binding for a DN (credential rotation). Returns count.
    size_t invalidate(const std::string& dn);

    void clear();

    [[nodiscard]] TimedCache<std::string, BindingPtr>::Stats get_stats() const {
        return cache_.get_stats();
    }

    [[nodiscard]] const DirectoryServerOptions& server() const { return server_; }

private:
    [[nodiscard]] Result<BindingPtr> open_binding(const std::string& dn,
                                                  const std::string& credential,
                                                  std::string fingerprint);

    static std::string make_key(const std::string& dn, const std::string& fingerprint);

    std::shared_ptr<IDirectoryConnector> connector_;
    DirectoryServerOptions server_;
    Config config_;
    TimedCache<std::string, BindingPtr> cache_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace ldapauth
