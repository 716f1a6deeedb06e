#pragma once

#include "core/error.hpp"
#include "directory/connection_cache.hpp"
#include "directory/directory_types.hpp"

#include <string>
#include <vector>

namespace ldapauth {

/**
 * @brief Search and unbind on a cached binding
 *
 * Thin layer over IDirectorySession that adds timing and diagnostics logs.
 * Callers tell "no match" from "search failed" with SearchResult::succeeded,
 * not with an empty entry list.
 */
class DirectoryClient {
public:
    [[nodiscard]] static Result<SearchResult> search(
        const DirectoryBinding& binding,
        const std::string& base_dn,
        const std::string& filter,
        SearchScope scope = SearchScope::ONE_LEVEL,
        const std::vector<std::string>& attributes = {});

    /// Idempotent.
    static void unbind(const DirectoryBinding& binding);
};

/**
 * @brief Cached binding for one DN/credential that is rebuilt when it dies
 *
 * Servers drop idle connections, so a binding that was fine when cached can
 * fail its next search. A search that fails with DIRECTORY_UNREACHABLE
 * releases the binding, binds again through the cache and is retried once.
 * The binding is acquired on first use and kept until release() or
 * destruction.
 */
class RebindingSession {
public:
    RebindingSession(ConnectionCache& connections, std::string dn, std::string credential);

    RebindingSession(const RebindingSession&) = delete;
    RebindingSession& operator=(const RebindingSession&) = delete;

    /// Current binding, bound through the cache on first call.
    [[nodiscard]] Result<BindingPtr> acquire();

    [[nodiscard]] Result<SearchResult> search(
        const std::string& base_dn,
        const std::string& filter,
        SearchScope scope = SearchScope::ONE_LEVEL,
        const std::vector<std::string>& attributes = {});

    /// Drop the binding from the cache; a later call binds afresh.
    void release();

    [[nodiscard]] const std::string& server_uri() const { return connections_.server().uri; }
    [[nodiscard]] const std::string& bound_dn() const { return dn_; }

private:
    ConnectionCache& connections_;
    std::string dn_;
    std::string credential_;
    BindingPtr binding_;
};

} // namespace ldapauth
