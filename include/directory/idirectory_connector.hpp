#pragma once

#include "core/error.hpp"
#include "directory/directory_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ldapauth {

/**
 * @brief A bound session with the directory server
 *
 * Implementations must be safe to call from several threads; a session
 * serialises its own protocol operations.
 */
class IDirectorySession {
public:
    virtual ~IDirectorySession() = default;

    /**
     * @brief Run a search on the bound session
     * @return DIRECTORY_UNREACHABLE on transport failure or timeout,
     *         otherwise the SearchResult (possibly with no entries)
     */
    [[nodiscard]] virtual Result<SearchResult> search(
        const std::string& base_dn,
        const std::string& filter,
        SearchScope scope,
        const std::vector<std::string>& attributes) = 0;

    /// Release the session. Further calls are no-ops.
    virtual void unbind() = 0;

    [[nodiscard]] virtual bool is_bound() const = 0;
};

/**
 * @brief Opens and binds directory sessions
 *
 * The seam between the auth core and a concrete LDAP client library.
 */
class IDirectoryConnector {
public:
    virtual ~IDirectoryConnector() = default;

    /**
     * @brief Connect to the server and perform a simple bind
     * @return bound session, or DIRECTORY_UNREACHABLE (network error or
     *         rejected credentials; the two are not told apart here)
     */
    [[nodiscard]] virtual Result<std::shared_ptr<IDirectorySession>> open(
        const DirectoryServerOptions& server,
        const std::string& dn,
        const std::string& credential) = 0;
};

} // namespace ldapauth
