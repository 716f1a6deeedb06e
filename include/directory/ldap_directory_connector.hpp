#pragma once

#include "directory/idirectory_connector.hpp"

namespace ldapauth {

/**
 * @brief IDirectoryConnector backed by OpenLDAP's libldap
 *
 * Sessions speak LDAPv3 with certificate verification demanded, an optional
 * CA file, and the configured timeout applied to connect, every operation
 * and the search time limit. ldap:// URIs are upgraded with StartTLS when
 * start_tls is set; ldaps:// URIs are TLS from the first byte.
 *
 * Requires libldap (compile with ENABLE_LDAP=ON).
 */
class LdapDirectoryConnector : public IDirectoryConnector {
public:
    [[nodiscard]] Result<std::shared_ptr<IDirectorySession>> open(
        const DirectoryServerOptions& server,
        const std::string& dn,
        const std::string& credential) override;
};

} // namespace ldapauth
