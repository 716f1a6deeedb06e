#include "directory/ldap_directory_connector.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>
#include <mutex>

#include <ldap.h>
#include <sys/time.h>

namespace ldapauth {

namespace {

timeval to_timeval(std::chrono::milliseconds timeout) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

int to_ldap_scope(SearchScope scope) {
    return scope == SearchScope::SUBTREE ? LDAP_SCOPE_SUBTREE : LDAP_SCOPE_ONELEVEL;
}

std::string diagnostic_message(LDAP* ld) {
    if (!ld) return {};
    char* msg = nullptr;
    if (ldap_get_option(ld, LDAP_OPT_DIAGNOSTIC_MESSAGE, &msg) != LDAP_OPT_SUCCESS || !msg) {
        return {};
    }
    std::string result(msg);
    ldap_memfree(msg);
    return result;
}

std::string describe(LDAP* ld, int rc) {
    const std::string diag = diagnostic_message(ld);
    if (diag.empty()) return ldap_err2string(rc);
    return std::format("{} ({})", ldap_err2string(rc), diag);
}

/// Result codes meaning the server could not be reached or did not answer in time.
bool is_transport_error(int rc) {
    return rc == LDAP_SERVER_DOWN || rc == LDAP_CONNECT_ERROR || rc == LDAP_TIMEOUT ||
           rc == LDAP_TIMELIMIT_EXCEEDED || rc == LDAP_UNAVAILABLE || rc == LDAP_BUSY;
}

// ============================================================================
// LdapSession
// ============================================================================

class LdapSession : public IDirectorySession {
public:
    LdapSession(LDAP* ld, DirectoryServerOptions options)
        : ld_(ld), options_(std::move(options)) {}

    ~LdapSession() override { unbind(); }

    LdapSession(const LdapSession&) = delete;
    LdapSession& operator=(const LdapSession&) = delete;

    [[nodiscard]] Result<SearchResult> search(
        const std::string& base_dn,
        const std::string& filter,
        SearchScope scope,
        const std::vector<std::string>& attributes) override;

    void unbind() override {
        std::lock_guard lock(mutex_);
        unbind_locked();
    }

    [[nodiscard]] bool is_bound() const override {
        std::lock_guard lock(mutex_);
        return ld_ != nullptr;
    }

private:
    void unbind_locked() {
        if (ld_) {
            ldap_unbind_ext_s(ld_, nullptr, nullptr);
            ld_ = nullptr;
        }
    }

    /// Decode one entry. Returns false when the BER attribute data is corrupt.
    bool read_entry(LDAPMessage* msg, DirectoryEntry& entry);

    mutable std::mutex mutex_;
    LDAP* ld_;
    DirectoryServerOptions options_;
};

bool LdapSession::read_entry(LDAPMessage* msg, DirectoryEntry& entry) {
    if (char* dn = ldap_get_dn(ld_, msg)) {
        entry.dn = std::string(dn);
        ldap_memfree(dn);
    }

    int rc = LDAP_SUCCESS;
    ldap_set_option(ld_, LDAP_OPT_RESULT_CODE, &rc);

    BerElement* ber = nullptr;
    for (char* attr = ldap_first_attribute(ld_, msg, &ber); attr != nullptr;
         attr = ldap_next_attribute(ld_, msg, ber)) {
        auto& values = entry.attributes[attr];
        if (berval** vals = ldap_get_values_len(ld_, msg, attr)) {
            for (int i = 0; vals[i] != nullptr; ++i) {
                values.emplace_back(vals[i]->bv_val, vals[i]->bv_len);
            }
            ldap_value_free_len(vals);
        }
        ldap_memfree(attr);
    }
    if (ber) ber_free(ber, 0);

    ldap_get_option(ld_, LDAP_OPT_RESULT_CODE, &rc);
    return rc != LDAP_DECODING_ERROR;
}

Result<SearchResult> LdapSession::search(
    const std::string& base_dn,
    const std::string& filter,
    SearchScope scope,
    const std::vector<std::string>& attributes) {

    std::lock_guard lock(mutex_);
    if (!ld_) {
        return Result<SearchResult>::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
                                           "LDAP session is not bound");
    }

    std::vector<char*> attr_ptrs;
    attr_ptrs.reserve(attributes.size() + 1);
    for (const auto& attr : attributes) {
        attr_ptrs.push_back(const_cast<char*>(attr.c_str()));
    }
    attr_ptrs.push_back(nullptr);

    timeval timeout = to_timeval(options_.timeout);
    LDAPMessage* raw = nullptr;
    const int rc = ldap_search_ext_s(ld_, base_dn.c_str(), to_ldap_scope(scope),
                                     filter.c_str(),
                                     attributes.empty() ? nullptr : attr_ptrs.data(),
                                     0, nullptr, nullptr, &timeout, LDAP_NO_LIMIT, &raw);
    std::unique_ptr<LDAPMessage, int (*)(LDAPMessage*)> response(raw, ldap_msgfree);

    if (is_transport_error(rc)) {
        const auto detail = describe(ld_, rc);
        if (rc == LDAP_SERVER_DOWN || rc == LDAP_CONNECT_ERROR) {
            // Dead connection: let the cache rebuild it on next use
            unbind_locked();
        }
        return Result<SearchResult>::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
            std::format("LDAP search failed: {}", detail));
    }

    SearchResult result;
    result.succeeded = (rc == LDAP_SUCCESS);
    if (!result.succeeded) {
        result.diagnostic = describe(ld_, rc);
    }

    if (!response) {
        return Result<SearchResult>::ok(std::move(result));
    }

    for (LDAPMessage* msg = ldap_first_entry(ld_, response.get()); msg != nullptr;
         msg = ldap_next_entry(ld_, msg)) {
        DirectoryEntry entry;
        if (!read_entry(msg, entry)) {
            const auto where = entry.dn.value_or("<no dn>");
            if (!options_.ignore_malformed_schema) {
                return Result<SearchResult>::error(AuthErrorCode::MALFORMED_DIRECTORY_RESPONSE,
                    std::format("Could not decode attributes of entry {}", where));
            }
            utils::log::warn(std::format("Skipping undecodable LDAP entry {}", where));
            continue;
        }
        result.entries.push_back(std::move(entry));
    }

    return Result<SearchResult>::ok(std::move(result));
}

} // anonymous namespace

// ============================================================================
// LdapDirectoryConnector
// ============================================================================

Result<std::shared_ptr<IDirectorySession>> LdapDirectoryConnector::open(
    const DirectoryServerOptions& server,
    const std::string& dn,
    const std::string& credential) {

    using OpenResult = Result<std::shared_ptr<IDirectorySession>>;

    // An empty password is an unauthenticated bind, which servers accept
    if (credential.empty()) {
        return OpenResult::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
                                 "Refusing simple bind with an empty credential");
    }
    if (!server.start_tls && utils::starts_with_icase(server.uri, "ldap://")) {
        return OpenResult::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
            std::format("Refusing cleartext simple bind to {}: use ldaps:// or StartTLS",
                        server.uri));
    }

    LDAP* ld = nullptr;
    int rc = ldap_initialize(&ld, server.uri.c_str());
    if (rc != LDAP_SUCCESS) {
        return OpenResult::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
            std::format("Failed to initialize LDAP session to {}: {}",
                        server.uri, ldap_err2string(rc)));
    }

    auto fail = [&ld](const std::string& what, int code) {
        const auto detail = describe(ld, code);
        ldap_unbind_ext_s(ld, nullptr, nullptr);
        return OpenResult::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
                                 std::format("{}: {}", what, detail));
    };

    const int version = LDAP_VERSION3;
    rc = ldap_set_option(ld, LDAP_OPT_PROTOCOL_VERSION, &version);
    if (rc != LDAP_OPT_SUCCESS) return fail("Failed to select LDAPv3", rc);

    const timeval timeout = to_timeval(server.timeout);
    rc = ldap_set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &timeout);
    if (rc != LDAP_OPT_SUCCESS) return fail("Failed to set network timeout", rc);
    rc = ldap_set_option(ld, LDAP_OPT_TIMEOUT, &timeout);
    if (rc != LDAP_OPT_SUCCESS) return fail("Failed to set operation timeout", rc);

    rc = ldap_set_option(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);
    if (rc != LDAP_OPT_SUCCESS) return fail("Failed to disable referral chasing", rc);

    const int require_cert = LDAP_OPT_X_TLS_DEMAND;
    rc = ldap_set_option(ld, LDAP_OPT_X_TLS_REQUIRE_CERT, &require_cert);
    if (rc != LDAP_OPT_SUCCESS) return fail("Failed to require TLS certificate", rc);

    if (server.ca_cert_file) {
        rc = ldap_set_option(ld, LDAP_OPT_X_TLS_CACERTFILE, server.ca_cert_file->c_str());
        if (rc != LDAP_OPT_SUCCESS) return fail("Failed to set CA certificate file", rc);
    }

    // Per-handle TLS options only apply to a fresh context
    const int is_server = 0;
    rc = ldap_set_option(ld, LDAP_OPT_X_TLS_NEWCTX, &is_server);
    if (rc != LDAP_OPT_SUCCESS) return fail("Failed to create TLS context", rc);

    if (server.start_tls) {
        rc = ldap_start_tls_s(ld, nullptr, nullptr);
        if (rc != LDAP_SUCCESS) return fail("StartTLS failed", rc);
    }

    berval cred;
    cred.bv_val = const_cast<char*>(credential.data());
    cred.bv_len = credential.size();

    rc = ldap_sasl_bind_s(ld, dn.c_str(), LDAP_SASL_SIMPLE, &cred,
                          nullptr, nullptr, nullptr);
    if (rc != LDAP_SUCCESS) return fail("Bind failed", rc);

    return OpenResult::ok(std::make_shared<LdapSession>(ld, server));
}

} // namespace ldapauth
