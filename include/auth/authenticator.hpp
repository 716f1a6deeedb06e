#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "directory/connection_cache.hpp"

#include <string>

namespace ldapauth {

/**
 * @brief Proof that a username/password pair was accepted by the directory
 *
 * Deliberately carries no session: the user-bound connection never leaves
 * the authenticator.
 */
struct Authenticated {
    std::string username;
    std::string dn;
};

enum class LoginState {
    START,
    SERVICE_BOUND,
    USER_DN_FOUND,
    USER_BOUND,
    FAILED
};

[[nodiscard]] inline constexpr const char* login_state_name(LoginState state) {
    switch (state) {
        case LoginState::START:         return "START";
        case LoginState::SERVICE_BOUND: return "SERVICE_BOUND";
        case LoginState::USER_DN_FOUND: return "USER_DN_FOUND";
        case LoginState::USER_BOUND:    return "USER_BOUND";
        case LoginState::FAILED:        return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Bind as service account, find the user's DN, rebind as the user
 *
 * Steps run strictly in order; any failure ends the attempt:
 *  1. service bind fails           -> DIRECTORY_UNREACHABLE
 *  2. user search fails or is empty,
 *     or the entry has no DN       -> INVALID_CREDENTIALS
 *  3. DN cannot be parsed          -> MALFORMED_DIRECTORY_RESPONSE
 *     user bind fails              -> INVALID_CREDENTIALS
 *
 * The service binding is released once the DN is known so it is never
 * reused for the user step.
 */
class Authenticator {
public:
    Authenticator(const LdapConfig& config, ConnectionCache& connections);

    [[nodiscard]] Result<Authenticated> try_login(const std::string& username,
                                                  const std::string& password);

private:
    const LdapConfig& config_;
    ConnectionCache& connections_;
};

} // namespace ldapauth
