#include "auth/authenticator.hpp"
#include "core/utils.hpp"
#include "directory/directory_client.hpp"
#include "directory/dn_parser.hpp"
#include "directory/search_filter.hpp"

#include <format>

namespace ldapauth {

namespace {

// RFC 4511 "no attributes": only the DN is needed from the user search
const std::vector<std::string> kNoAttributes = {"1.1"};

} // anonymous namespace

Authenticator::Authenticator(const LdapConfig& config, ConnectionCache& connections)
    : config_(config), connections_(connections) {}

Result<Authenticated> Authenticator::try_login(const std::string& username,
                                               const std::string& password) {
    using LoginResult = Result<Authenticated>;

    LoginState state = LoginState::START;
    auto transition = [&](LoginState next) {
        utils::log::debug(std::format("Login {}: {} -> {}",
                                      username, login_state_name(state), login_state_name(next)));
        state = next;
    };
    auto fail = [&](AuthError error) {
        transition(LoginState::FAILED);
        return LoginResult::error(std::move(error));
    };

    for (const auto key : {"bind_user", "bind_password", "basedn", "user_filter", "user_name_attr"}) {
        if (auto required = config_.require(key); required.is_error()) {
            return fail(required.error());
        }
    }
    const auto& basedn = *config_.basedn;
    const auto& user_name_attr = *config_.user_name_attr;

    // START -> SERVICE_BOUND
    RebindingSession service(connections_, *config_.bind_user, *config_.bind_password);
    if (auto bound = service.acquire(); bound.is_error()) {
        return fail({AuthErrorCode::DIRECTORY_UNREACHABLE,
                     "Cannot bind to ldap server with the service account", {}});
    }
    transition(LoginState::SERVICE_BOUND);

    // SERVICE_BOUND -> USER_DN_FOUND
    const auto search_filter = filter::conjunction(
        {*config_.user_filter, filter::equality(user_name_attr, username)});
    const auto scope = config_.subtree_search() ? SearchScope::SUBTREE : SearchScope::ONE_LEVEL;

    auto searched = service.search(basedn, search_filter, scope, kNoAttributes);
    if (searched.is_error()) {
        return fail(searched.error());
    }

    const auto& result = searched.value();
    if (!result.succeeded || result.entries.empty()) {
        utils::log::info(std::format("Cannot find user {}", username));
        return fail(AuthError::invalid_credentials());
    }

    const auto user_dn = result.entries.front().dn;

    // The service binding is never reused for the user step
    service.release();
    utils::log::debug(std::format("Released service binding for {} after user search",
                                  service.bound_dn()));

    if (!user_dn || user_dn->empty()) {
        // Entry without a DN: treated like an unknown user
        utils::log::info(std::format("Search for user {} returned an entry without a DN", username));
        return fail(AuthError::invalid_credentials());
    }
    transition(LoginState::USER_DN_FOUND);

    // USER_DN_FOUND -> USER_BOUND
    if (!dn::parse(*user_dn)) {
        utils::log::error(std::format(
            "Unable to parse LDAP structure: user entry DN '{}' is not a valid distinguished "
            "name. If you're using Active Directory and not specifying an OU, you must set "
            "search_scope = \"SUBTREE\" in the [ldap] section.", *user_dn));
        return fail({AuthErrorCode::MALFORMED_DIRECTORY_RESPONSE,
                     "Could not parse LDAP structure. Try setting search_scope in the [ldap] "
                     "configuration section, or check logs", {}});
    }

    auto user_binding = connections_.get_connection(*user_dn, password);
    if (user_binding.is_error()) {
        utils::log::info(std::format("Password incorrect for user {}", username));
        return fail(AuthError::invalid_credentials());
    }
    transition(LoginState::USER_BOUND);

    return LoginResult::ok(Authenticated{username, *user_dn});
}

} // namespace ldapauth
