#include "directory/directory_client.hpp"
#include "core/utils.hpp"

#include <format>

namespace ldapauth {

const std::vector<std::string>* DirectoryEntry::find_attribute(const std::string& name) const {
    if (const auto it = attributes.find(name); it != attributes.end()) {
        return &it->second;
    }
    for (const auto& [attr, values] : attributes) {
        if (utils::iequals(attr, name)) return &values;
    }
    return nullptr;
}

Result<SearchResult> DirectoryClient::search(
    const DirectoryBinding& binding,
    const std::string& base_dn,
    const std::string& filter,
    SearchScope scope,
    const std::vector<std::string>& attributes) {

    if (!binding.is_bound()) {
        return Result<SearchResult>::error(AuthErrorCode::DIRECTORY_UNREACHABLE,
            std::format("Binding #{} is no longer bound", binding.id));
    }

    utils::Timer timer;
    auto result = binding.session->search(base_dn, filter, scope, attributes);

    if (result.is_error()) {
        utils::log::error(std::format("LDAP search on {} with {} failed: {}",
                                      base_dn, filter, result.error_message()));
        return result;
    }

    const auto& sr = result.value();
    utils::log::debug(std::format(
        "LDAP search base={} filter={} scope={} -> {} ({} entries) in {}ms",
        base_dn, filter, scope_name(scope),
        sr.succeeded ? "ok" : "failed", sr.entries.size(),
        timer.elapsed_ms().count()));
    if (!sr.succeeded && !sr.diagnostic.empty()) {
        utils::log::warn(std::format("LDAP search on {} reported: {}", base_dn, sr.diagnostic));
    }
    return result;
}

void DirectoryClient::unbind(const DirectoryBinding& binding) {
    if (binding.session) {
        binding.session->unbind();
    }
}

// ============================================================================
// RebindingSession
// ============================================================================

RebindingSession::RebindingSession(ConnectionCache& connections,
                                   std::string dn,
                                   std::string credential)
    : connections_(connections), dn_(std::move(dn)), credential_(std::move(credential)) {}

Result<BindingPtr> RebindingSession::acquire() {
    if (binding_) return Result<BindingPtr>::ok(binding_);

    auto result = connections_.get_connection(dn_, credential_);
    if (result.is_ok()) binding_ = result.value();
    return result;
}

Result<SearchResult> RebindingSession::search(
    const std::string& base_dn,
    const std::string& filter,
    SearchScope scope,
    const std::vector<std::string>& attributes) {

    auto acquired = acquire();
    if (acquired.is_error()) return Result<SearchResult>::forward(acquired);

    auto result = DirectoryClient::search(*acquired.value(), base_dn, filter, scope, attributes);
    if (result.is_ok() || result.error_code() != AuthErrorCode::DIRECTORY_UNREACHABLE) {
        return result;
    }

    utils::log::warn(std::format("Binding #{} for {} lost its connection, rebinding once",
                                 acquired.value()->id, dn_));
    release();

    auto rebound = acquire();
    if (rebound.is_error()) return Result<SearchResult>::forward(rebound);
    return DirectoryClient::search(*rebound.value(), base_dn, filter, scope, attributes);
}

void RebindingSession::release() {
    if (!binding_) return;
    connections_.release(*binding_);
    binding_.reset();
}

} // namespace ldapauth
