#include "auth/group_membership.hpp"
#include "core/utils.hpp"
#include "directory/directory_client.hpp"
#include "directory/dn_parser.hpp"
#include "directory/search_filter.hpp"

#include <format>

namespace ldapauth {

namespace {

template<typename V>
typename TimedCache<std::string, V>::Config cache_config(const GroupMembership::Config& config) {
    typename TimedCache<std::string, V>::Config cfg;
    cfg.max_entries = config.max_entries;
    cfg.num_shards = config.num_shards;
    cfg.default_ttl = config.ttl;
    return cfg;
}

} // anonymous namespace

GroupMembership::GroupMembership(const Config& config)
    : config_(config),
      contains_cache_(cache_config<bool>(config)),
      groups_cache_(cache_config<std::vector<std::string>>(config)) {}

std::string GroupMembership::make_key(const RebindingSession& session,
                                      const GroupFilterQuery& query) {
    // Connection identity is where and as whom it is bound, not the binding
    // instance: service bindings are rebuilt after every user search.
    return std::format("{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}",
                       session.server_uri(), session.bound_dn(), query.base_dn, query.filter,
                       query.user_attribute, query.username);
}

// ============================================================================
// group_contains_user
// ============================================================================

Result<bool> GroupMembership::group_contains_user(RebindingSession& session,
                                                  const GroupFilterQuery& query) {
    return contains_cache_.get_or_compute(make_key(session, query), config_.ttl,
        [&] { return lookup_contains(session, query); });
}

Result<bool> GroupMembership::lookup_contains(RebindingSession& session,
                                              const GroupFilterQuery& query) {
    const auto search_filter = filter::conjunction({query.filter});

    auto searched = session.search(query.base_dn, search_filter, SearchScope::SUBTREE,
                                   {query.user_attribute});
    if (searched.is_error()) {
        return Result<bool>::forward(searched);
    }

    const auto& result = searched.value();
    if (!result.succeeded || result.entries.empty()) {
        utils::log::warn(std::format("Unable to find group for {} {}",
                                     query.base_dn, search_filter));
        return Result<bool>::ok(false);
    }

    bool attribute_seen = false;
    for (const auto& entry : result.entries) {
        const auto* values = entry.find_attribute(query.user_attribute);
        if (!values) continue;
        attribute_seen = true;
        for (const auto& value : *values) {
            if (utils::iequals(value, query.username)) {
                return Result<bool>::ok(true);
            }
        }
    }

    if (!attribute_seen) {
        utils::log::warn(std::format("Group entries under {} matching {} carry no '{}' attribute",
                                     query.base_dn, search_filter, query.user_attribute));
    }
    return Result<bool>::ok(false);
}

// ============================================================================
// groups_for_user
// ============================================================================

Result<std::vector<std::string>> GroupMembership::groups_for_user(
    RebindingSession& session,
    const GroupFilterQuery& query) {
    return groups_cache_.get_or_compute(make_key(session, query), config_.ttl,
        [&] { return lookup_groups(session, query); });
}

Result<std::vector<std::string>> GroupMembership::lookup_groups(
    RebindingSession& session,
    const GroupFilterQuery& query) {
    using GroupsResult = Result<std::vector<std::string>>;

    const auto search_filter = filter::conjunction(
        {query.filter, filter::equality(query.user_attribute, query.username)});

    auto searched = session.search(query.base_dn, search_filter, SearchScope::SUBTREE,
                                   {config_.member_attribute});
    if (searched.is_error()) {
        return GroupsResult::forward(searched);
    }

    const auto& result = searched.value();
    if (!result.succeeded || result.entries.empty()) {
        utils::log::info(std::format("Cannot find user {}", query.username));
        return GroupsResult::error(AuthError::invalid_credentials());
    }

    const auto* member_of = result.entries.front().find_attribute(config_.member_attribute);
    if (!member_of) {
        utils::log::warn(std::format(
            "Missing attribute \"{}\" when looked-up in the LDAP database. "
            "User {} does not seem to be a member of any group, so features "
            "gated on group membership will be unavailable to them",
            config_.member_attribute, query.username));
        return GroupsResult::ok({});
    }

    std::vector<std::string> groups;
    groups.reserve(member_of->size());
    for (const auto& value : *member_of) {
        if (auto cn = dn::extract_cn(value)) {
            groups.push_back(std::move(*cn));
        } else {
            utils::log::warn(std::format(
                "Skipping group value '{}' of user {}: not a DN with a cn component",
                value, query.username));
        }
    }
    return GroupsResult::ok(std::move(groups));
}

void GroupMembership::clear() {
    contains_cache_.clear();
    groups_cache_.clear();
}

} // namespace ldapauth
