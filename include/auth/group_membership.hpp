#pragma once

#include "cache/timed_cache.hpp"
#include "core/error.hpp"
#include "directory/directory_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace ldapauth {

/**
 * @brief Parameters of one membership lookup
 *
 * Together with the session's server and DN this is the cache key, so
 * identical lookups hit the directory once per TTL.
 */
struct GroupFilterQuery {
    std::string base_dn;
    std::string filter;
    std::string user_attribute;
    std::string username;
};

/**
 * @brief Answers "is user in group X" and "which groups is user in"
 *
 * Both lookups search the subtree below base_dn and are cached
 * independently. The session is only bound on a cache miss.
 */
class GroupMembership {
public:
    struct Config {
        std::chrono::seconds ttl{86400};
        size_t max_entries = 10000;
        size_t num_shards = 16;
        std::string member_attribute = "memberOf";
    };

    GroupMembership() : GroupMembership(Config{}) {}
    explicit GroupMembership(const Config& config);

    /**
     * @brief Search (&(<filter>)) and look for username among the values of
     *        query.user_attribute, ignoring case
     * @return false (with a warning) when nothing matched or the attribute is
     *         absent; DIRECTORY_UNREACHABLE when the search still fails
     *         after one rebind
     */
    [[nodiscard]] Result<bool> group_contains_user(RebindingSession& session,
                                                   const GroupFilterQuery& query);

    /**
     * @brief CNs of the groups listed in the user's member attribute
     *
     * Searches (&(<filter>)(<user_attribute>=<username>)). Values that are
     * not DNs with a cn component are skipped with a warning.
     *
     * @return INVALID_CREDENTIALS when the user cannot be found; an empty
     *         list when the member attribute is missing
     */
    [[nodiscard]] Result<std::vector<std::string>> groups_for_user(
        RebindingSession& session,
        const GroupFilterQuery& query);

    void clear();

    [[nodiscard]] const std::string& member_attribute() const { return config_.member_attribute; }

private:
    static std::string make_key(const RebindingSession& session, const GroupFilterQuery& query);

    Result<bool> lookup_contains(RebindingSession& session, const GroupFilterQuery& query);
    Result<std::vector<std::string>> lookup_groups(RebindingSession& session,
                                                   const GroupFilterQuery& query);

    Config config_;
    TimedCache<std::string, bool> contains_cache_;
    TimedCache<std::string, std::vector<std::string>> groups_cache_;
};

} // namespace ldapauth
