#include <catch2/catch_test_macros.hpp>
#include "auth/group_membership.hpp"
#include "mocks/mock_directory.hpp"

using namespace ldapauth;
using namespace ldapauth::testing;

namespace {

constexpr const char* kBase = "dc=example,dc=com";
constexpr const char* kServiceDn = "cn=svc,dc=example,dc=com";

struct Fixture {
    std::shared_ptr<MockDirectoryConnector> connector = std::make_shared<MockDirectoryConnector>();
    ConnectionCache connections{connector, DirectoryServerOptions{.uri = "ldap://localhost"}};
    GroupMembership membership;
    RebindingSession service{connections, kServiceDn, "svcpw"};

    Fixture() {
        connector->add_account(kServiceDn, "svcpw");
    }
};

} // anonymous namespace

// ============================================================================
// group_contains_user
// ============================================================================

TEST_CASE("GroupMembership: user listed in group", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(cn=admins))", found({
        make_entry("cn=admins,ou=Groups,dc=example,dc=com", {{"memberUid", {"carol", "bob"}}}),
    }));

    auto result = f.membership.group_contains_user(f.service,
        {kBase, "(cn=admins)", "memberUid", "bob"});
    REQUIRE(result.is_ok());
    CHECK(result.value());

    auto searches = f.connector->searches();
    REQUIRE(searches.size() == 1);
    CHECK(searches[0].scope == SearchScope::SUBTREE);
    CHECK(searches[0].attributes == std::vector<std::string>{"memberUid"});
}

TEST_CASE("GroupMembership: membership check ignores case", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(cn=admins))", found({
        make_entry("cn=admins,ou=Groups,dc=example,dc=com", {{"memberUid", {"alice"}}}),
    }));

    auto result = f.membership.group_contains_user(f.service,
        {kBase, "cn=admins", "memberUid", "Alice"});
    REQUIRE(result.is_ok());
    CHECK(result.value());
}

TEST_CASE("GroupMembership: user not in group", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(cn=admins))", found({
        make_entry("cn=admins,ou=Groups,dc=example,dc=com", {{"memberUid", {"carol"}}}),
    }));

    auto result = f.membership.group_contains_user(f.service,
        {kBase, "(cn=admins)", "memberUid", "bob"});
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value());
}

TEST_CASE("GroupMembership: no group found or attribute absent is false", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(cn=nobody))", found({}));
    f.connector->set_result(kBase, "(&(cn=empty))", found({
        make_entry("cn=empty,ou=Groups,dc=example,dc=com", {{"description", {"no members"}}}),
    }));
    f.connector->set_result(kBase, "(&(cn=broken))", failed_search("Bad search filter"));

    for (const char* group : {"(cn=nobody)", "(cn=empty)", "(cn=broken)"}) {
        auto result = f.membership.group_contains_user(f.service,
            {kBase, group, "memberUid", "bob"});
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value());
    }
}

TEST_CASE("GroupMembership: identical lookups search once", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(cn=admins))", found({
        make_entry("cn=admins,ou=Groups,dc=example,dc=com", {{"memberUid", {"bob"}}}),
    }));
    const GroupFilterQuery query{kBase, "(cn=admins)", "memberUid", "bob"};

    auto first = f.membership.group_contains_user(f.service, query);
    auto second = f.membership.group_contains_user(f.service, query);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value() == second.value());
    CHECK(f.connector->search_count() == 1);

    // A different username is a different key
    (void)f.membership.group_contains_user(f.service, {kBase, "(cn=admins)", "memberUid", "eve"});
    CHECK(f.connector->search_count() == 2);

    f.membership.clear();
    (void)f.membership.group_contains_user(f.service, query);
    CHECK(f.connector->search_count() == 3);
}

TEST_CASE("GroupMembership: transport failure propagates and is not cached", "[membership]") {
    Fixture f;
    f.connector->set_search_transport_failure(true);
    const GroupFilterQuery query{kBase, "(cn=admins)", "memberUid", "bob"};

    auto result = f.membership.group_contains_user(f.service, query);
    CHECK(result.error_code() == AuthErrorCode::DIRECTORY_UNREACHABLE);

    f.connector->set_search_transport_failure(false);
    f.connector->set_result(kBase, "(&(cn=admins))", found({
        make_entry("cn=admins,ou=Groups,dc=example,dc=com", {{"memberUid", {"bob"}}}),
    }));
    auto retry = f.membership.group_contains_user(f.service, query);
    REQUIRE(retry.is_ok());
    CHECK(retry.value());
}

TEST_CASE("GroupMembership: cached lookups do not bind", "[membership]") {
    Fixture f;
    const GroupFilterQuery query{kBase, "(cn=admins)", "memberUid", "bob"};

    REQUIRE(f.membership.group_contains_user(f.service, query).is_ok());
    CHECK(f.connector->open_count() == 1);

    RebindingSession other{f.connections, kServiceDn, "svcpw"};
    REQUIRE(f.membership.group_contains_user(other, query).is_ok());
    CHECK(f.connector->open_count() == 1);
    CHECK(f.connector->search_count() == 1);
}

TEST_CASE("GroupMembership: connection closed by the server is rebound once", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(cn=admins))", found({
        make_entry("cn=admins,ou=Groups,dc=example,dc=com", {{"memberUid", {"bob"}}}),
    }));

    // Left in the cache by an earlier request, then dropped by the server
    REQUIRE(f.connections.get_connection(kServiceDn, "svcpw").is_ok());
    f.connector->drop_connections(1);

    auto result = f.membership.group_contains_user(f.service,
        {kBase, "(cn=admins)", "memberUid", "bob"});
    REQUIRE(result.is_ok());
    CHECK(result.value());
    CHECK(f.connector->open_count() == 2);
    CHECK(f.connector->search_count() == 2);
}

TEST_CASE("GroupMembership: rebind is attempted only once", "[membership]") {
    Fixture f;
    f.connector->drop_connections(2);

    auto result = f.membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "bob"});
    CHECK(result.error_code() == AuthErrorCode::DIRECTORY_UNREACHABLE);
    CHECK(f.connector->open_count() == 2);
    CHECK(f.connector->search_count() == 2);
}

// ============================================================================
// groups_for_user
// ============================================================================

TEST_CASE("GroupMembership: groups are the CNs of memberOf values", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(objectClass=person)(uid=bob))", found({
        make_entry("uid=bob,dc=example,dc=com", {{"memberOf", {
            "cn=Admins,ou=Groups,dc=example,dc=com",
            "CN=Analysts,OU=Groups,DC=example,DC=com",
        }}}),
    }));

    auto result = f.membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "bob"});
    REQUIRE(result.is_ok());
    const std::vector<std::string> expected = {"Admins", "Analysts"};
    CHECK(result.value() == expected);

    auto searches = f.connector->searches();
    REQUIRE(searches.size() == 1);
    CHECK(searches[0].attributes == std::vector<std::string>{"memberOf"});
}

TEST_CASE("GroupMembership: malformed memberOf values are skipped", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(objectClass=person)(uid=bob))", found({
        make_entry("uid=bob,dc=example,dc=com", {{"memberOf", {
            "Admins",
            "cn=Sales\\, EMEA,ou=Groups,dc=example,dc=com",
            "ou=NoCn,dc=example,dc=com",
            "cn=Ops,ou=Groups,dc=example,dc=com",
        }}}),
    }));

    auto result = f.membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "bob"});
    REQUIRE(result.is_ok());
    const std::vector<std::string> expected = {"Sales, EMEA", "Ops"};
    CHECK(result.value() == expected);
}

TEST_CASE("GroupMembership: missing memberOf gives no groups", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(objectClass=person)(uid=bob))", found({
        make_entry("uid=bob,dc=example,dc=com", {{"cn", {"Bob"}}}),
    }));

    auto result = f.membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "bob"});
    REQUIRE(result.is_ok());
    CHECK(result.value().empty());
}

TEST_CASE("GroupMembership: unknown user is INVALID_CREDENTIALS", "[membership]") {
    Fixture f;
    f.connector->set_result(kBase, "(&(objectClass=person)(uid=ghost))", failed_search());

    auto failed = f.membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "ghost"});
    CHECK(failed.error_code() == AuthErrorCode::INVALID_CREDENTIALS);

    auto empty = f.membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "nobody"});
    CHECK(empty.error_code() == AuthErrorCode::INVALID_CREDENTIALS);
}

TEST_CASE("GroupMembership: configurable member attribute", "[membership]") {
    Fixture f;
    GroupMembership::Config cfg;
    cfg.member_attribute = "isMemberOf";
    GroupMembership membership(cfg);

    f.connector->set_result(kBase, "(&(objectClass=person)(uid=bob))", found({
        make_entry("uid=bob,dc=example,dc=com", {{"ismemberof", {"cn=Admins,dc=example,dc=com"}}}),
    }));

    auto result = membership.groups_for_user(f.service,
        {kBase, "(objectClass=person)", "uid", "bob"});
    REQUIRE(result.is_ok());
    CHECK(result.value() == std::vector<std::string>{"Admins"});
}
