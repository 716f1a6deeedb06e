#include <catch2/catch_test_macros.hpp>
#include "directory/dn_parser.hpp"

using namespace ldapauth;

TEST_CASE("DN parser: simple DN", "[dn]") {
    auto parsed = dn::parse("uid=bob,dc=example,dc=com");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 3);
    CHECK((*parsed)[0].type == "uid");
    CHECK((*parsed)[0].value == "bob");
    CHECK((*parsed)[2].value == "com");
}

TEST_CASE("DN parser: escaped comma stays in the value", "[dn]") {
    auto parsed = dn::parse("cn=Smith\\, John,ou=People,dc=example,dc=com");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 4);
    CHECK((*parsed)[0].value == "Smith, John");
    CHECK((*parsed)[1].type == "ou");
}

TEST_CASE("DN parser: hex escapes and backslash", "[dn]") {
    auto parsed = dn::parse("cn=a\\2cb\\5cc,dc=x");
    REQUIRE(parsed.has_value());
    CHECK((*parsed)[0].value == "a,b\\c");
}

TEST_CASE("DN parser: whitespace around separators is ignored", "[dn]") {
    auto parsed = dn::parse(" cn = Admins , ou=Groups ");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 2);
    CHECK((*parsed)[0].type == "cn");
    CHECK((*parsed)[0].value == "Admins");
    CHECK((*parsed)[1].value == "Groups");
}

TEST_CASE("DN parser: quoted value and multi-valued RDN", "[dn]") {
    auto quoted = dn::parse("cn=\"Doe, Jane\",dc=x");
    REQUIRE(quoted.has_value());
    CHECK((*quoted)[0].value == "Doe, Jane");

    auto multi = dn::parse("cn=Ops+uid=ops,dc=x");
    REQUIRE(multi.has_value());
    REQUIRE(multi->size() == 3);
    CHECK((*multi)[1].type == "uid");
}

TEST_CASE("DN parser: malformed input", "[dn]") {
    CHECK_FALSE(dn::parse("").has_value());
    CHECK_FALSE(dn::parse("   ").has_value());
    CHECK_FALSE(dn::parse("Admins").has_value());
    CHECK_FALSE(dn::parse("=value,dc=x").has_value());
    CHECK_FALSE(dn::parse("cn=Admins,").has_value());
    CHECK_FALSE(dn::parse("cn=trailing\\").has_value());
    CHECK_FALSE(dn::parse("cn=\"unterminated").has_value());
}

TEST_CASE("extract_cn: first cn component", "[dn]") {
    auto cn = dn::extract_cn("cn=Admins,ou=Groups,dc=example,dc=com");
    REQUIRE(cn.has_value());
    CHECK(*cn == "Admins");
}

TEST_CASE("extract_cn: type is case-insensitive", "[dn]") {
    auto cn = dn::extract_cn("CN=Domain Users,CN=Users,DC=corp,DC=local");
    REQUIRE(cn.has_value());
    CHECK(*cn == "Domain Users");
}

TEST_CASE("extract_cn: escaped comma inside the cn", "[dn]") {
    auto cn = dn::extract_cn("cn=Sales\\, EMEA,ou=Groups,dc=example,dc=com");
    REQUIRE(cn.has_value());
    CHECK(*cn == "Sales, EMEA");
}

TEST_CASE("extract_cn: no cn component or malformed", "[dn]") {
    CHECK_FALSE(dn::extract_cn("ou=Groups,dc=example,dc=com").has_value());
    CHECK_FALSE(dn::extract_cn("Admins").has_value());
}
