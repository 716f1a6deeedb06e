#include <catch2/catch_test_macros.hpp>
#include "auth/auth_service.hpp"
#include "auth/memory_user_store.hpp"
#include "mocks/mock_directory.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

using namespace ldapauth;
using namespace ldapauth::testing;

namespace {

constexpr const char* kBase = "dc=example,dc=com";
constexpr const char* kServiceDn = "cn=svc,dc=example,dc=com";
constexpr const char* kBobDn = "uid=bob,dc=example,dc=com";

class RecordingMetricsSink : public IMetricsSink {
public:
    void incr(std::string_view stat, long value, const std::vector<std::string>& tags) override {
        std::lock_guard lock(mutex_);
        for (const auto& tag : tags) {
            counters_.push_back(std::string(stat) + "|" + tag + "|" + std::to_string(value));
        }
    }

    void gauge(std::string_view, double, const std::vector<std::string>&) override {}

    [[nodiscard]] size_t count(const std::string& entry) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count(counters_.begin(), counters_.end(), entry));
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> counters_;
};

AuthConfig test_config() {
    AuthConfig cfg;
    cfg.ldap.uri = "ldaps://ldap.example.com";
    cfg.ldap.bind_user = kServiceDn;
    cfg.ldap.bind_password = "svcpw";
    cfg.ldap.basedn = kBase;
    cfg.ldap.user_filter = "(objectClass=person)";
    cfg.ldap.user_name_attr = "uid";
    cfg.ldap.superuser_filter = "(memberOf=cn=admins,ou=Groups,dc=example,dc=com)";
    return cfg;
}

std::shared_ptr<MockDirectoryConnector> bob_directory() {
    auto connector = std::make_shared<MockDirectoryConnector>();
    connector->add_account(kServiceDn, "svcpw");
    connector->add_account(kBobDn, "correct");
    connector->set_result(kBase, "(&(objectClass=person)(uid=bob))", found({
        make_entry(kBobDn, {{"memberOf", {"cn=Analysts,ou=Groups,dc=example,dc=com"}}}),
    }));
    connector->set_result(kBase, "(&(memberOf=cn=admins,ou=Groups,dc=example,dc=com))", found({
        make_entry("uid=alice,dc=example,dc=com", {{"uid", {"alice"}}}),
    }));
    return connector;
}

struct Fixture {
    std::shared_ptr<MockDirectoryConnector> connector = bob_directory();
    std::shared_ptr<MemoryUserStore> users = std::make_shared<MemoryUserStore>();
    std::shared_ptr<RecordingMetricsSink> metrics = std::make_shared<RecordingMetricsSink>();
    std::unique_ptr<AuthService> service;

    explicit Fixture(AuthConfig config = test_config()) {
        auto created = AuthService::create(std::move(config), connector, users, metrics);
        REQUIRE(created.is_ok());
        service = std::move(created.value());
    }
};

} // anonymous namespace

// ============================================================================
// create
// ============================================================================

TEST_CASE("AuthService: create fails fast on missing required key", "[auth_service]") {
    auto cfg = test_config();
    cfg.ldap.basedn.reset();

    auto created = AuthService::create(cfg, bob_directory());
    REQUIRE(created.is_error());
    CHECK(created.error_code() == AuthErrorCode::CONFIGURATION_MISSING);
    CHECK(created.error().field == "ldap.basedn");
}

TEST_CASE("AuthService: create requires a connector", "[auth_service]") {
    auto created = AuthService::create(test_config(), nullptr);
    CHECK(created.error_code() == AuthErrorCode::CONFIGURATION_MISSING);
}

TEST_CASE("AuthService: only create() builds a service", "[auth_service]") {
    STATIC_REQUIRE_FALSE(std::is_constructible_v<AuthService, AuthConfig,
                                                 std::shared_ptr<IDirectoryConnector>,
                                                 std::shared_ptr<IUserStore>,
                                                 std::shared_ptr<IMetricsSink>>);

    auto created = AuthService::create(test_config(), bob_directory());
    REQUIRE(created.is_ok());
    REQUIRE(created.value() != nullptr);
    CHECK(created.value()->config().ldap.basedn == kBase);
}

TEST_CASE("AuthService: create with default collaborators", "[auth_service]") {
    auto created = AuthService::create(test_config(), bob_directory());
    REQUIRE(created.is_ok());
    CHECK(created.value()->try_login("bob", "correct").is_ok());
}

// ============================================================================
// try_login
// ============================================================================

TEST_CASE("AuthService: try_login success and failure outcomes", "[auth_service]") {
    Fixture f;

    CHECK(f.service->try_login("bob", "correct").is_ok());
    CHECK(f.service->try_login("bob", "wrong").error_code() ==
          AuthErrorCode::INVALID_CREDENTIALS);
    CHECK(f.service->try_login("mallory", "x").error_code() ==
          AuthErrorCode::INVALID_CREDENTIALS);

    CHECK(f.metrics->count("ldap_auth.login|outcome:success|1") == 1);
    CHECK(f.metrics->count("ldap_auth.login|outcome:invalid_credentials|1") == 2);
}

TEST_CASE("AuthService: empty username or password never reaches the directory",
          "[auth_service]") {
    Fixture f;

    CHECK(f.service->try_login("", "correct").error_code() == AuthErrorCode::INVALID_CREDENTIALS);
    CHECK(f.service->try_login("bob", "").error_code() == AuthErrorCode::INVALID_CREDENTIALS);
    CHECK(f.connector->open_count() == 0);
}

TEST_CASE("AuthService: unreachable directory", "[auth_service]") {
    Fixture f;
    f.connector->set_reachable(false);

    auto result = f.service->try_login("bob", "correct");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == AuthErrorCode::DIRECTORY_UNREACHABLE);
    CHECK(user_facing_message(result.error()) ==
          "Login is currently unavailable, please contact your administrator");
    CHECK(f.metrics->count("ldap_auth.login|outcome:directory_unreachable|1") == 1);
}

// ============================================================================
// login / load_user
// ============================================================================

TEST_CASE("AuthService: login creates the local user and builds the identity",
          "[auth_service]") {
    Fixture f;

    auto identity = f.service->login("bob", "correct");
    REQUIRE(identity.is_ok());
    CHECK(identity.value().user().username == "bob");
    CHECK_FALSE(identity.value().is_superuser());
    CHECK(identity.value().has_data_profiling_access());
    REQUIRE(identity.value().ldap_groups().size() == 1);
    CHECK(identity.value().ldap_groups()[0] == "Analysts");

    CHECK(f.users->size() == 1);
    auto stored = f.users->find_by_username("bob");
    REQUIRE(stored);
    CHECK(stored->id == identity.value().get_id());
}

TEST_CASE("AuthService: second login reuses the stored user", "[auth_service]") {
    Fixture f;

    auto first = f.service->login("bob", "correct");
    auto second = f.service->login("bob", "correct");
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value().get_id() == second.value().get_id());
    CHECK(f.users->size() == 1);
}

TEST_CASE("AuthService: failed login creates no user", "[auth_service]") {
    Fixture f;

    auto identity = f.service->login("bob", "wrong");
    CHECK(identity.error_code() == AuthErrorCode::INVALID_CREDENTIALS);
    CHECK(f.users->size() == 0);
}

TEST_CASE("AuthService: load_user", "[auth_service]") {
    Fixture f;
    auto logged_in = f.service->login("bob", "correct");
    REQUIRE(logged_in.is_ok());

    SECTION("known id rebuilds the identity") {
        auto loaded = f.service->load_user(logged_in.value().get_id());
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value().has_value());
        CHECK(loaded.value()->user().username == "bob");
        CHECK(loaded.value()->ldap_groups() == logged_in.value().ldap_groups());
    }

    SECTION("empty, None and unknown ids yield no identity") {
        for (const char* id : {"", "None", "12345"}) {
            auto loaded = f.service->load_user(id);
            REQUIRE(loaded.is_ok());
            CHECK_FALSE(loaded.value().has_value());
        }
    }
}

// ============================================================================
// Cache control
// ============================================================================

TEST_CASE("AuthService: invalidate_credentials forces a fresh user bind", "[auth_service]") {
    Fixture f;

    REQUIRE(f.service->try_login("bob", "correct").is_ok());
    const auto opens = f.connector->open_count();

    CHECK(f.service->invalidate_credentials(kBobDn) == 1);

    // Password changed in the directory: the old one must stop working at once
    f.connector->add_account(kBobDn, "changed");
    CHECK(f.service->try_login("bob", "correct").error_code() ==
          AuthErrorCode::INVALID_CREDENTIALS);
    CHECK(f.service->try_login("bob", "changed").is_ok());
    CHECK(f.connector->open_count() > opens);
}

TEST_CASE("AuthService: clear_caches drops bindings and memberships", "[auth_service]") {
    Fixture f;

    REQUIRE(f.service->login("bob", "correct").is_ok());
    CHECK(f.service->connections().get_stats().current_entries > 0);

    f.service->clear_caches();
    CHECK(f.service->connections().get_stats().current_entries == 0);

    const auto searches = f.connector->search_count();
    REQUIRE(f.service->login("bob", "correct").is_ok());
    // user search + superuser check + group lookup all hit the directory again
    CHECK(f.connector->search_count() == searches + 3);
}

TEST_CASE("AuthService: membership lookups are cached across logins", "[auth_service]") {
    Fixture f;

    REQUIRE(f.service->login("bob", "correct").is_ok());
    const auto searches = f.connector->search_count();

    REQUIRE(f.service->login("bob", "correct").is_ok());
    // Only the user search runs again
    CHECK(f.connector->search_count() == searches + 1);
}

TEST_CASE("AuthService: login after the server dropped the idle service connection",
          "[auth_service]") {
    Fixture f;

    // The identity lookups leave the service binding cached
    REQUIRE(f.service->login("bob", "correct").is_ok());
    const auto opens = f.connector->open_count();

    f.connector->drop_connections(1);
    auto identity = f.service->login("bob", "correct");
    REQUIRE(identity.is_ok());
    CHECK(identity.value().user().username == "bob");
    CHECK(f.connector->open_count() == opens + 1);
    CHECK(f.metrics->count("ldap_auth.login|outcome:success|1") == 2);
}

TEST_CASE("AuthService: concurrent logins", "[auth_service][concurrency]") {
    Fixture f;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                if (f.service->login("bob", "correct").is_error()) failures.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(failures.load() == 0);
}
