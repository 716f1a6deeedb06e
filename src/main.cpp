#include "auth/auth_service.hpp"
#include "auth/memory_user_store.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "directory/ldap_directory_connector.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace ldapauth;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitLoginFailed = 1;
constexpr int kExitConfigError = 2;

void print_usage(const char* program) {
    std::cerr << std::format("Usage: {} <config.toml> <username>\n\n"
                             "Reads the password from LDAP_AUTH_PASSWORD, or from the first\n"
                             "line of stdin when the variable is unset.\n", program);
}

std::string read_password() {
    if (const char* env = std::getenv("LDAP_AUTH_PASSWORD")) {
        return env;
    }
    std::string line;
    std::getline(std::cin, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        print_usage(argv[0]);
        return kExitConfigError;
    }

    try {
        const std::string config_file = argv[1];
        const std::string username = argv[2];

        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitConfigError;
        }
        if (auto level = utils::log::parse_level(loaded.config.logging.level)) {
            utils::log::set_level(*level);
        }

        auto created = AuthService::create(std::move(loaded.config),
                                           std::make_shared<LdapDirectoryConnector>(),
                                           std::make_shared<MemoryUserStore>());
        if (created.is_error()) {
            utils::log::error(created.error_message());
            return kExitConfigError;
        }
        auto& service = *created.value();

        const auto password = read_password();
        auto identity = service.login(username, password);
        if (identity.is_error()) {
            std::cout << "authenticated: false\n"
                      << "error: " << user_facing_message(identity.error()) << '\n';
            return identity.error_code() == AuthErrorCode::CONFIGURATION_MISSING
                ? kExitConfigError : kExitLoginFailed;
        }

        const auto& id = identity.value();
        std::cout << "authenticated: true\n"
                  << "superuser: " << utils::booltostr(id.is_superuser()) << '\n'
                  << "data_profiler: " << utils::booltostr(id.has_data_profiling_access()) << '\n'
                  << "groups: " << join(id.ldap_groups()) << '\n';

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitConfigError;
    }

    return kExitOk;
}
