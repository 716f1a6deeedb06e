#pragma once

#include <memory>
#include <optional>
#include <string>

namespace ldapauth {

/**
 * @brief Local record of a user that has logged in at least once
 */
struct UserRecord {
    std::string id;
    std::string username;
    bool is_superuser = false;
};

/**
 * @brief Persistence of user records, provided by the host application
 */
class IUserStore {
public:
    virtual ~IUserStore() = default;

    [[nodiscard]] virtual std::shared_ptr<const UserRecord> find_by_id(const std::string& id) = 0;
    [[nodiscard]] virtual std::shared_ptr<const UserRecord> find_by_username(
        const std::string& username) = 0;

    /// New, not yet persisted record with a fresh id.
    [[nodiscard]] virtual std::shared_ptr<UserRecord> create_user(const std::string& username) = 0;

    virtual void persist(const UserRecord& user) = 0;
};

} // namespace ldapauth
