#pragma once

#include "auth/iuser_store.hpp"

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <unordered_map>

namespace ldapauth {

/**
 * @brief In-process IUserStore
 *
 * Ids are sequential integers rendered as strings. Records handed out are
 * snapshots; persist() replaces the stored copy.
 */
class MemoryUserStore : public IUserStore {
public:
    [[nodiscard]] std::shared_ptr<const UserRecord> find_by_id(const std::string& id) override;
    [[nodiscard]] std::shared_ptr<const UserRecord> find_by_username(
        const std::string& username) override;
    [[nodiscard]] std::shared_ptr<UserRecord> create_user(const std::string& username) override;
    void persist(const UserRecord& user) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const UserRecord>> by_id_;
    std::unordered_map<std::string, std::string> id_by_username_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace ldapauth
