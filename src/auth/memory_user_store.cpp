#include "auth/memory_user_store.hpp"

#include <mutex>

namespace ldapauth {

std::shared_ptr<const UserRecord> MemoryUserStore::find_by_id(const std::string& id) {
    std::shared_lock lock(mutex_);
    if (const auto it = by_id_.find(id); it != by_id_.end()) {
        return it->second;
    }
    return nullptr;
}

std::shared_ptr<const UserRecord> MemoryUserStore::find_by_username(const std::string& username) {
    std::shared_lock lock(mutex_);
    const auto it = id_by_username_.find(username);
    if (it == id_by_username_.end()) return nullptr;
    if (const auto rec = by_id_.find(it->second); rec != by_id_.end()) {
        return rec->second;
    }
    return nullptr;
}

std::shared_ptr<UserRecord> MemoryUserStore::create_user(const std::string& username) {
    auto user = std::make_shared<UserRecord>();
    user->id = std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
    user->username = username;
    user->is_superuser = false;
    return user;
}

void MemoryUserStore::persist(const UserRecord& user) {
    std::unique_lock lock(mutex_);
    by_id_[user.id] = std::make_shared<const UserRecord>(user);
    id_by_username_[user.username] = user.id;
}

size_t MemoryUserStore::size() const {
    std::shared_lock lock(mutex_);
    return by_id_.size();
}

} // namespace ldapauth
