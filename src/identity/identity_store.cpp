#include "identity_store.hpp"

#include <algorithm>
#include <mutex>

StoreStatus IdentityStore::add(const std::string& name, const std::vector<float>& embedding,
                               TimePoint registered_at) {
    return add(Identity{name, embedding, registered_at});
}

StoreStatus IdentityStore::add(const Identity& identity) {
    if (identity.name.empty()) {
        return StoreStatus::DuplicateOrInvalid;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto existing = identities_.find(identity.name);
    if (existing != identities_.end()) {
        order_.erase(std::remove(order_.begin(), order_.end(), identity.name), order_.end());
    }
    identities_[identity.name] = identity;
    order_.push_back(identity.name);
    return StoreStatus::Ok;
}

StoreStatus IdentityStore::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (identities_.erase(name) == 0) {
        return StoreStatus::NotFound;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    return StoreStatus::Ok;
}

std::optional<Identity> IdentityStore::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = identities_.find(name);
    if (it == identities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool IdentityStore::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return identities_.count(name) > 0;
}

std::vector<IdentityInfo> IdentityStore::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<IdentityInfo> infos;
    infos.reserve(order_.size());
    for (const auto& name : order_) {
        const Identity& identity = identities_.at(name);
        infos.push_back(IdentityInfo{identity.name, identity.registered_at});
    }
    return infos;
}

std::vector<Identity> IdentityStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Identity> identities;
    identities.reserve(order_.size());
    for (const auto& name : order_) {
        identities.push_back(identities_.at(name));
    }
    return identities;
}

size_t IdentityStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return identities_.size();
}
