#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../utils/time_format.hpp"

struct Identity {
    std::string name;
    std::vector<float> embedding;
    TimePoint registered_at;
};

struct IdentityInfo {
    std::string name;
    TimePoint registered_at;
};

enum class StoreStatus {
    Ok,
    DuplicateOrInvalid,
    NotFound,
};

// Registered identities in registration order. All access goes through a
// single shared mutex, so readers never observe a half-applied update.
class IdentityStore {
    private:
        mutable std::shared_mutex mutex_;
        std::vector<std::string> order_;
        std::unordered_map<std::string, Identity> identities_;

    public:
        // Re-registering a name replaces the previous identity and moves it
        // to the end of the registration order.
        StoreStatus add(const std::string& name, const std::vector<float>& embedding,
                        TimePoint registered_at = Clock::now());
        StoreStatus add(const Identity& identity);
        StoreStatus remove(const std::string& name);
        std::optional<Identity> get(const std::string& name) const;
        bool contains(const std::string& name) const;
        std::vector<IdentityInfo> list() const;
        // Copy of every identity, in registration order.
        std::vector<Identity> snapshot() const;
        size_t size() const;
};
