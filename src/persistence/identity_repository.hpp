#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "../identity/identity_store.hpp"

// Durable storage for registered identities. Implementations throw
// std::runtime_error when a write cannot complete.
class IdentityRepository {
    public:
        virtual ~IdentityRepository() = default;

        virtual void save(const Identity& identity, const cv::Mat& reference_image) = 0;
        virtual void remove(const std::string& name) = 0;
        virtual std::vector<Identity> loadAll() = 0;
};
