#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "identity_repository.hpp"
#include "../dnn/face_detector.hpp"

// users/<name>/ per identity, holding <name>.jpg and the feature vector as
// <name>.vec. On load the vector is re-extracted from the image when a
// detector is available, otherwise the stored vector is used.
class FolderIdentityRepository : public IdentityRepository {
    private:
        std::filesystem::path users_path_;
        FaceDetector* detector_;

        std::optional<Identity> extractFromImage(const std::string& name) const;
        std::optional<Identity> readStoredVector(const std::string& name) const;

    public:
        FolderIdentityRepository(const std::string& users_path, FaceDetector* detector);

        void save(const Identity& identity, const cv::Mat& reference_image) override;
        void remove(const std::string& name) override;
        std::vector<Identity> loadAll() override;

        std::filesystem::path imagePath(const std::string& name) const;
        std::filesystem::path vectorPath(const std::string& name) const;
};
