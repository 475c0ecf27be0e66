#include "folder_identity_repository.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <opencv2/imgcodecs.hpp>

#include "../postgres/utils.hpp"

namespace fs = std::filesystem;

namespace {

TimePoint modifiedAt(const fs::path& path) {
    std::error_code ec;
    auto written = fs::last_write_time(path, ec);
    if (ec) {
        return Clock::now();
    }
    return std::chrono::time_point_cast<Clock::duration>(
        written - fs::file_time_type::clock::now() + Clock::now());
}

} // namespace

FolderIdentityRepository::FolderIdentityRepository(const std::string& users_path, FaceDetector* detector)
    : users_path_(users_path), detector_(detector) {
}

fs::path FolderIdentityRepository::imagePath(const std::string& name) const {
    return users_path_ / name / (name + ".jpg");
}

fs::path FolderIdentityRepository::vectorPath(const std::string& name) const {
    return users_path_ / name / (name + ".vec");
}

void FolderIdentityRepository::save(const Identity& identity, const cv::Mat& reference_image) {
    std::error_code ec;
    fs::create_directories(users_path_ / identity.name, ec);
    if (ec) {
        throw std::runtime_error("Cannot create folder for " + identity.name + ": " + ec.message());
    }

    if (!reference_image.empty()) {
        bool written = false;
        try {
            written = cv::imwrite(imagePath(identity.name).string(), reference_image);
        } catch (const cv::Exception& e) {
            throw std::runtime_error("Cannot write reference image for " + identity.name + ": " + e.what());
        }
        if (!written) {
            throw std::runtime_error("Cannot write reference image for " + identity.name);
        }
    }

    std::ofstream vector_file(vectorPath(identity.name), std::ios::trunc);
    vector_file << vec2pgvector(identity.embedding) << "\n";
    vector_file.flush();
    if (!vector_file) {
        throw std::runtime_error("Cannot write feature vector for " + identity.name);
    }
}

std::optional<Identity> FolderIdentityRepository::extractFromImage(const std::string& name) const {
    fs::path image_path = imagePath(name);
    if (detector_ == nullptr || !fs::exists(image_path)) {
        return std::nullopt;
    }

    cv::Mat image = cv::imread(image_path.string());
    if (image.empty()) {
        std::cerr << "Error loading user " << name << ": unreadable image" << std::endl;
        return std::nullopt;
    }
    std::vector<ObservedFace> faces = detector_->detect(image);
    const ObservedFace* largest = nullptr;
    for (const auto& face : faces) {
        if (face.embedding.empty()) {
            continue;
        }
        if (largest == nullptr || face.box.toRect().area() > largest->box.toRect().area()) {
            largest = &face;
        }
    }
    if (largest == nullptr) {
        std::cerr << "Error loading user " << name << ": no face found" << std::endl;
        return std::nullopt;
    }
    return Identity{name, largest->embedding, modifiedAt(image_path)};
}

std::optional<Identity> FolderIdentityRepository::readStoredVector(const std::string& name) const {
    fs::path vector_path = vectorPath(name);
    std::ifstream vector_file(vector_path);
    if (!vector_file.is_open()) {
        return std::nullopt;
    }
    std::string literal;
    std::getline(vector_file, literal);
    std::vector<float> embedding = pgvector2vec(literal);
    if (embedding.empty()) {
        return std::nullopt;
    }
    return Identity{name, embedding, modifiedAt(vector_path)};
}

void FolderIdentityRepository::remove(const std::string& name) {
    std::error_code ec;
    fs::remove_all(users_path_ / name, ec);
    if (ec) {
        throw std::runtime_error("Cannot remove folder for " + name + ": " + ec.message());
    }
}

std::vector<Identity> FolderIdentityRepository::loadAll() {
    std::vector<Identity> identities;
    std::error_code ec;
    if (!fs::is_directory(users_path_, ec)) {
        return identities;
    }

    for (const auto& entry : fs::directory_iterator(users_path_, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        std::string name = entry.path().filename().string();

        try {
            // Re-extraction from the reference image takes precedence.
            std::optional<Identity> identity = extractFromImage(name);
            if (!identity) {
                identity = readStoredVector(name);
            }
            if (!identity) {
                std::cerr << "Error loading user " << name << ": no reference image or feature vector" << std::endl;
                continue;
            }
            identities.push_back(*identity);
            std::cout << "Loaded user: " << name << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Error loading user " << name << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "Error listing " << users_path_ << ": " << ec.message() << std::endl;
    }

    std::sort(identities.begin(), identities.end(), [](const Identity& lhs, const Identity& rhs) {
        return lhs.registered_at < rhs.registered_at;
    });
    return identities;
}
