#include "session_engine.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

} // namespace

nlohmann::json EngineStats::toJSON() const {
    nlohmann::json json = history.toJSON();
    json["total_users"] = total_identities;
    return json;
}

SessionEngine::SessionEngine(const Config& config,
                             std::shared_ptr<FaceDetector> detector,
                             std::shared_ptr<EmotionClassifier> classifier,
                             std::shared_ptr<IdentityRepository> repository,
                             SimilarityFunction similarity)
    : config_(config),
      policy_{config.known_threshold, config.unknown_threshold},
      scorer_(store_, similarity ? std::move(similarity) : similarityByName(config.similarity_metric)),
      history_(static_cast<size_t>(config.history_capacity)),
      reports_(config.users_path, config.unknown_archive_path),
      detector_(std::move(detector)),
      classifier_(std::move(classifier)),
      repository_(std::move(repository)) {
    if (!classifier_) {
        classifier_ = std::make_shared<RandomEmotionClassifier>();
    }
}

size_t SessionEngine::loadIdentities() {
    if (!repository_) {
        return 0;
    }

    std::vector<Identity> identities;
    try {
        identities = repository_->loadAll();
    } catch (const std::exception& e) {
        std::cerr << "Error loading registered users: " << e.what() << std::endl;
        return 0;
    }

    std::lock_guard<std::mutex> lock(registration_mutex_);
    size_t loaded = 0;
    for (const auto& identity : identities) {
        if (store_.add(identity) == StoreStatus::Ok) {
            ++loaded;
        }
    }
    std::cout << "Loaded " << loaded << " registered users" << std::endl;
    return loaded;
}

size_t SessionEngine::loadHistory() {
    std::vector<DetectionEvent> events = reports_.loadHistory();
    for (const auto& event : events) {
        history_.append(event);
    }
    return events.size();
}

OperationResult SessionEngine::validateName(const std::string& name) const {
    if (name.empty()) {
        return OperationResult::failure(ErrorKind::InvalidInput, "user name is required");
    }
    if (name == "." || name == ".." || name == kUnknownLabel ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return OperationResult::failure(ErrorKind::InvalidInput, "invalid user name: " + name);
    }
    return OperationResult::success();
}

OperationResult SessionEngine::registerIdentity(const std::string& raw_name, const cv::Mat& image) {
    const std::string name = trim(raw_name);
    OperationResult valid = validateName(name);
    if (!valid.ok()) {
        return valid;
    }
    if (image.empty()) {
        return OperationResult::failure(ErrorKind::InvalidInput, "image is required");
    }
    if (!detector_) {
        return OperationResult::failure(ErrorKind::ExtractionFailure, "no face detector available");
    }

    std::vector<ObservedFace> faces;
    try {
        faces = detector_->detect(image);
    } catch (const std::exception& e) {
        std::cerr << "Face registration error: " << e.what() << std::endl;
        return OperationResult::failure(ErrorKind::ExtractionFailure, e.what());
    }

    if (faces.empty()) {
        return OperationResult::failure(ErrorKind::InvalidInput, "no face found in the image");
    }
    if (faces.size() > 1) {
        return OperationResult::failure(ErrorKind::InvalidInput,
                                        "more than one face found in the image");
    }
    if (faces[0].embedding.empty()) {
        return OperationResult::failure(ErrorKind::ExtractionFailure, "feature extraction failed");
    }

    return registerIdentity(name, faces[0].embedding, image);
}

OperationResult SessionEngine::registerIdentity(const std::string& raw_name, const std::vector<float>& embedding,
                                                const cv::Mat& reference_image) {
    const std::string name = trim(raw_name);
    OperationResult valid = validateName(name);
    if (!valid.ok()) {
        return valid;
    }
    if (embedding.empty()) {
        return OperationResult::failure(ErrorKind::InvalidInput, "feature vector is empty");
    }

    std::lock_guard<std::mutex> lock(registration_mutex_);
    Identity identity{name, embedding, Clock::now()};
    if (repository_) {
        try {
            repository_->save(identity, reference_image);
        } catch (const std::exception& e) {
            std::cerr << "Error registering user " << name << ": " << e.what() << std::endl;
            return OperationResult::failure(ErrorKind::StorageFailure, e.what());
        }
    }

    if (store_.add(identity) != StoreStatus::Ok) {
        return OperationResult::failure(ErrorKind::InvalidInput, "invalid user name: " + name);
    }

    // A replaced identity starts a fresh presence session.
    {
        std::lock_guard<std::mutex> sessions_lock(sessions_mutex_);
        sessions_.erase(name);
    }

    std::cout << "User " << name << " registered" << std::endl;
    return OperationResult::success("user " + name + " registered");
}

OperationResult SessionEngine::removeIdentity(const std::string& raw_name) {
    const std::string name = trim(raw_name);
    if (name.empty()) {
        return OperationResult::failure(ErrorKind::InvalidInput, "user name is required");
    }

    std::lock_guard<std::mutex> lock(registration_mutex_);
    if (!store_.contains(name)) {
        return OperationResult::failure(ErrorKind::NotFound, "user not found: " + name);
    }

    if (repository_) {
        try {
            repository_->remove(name);
        } catch (const std::exception& e) {
            std::cerr << "Error deleting user " << name << ": " << e.what() << std::endl;
            return OperationResult::failure(ErrorKind::StorageFailure, e.what());
        }
    }

    store_.remove(name);
    {
        std::lock_guard<std::mutex> sessions_lock(sessions_mutex_);
        sessions_.erase(name);
    }

    std::cout << "User " << name << " deleted" << std::endl;
    return OperationResult::success("user " + name + " deleted");
}

std::vector<IdentityInfo> SessionEngine::listIdentities() const {
    return store_.list();
}

std::shared_ptr<PresenceSession> SessionEngine::sessionFor(const std::string& name, bool create) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(name);
    if (it != sessions_.end()) {
        return it->second;
    }
    if (!create || !store_.contains(name)) {
        return nullptr;
    }
    auto session = std::make_shared<PresenceSession>(name, config_.activation_window);
    sessions_.emplace(name, session);
    return session;
}

DetectionEvent SessionEngine::processFace(const ObservedFace& face, TimePoint now) {
    const MatchResult match = scorer_.match(face.embedding);
    const MatchClass match_class = policy_.classify(match);
    const Emotion emotion = face.crop.empty() ? Emotion::Neutral : classifier_->classify(face.crop);
    const cv::Point2f center = face.box.center();

    DetectionEvent event;
    event.similarity = match.similarity;
    event.emotion = emotion;
    event.location = face.box;
    event.timestamp = now;

    std::shared_ptr<PresenceSession> session;
    if (match_class == MatchClass::Known) {
        session = sessionFor(*match.identity_name, true);
    }

    if (session) {
        const std::string& name = *match.identity_name;
        SightingResult sighting = session->observeKnown(now, emotion, center);

        event.identity_label = name;
        event.is_known = true;
        event.instantaneous_motion = sighting.instantaneous_motion;
        event.cumulative_motion = sighting.cumulative_motion;

        if (sighting.confirmed) {
            event.outcome = EventOutcome::Verified;
            reports_.writeVerified(name, match.similarity, sighting.dominant_emotion,
                                   sighting.cumulative_motion, sighting.presence_seconds, now);
        }
    } else {
        event.instantaneous_motion = motion_.update(MotionTracker::kUnknownKey, center);
        event.cumulative_motion = motion_.cumulative(MotionTracker::kUnknownKey);

        if (match.identity_name && match_class != MatchClass::Known) {
            std::shared_ptr<PresenceSession> candidate = sessionFor(*match.identity_name, false);
            if (candidate) {
                candidate->observeMiss();
            }
        }

        if (match_class == MatchClass::Unknown) {
            event.outcome = EventOutcome::Unknown;
            reports_.writeUnknown(match.similarity, emotion, face.crop, event.cumulative_motion, now);
        }
    }

    std::ostringstream log;
    log << std::fixed << std::setprecision(1)
        << "Best match: " << (match.identity_name ? *match.identity_name : "None")
        << ", Similarity: " << match.similarity << "%"
        << ", Class: " << matchClassToString(match_class)
        << ", Motion: " << event.instantaneous_motion;
    std::cout << log.str() << std::endl;

    history_.append(event);
    return event;
}

std::vector<DetectionEvent> SessionEngine::processFrame(const std::vector<ObservedFace>& faces, TimePoint now) {
    std::vector<DetectionEvent> events;
    events.reserve(faces.size());
    for (const auto& face : faces) {
        events.push_back(processFace(face, now));
    }
    return events;
}

std::vector<DetectionEvent> SessionEngine::processImage(const cv::Mat& frame, TimePoint now) {
    if (frame.empty()) {
        std::cerr << "Empty frame received" << std::endl;
        return {};
    }
    if (!detector_) {
        std::cerr << "No face detector available" << std::endl;
        return {};
    }

    std::vector<ObservedFace> faces;
    try {
        faces = detector_->detect(frame);
    } catch (const std::exception& e) {
        std::cerr << "Face detection error: " << e.what() << std::endl;
        return {};
    }
    return processFrame(faces, now);
}

HistoryPage SessionEngine::queryHistory(size_t limit, const std::string& identity_filter, size_t offset) const {
    if (limit == 0) {
        limit = static_cast<size_t>(config_.history_default_limit);
    }
    return history_.query(limit, identity_filter, offset);
}

EngineStats SessionEngine::stats(TimePoint now) const {
    EngineStats stats;
    stats.total_identities = store_.size();
    stats.history = history_.stats(now);
    return stats;
}

std::optional<PresenceSnapshot> SessionEngine::presence(const std::string& name) {
    std::shared_ptr<PresenceSession> session = sessionFor(name, false);
    if (!session) {
        return std::nullopt;
    }
    return session->snapshot();
}
