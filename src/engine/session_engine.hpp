#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "../dnn/face_detector.hpp"
#include "../emotion/emotion_classifier.hpp"
#include "../history/history_ledger.hpp"
#include "../identity/identity_store.hpp"
#include "../identity/match_scorer.hpp"
#include "../persistence/identity_repository.hpp"
#include "../report/report_sink.hpp"
#include "../session/motion_tracker.hpp"
#include "../session/presence_session.hpp"
#include "../utils/config.hpp"

struct EngineStats {
    size_t total_identities = 0;
    HistoryStats history;

    nlohmann::json toJSON() const;
};

// Owns every piece of shared session state: identities, per-identity
// presence, motion history and the detection ledger. Safe to call from
// multiple frame-processing and query threads at once.
class SessionEngine {
    private:
        Config config_;
        ClassificationPolicy policy_;

        IdentityStore store_;
        MatchScorer scorer_;
        MotionTracker motion_;
        HistoryLedger history_;
        ReportSink reports_;

        std::mutex sessions_mutex_;
        std::unordered_map<std::string, std::shared_ptr<PresenceSession>> sessions_;

        // Serialises register/remove so the store and the repository agree.
        std::mutex registration_mutex_;

        std::shared_ptr<FaceDetector> detector_;
        std::shared_ptr<EmotionClassifier> classifier_;
        std::shared_ptr<IdentityRepository> repository_;

        std::shared_ptr<PresenceSession> sessionFor(const std::string& name, bool create);
        DetectionEvent processFace(const ObservedFace& face, TimePoint now);
        OperationResult validateName(const std::string& name) const;

    public:
        SessionEngine(const Config& config,
                      std::shared_ptr<FaceDetector> detector,
                      std::shared_ptr<EmotionClassifier> classifier,
                      std::shared_ptr<IdentityRepository> repository,
                      SimilarityFunction similarity = nullptr);

        // Startup: registered identities from the repository, history from
        // the durable reports. Returns the number of items loaded.
        size_t loadIdentities();
        size_t loadHistory();

        // Exactly one face must be present in the image.
        OperationResult registerIdentity(const std::string& name, const cv::Mat& image);
        // Registers a precomputed feature vector.
        OperationResult registerIdentity(const std::string& name, const std::vector<float>& embedding,
                                         const cv::Mat& reference_image = cv::Mat());
        OperationResult removeIdentity(const std::string& name);
        std::vector<IdentityInfo> listIdentities() const;

        std::vector<DetectionEvent> processFrame(const std::vector<ObservedFace>& faces,
                                                 TimePoint now = Clock::now());
        std::vector<DetectionEvent> processImage(const cv::Mat& frame, TimePoint now = Clock::now());

        // limit of 0 uses the configured default page size.
        HistoryPage queryHistory(size_t limit = 0, const std::string& identity_filter = "",
                                 size_t offset = 0) const;
        EngineStats stats(TimePoint now = Clock::now()) const;
        std::optional<PresenceSnapshot> presence(const std::string& name);

        const Config& config() const { return config_; }
        ReportSink& reports() { return reports_; }
};
