#include "engine_builder.hpp"

#include <iostream>
#include <stdexcept>

#include "../dnn/yunet_face_encoder.hpp"
#include "../persistence/folder_identity_repository.hpp"
#include "../postgres/postgres.hpp"

std::unique_ptr<SessionEngine> buildEngine(const Config& config) {
    std::cout << "Initializing face encoder..." << std::endl;
    std::shared_ptr<FaceDetector> detector = std::make_shared<YuNetFaceEncoder>(config);
    std::shared_ptr<EmotionClassifier> classifier = makeEmotionClassifier(config);

    std::shared_ptr<IdentityRepository> repository;
    if (config.persistence == "postgres") {
        try {
            repository = std::make_shared<PostgresIdentityRepository>(
                config.db_host,
                config.db_port,
                config.db_name,
                config.db_user,
                config.db_password,
                config.users_path
            );
        } catch (const pqxx::failure& e) {
            throw std::runtime_error(std::string("Cannot open identity database: ") + e.what());
        }
    } else {
        repository = std::make_shared<FolderIdentityRepository>(config.users_path, detector.get());
    }

    auto engine = std::make_unique<SessionEngine>(config, detector, classifier, repository);
    engine->loadIdentities();
    if (config.load_history_on_start) {
        engine->loadHistory();
    }
    std::cout << "Backend initialized successfully" << std::endl;
    return engine;
}
