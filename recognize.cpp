#include <iostream>
#include <chrono>
#include <optional>
#include <opencv2/opencv.hpp>

#include "src/engine/engine_builder.hpp"
#include "src/utils/config.hpp"

//// ./build/recognize [--config config.ini] [--interval seconds] img1.jpg img2.jpg ...
//// Each image is treated as one frame; frames are spaced `interval` seconds
//// apart on the engine's clock (default 1s).

int main(int argc, char** argv) {
    std::string config_file = "config.ini";
    double interval = 1.0;
    std::vector<std::string> image_paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            try {
                interval = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid interval: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            image_paths.push_back(arg);
        }
    }

    if (image_paths.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--config file] [--interval seconds] <image_path>..." << std::endl;
        return 1;
    }

    Config config;
    config.load(config_file);

    try {
        auto engine = buildEngine(config);

        nlohmann::json frames = nlohmann::json::array();
        TimePoint now = Clock::now();
        for (const auto& image_path : image_paths) {
            cv::Mat img = cv::imread(image_path);
            if (img.empty()) {
                std::cerr << "Failed to load image: " << image_path << std::endl;
                return 1;
            }

            std::vector<DetectionEvent> events = engine->processImage(img, now);
            nlohmann::json detections = nlohmann::json::array();
            for (const auto& event : events) {
                detections.push_back(event.toJSON());
            }
            frames.push_back({
                {"image", image_path},
                {"detections", detections},
                {"total_faces", events.size()},
            });

            now += std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(interval));
        }

        nlohmann::json presence = nlohmann::json::object();
        for (const auto& identity : engine->listIdentities()) {
            std::optional<PresenceSnapshot> snapshot = engine->presence(identity.name);
            presence[identity.name] = presencePhaseToString(snapshot ? snapshot->phase : PresencePhase::Idle);
        }

        nlohmann::json output = {
            {"frames", frames},
            {"presence", presence},
            {"stats", engine->stats().toJSON()},
        };
        std::cout << output.dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
