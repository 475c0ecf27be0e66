#include <iostream>
#include <opencv2/opencv.hpp>

#include "src/engine/engine_builder.hpp"
#include "src/utils/config.hpp"

//// ./build/register "John Doe" ./data/john.jpg [config.ini]

int main(int argc, char **argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <name> <image_path> [config_file]" << std::endl;
        return 1;
    }
    std::string name = argv[1];
    std::string image_path = argv[2];
    cv::Mat img = cv::imread(image_path);
    if (img.empty()) {
        std::cerr << "Failed to load image" << std::endl;
        return 1;
    }

    Config config;
    config.load(argc == 4 ? argv[3] : "config.ini");
    config.load_history_on_start = false;

    try {
        auto engine = buildEngine(config);
        OperationResult result = engine->registerIdentity(name, img);
        if (!result.ok()) {
            std::cerr << "Failed to register face (" << errorKindToString(result.error) << "): "
                      << result.message << std::endl;
            return 1;
        }
        std::cout << "Face registered successfully" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
