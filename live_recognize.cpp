#include <iostream>
#include <chrono>
#include <opencv2/opencv.hpp>

#include "src/dnn/draw.hpp"
#include "src/engine/engine_builder.hpp"
#include "src/utils/config.hpp"

//// ./build/live_recognize [video_file|camera_index] [config.ini]

int main(int argc, char** argv) {
    cv::VideoCapture cap;

    std::string source = argc > 1 ? argv[1] : "0";
    bool is_camera = !source.empty() && source.find_first_not_of("0123456789") == std::string::npos;
    if (is_camera) {
        int camera_index = 0;
        try {
            camera_index = std::stoi(source);
        } catch (const std::exception&) {
            std::cerr << "Invalid camera index: " << source << std::endl;
            return 1;
        }
        cap.open(camera_index);
        if (!cap.isOpened()) {
            std::cerr << "Failed to open webcam " << source << std::endl;
            return 1;
        }
        cap.set(cv::CAP_PROP_FRAME_WIDTH, 640);
        cap.set(cv::CAP_PROP_FRAME_HEIGHT, 480);
        std::cout << "Opening webcam..." << std::endl;
    } else {
        cap.open(source);
        if (!cap.isOpened()) {
            std::cerr << "Failed to open video file: " << source << std::endl;
            return 1;
        }
        std::cout << "Opening video file: " << source << std::endl;
    }

    Config config;
    config.load(argc > 2 ? argv[2] : "config.ini");

    std::unique_ptr<SessionEngine> engine;
    try {
        engine = buildEngine(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Presence tracking started. Press 'q' or ESC to quit." << std::endl;

    cv::Mat frame;
    int frame_count = 0;
    double total_time = 0.0;

    while (true) {
        cap >> frame;

        if (frame.empty()) {
            std::cout << "End of video or failed to capture frame" << std::endl;
            break;
        }

        auto start = std::chrono::high_resolution_clock::now();
        std::vector<DetectionEvent> events = engine->processImage(frame);
        auto end = std::chrono::high_resolution_clock::now();
        total_time += std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        if (!events.empty()) {
            std::cout << "Frame " << frame_count << ": " << events.size() << " faces" << std::endl;
            for (const auto& event : events) {
                std::cout << "  " << event.toJSON().dump() << std::endl;
            }
        }

        frame_count++;

        if (config.visualize) {
            double fps = total_time > 0.0 ? frame_count / (total_time / 1000.0) : 0.0;
            cv::imshow("Presence - Live", drawDetections(frame, events, fps));

            int key = cv::waitKey(1) & 0xFF;
            if (key == 'q' || key == 'Q' || key == 27) {  // 'q' or ESC key
                std::cout << "Exiting..." << std::endl;
                break;
            }
        }
    }

    cap.release();
    if (config.visualize) {
        cv::destroyAllWindows();
    }

    std::cout << "Processed " << frame_count << " frames" << std::endl;
    if (frame_count > 0) {
        std::cout << "Average latency: " << total_time / frame_count << " ms" << std::endl;
    }
    std::cout << engine->stats().toJSON().dump(2) << std::endl;

    return 0;
}
