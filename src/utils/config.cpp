#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    // Storage defaults
    users_path = "users";
    unknown_archive_path = "unknown_faces";

    // Presence defaults
    activation_window = 3.0f;
    known_threshold = 70.0f;
    unknown_threshold = 60.0f;
    similarity_metric = "cosine";

    // History defaults
    history_capacity = 1000;
    history_default_limit = 50;
    load_history_on_start = true;

    persistence = "folder";

    // Database defaults
    db_host = "localhost";
    db_port = 5433;
    db_name = "presence";
    db_user = "presence";
    db_password = "presence";

    // Model paths
    face_detector_model = "./models/face_detection_yunet.onnx";
    embedding_model_path = "./models/inception.onnx";
    emotion_model_path = "";

    detector_score_threshold = 0.7f;
    min_face_size = 40.0f;

    visualize = false;
}

std::string Config::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool Config::parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open config file: " << filename << std::endl;
        std::cerr << "Using default configuration." << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Parse key=value
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            configMap[key] = value;
        }
    }

    return true;
}

std::string Config::getValue(const std::string& key, const std::string& defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        return it->second;
    }
    return defaultValue;
}

int Config::getValueInt(const std::string& key, int defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid integer value for " << key << std::endl;
        }
    }
    return defaultValue;
}

float Config::getValueFloat(const std::string& key, float defaultValue) {
    auto it = configMap.find(key);
    if (it != configMap.end()) {
        try {
            return std::stof(it->second);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid float value for " << key << std::endl;
        }
    }
    return defaultValue;
}

bool Config::getValueBool(const std::string& key, bool defaultValue) {
    auto it = configMap.find(key);
    if (it == configMap.end()) {
        return defaultValue;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    std::cerr << "Warning: Invalid boolean value for " << key << std::endl;
    return defaultValue;
}

void Config::validate() {
    Config defaults;

    if (!std::isfinite(activation_window) || activation_window < 0.0f) {
        std::cerr << "Warning: activation_window must not be negative, using "
                  << defaults.activation_window << std::endl;
        activation_window = defaults.activation_window;
    }
    bool thresholds_in_range = std::isfinite(known_threshold) && std::isfinite(unknown_threshold) &&
                               known_threshold >= 0.0f && known_threshold <= 100.0f &&
                               unknown_threshold >= 0.0f && unknown_threshold <= 100.0f;
    if (!thresholds_in_range || unknown_threshold > known_threshold) {
        std::cerr << "Warning: Invalid similarity thresholds (known=" << known_threshold
                  << ", unknown=" << unknown_threshold << "), using defaults" << std::endl;
        known_threshold = defaults.known_threshold;
        unknown_threshold = defaults.unknown_threshold;
    }
    if (!std::isfinite(detector_score_threshold) || detector_score_threshold < 0.0f ||
        detector_score_threshold > 1.0f) {
        std::cerr << "Warning: detector_score_threshold must be in [0, 1], using "
                  << defaults.detector_score_threshold << std::endl;
        detector_score_threshold = defaults.detector_score_threshold;
    }
    if (!std::isfinite(min_face_size) || min_face_size < 0.0f) {
        std::cerr << "Warning: min_face_size must not be negative, using "
                  << defaults.min_face_size << std::endl;
        min_face_size = defaults.min_face_size;
    }
    if (history_capacity <= 0) {
        std::cerr << "Warning: history_capacity must be positive, using "
                  << defaults.history_capacity << std::endl;
        history_capacity = defaults.history_capacity;
    }
    if (history_default_limit <= 0) {
        history_default_limit = defaults.history_default_limit;
    }
    if (similarity_metric != "cosine" && similarity_metric != "euclidean") {
        std::cerr << "Warning: Unknown similarity_metric " << similarity_metric
                  << ", using " << defaults.similarity_metric << std::endl;
        similarity_metric = defaults.similarity_metric;
    }
    if (persistence != "folder" && persistence != "postgres") {
        std::cerr << "Warning: Unknown persistence " << persistence
                  << ", using " << defaults.persistence << std::endl;
        persistence = defaults.persistence;
    }
}

bool Config::load(const std::string& filename) {
    bool found = parseFile(filename);

    // Storage layout
    users_path = getValue("users_path", users_path);
    unknown_archive_path = getValue("unknown_archive_path", unknown_archive_path);

    // Presence settings
    activation_window = getValueFloat("activation_window", activation_window);
    known_threshold = getValueFloat("known_threshold", known_threshold);
    unknown_threshold = getValueFloat("unknown_threshold", unknown_threshold);
    similarity_metric = getValue("similarity_metric", similarity_metric);

    // History settings
    history_capacity = getValueInt("history_capacity", history_capacity);
    history_default_limit = getValueInt("history_default_limit", history_default_limit);
    load_history_on_start = getValueBool("load_history_on_start", load_history_on_start);

    persistence = getValue("persistence", persistence);

    // Database configuration
    db_host = getValue("db_host", db_host);
    db_port = getValueInt("db_port", db_port);
    db_name = getValue("db_name", db_name);
    db_user = getValue("db_user", db_user);
    db_password = getValue("db_password", db_password);

    // Model paths
    face_detector_model = getValue("face_detector_model", face_detector_model);
    embedding_model_path = getValue("embedding_model_path", embedding_model_path);
    emotion_model_path = getValue("emotion_model_path", emotion_model_path);

    detector_score_threshold = getValueFloat("detector_score_threshold", detector_score_threshold);
    min_face_size = getValueFloat("min_face_size", min_face_size);

    visualize = getValueBool("visualize", visualize);

    validate();

    std::cout << "Configuration loaded" << (found ? "" : " (defaults)") << std::endl;
    std::cout << "Users path: " << users_path << std::endl;
    std::cout << "Activation window: " << activation_window << "s" << std::endl;
    std::cout << "Thresholds: known >= " << known_threshold
              << ", unknown < " << unknown_threshold << std::endl;
    std::cout << "Persistence: " << persistence << std::endl;

    return found;
}
