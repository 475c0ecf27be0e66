#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <map>
#include <fstream>
#include <sstream>
#include <iostream>

class Config {
public:
    // Storage layout
    std::string users_path;
    std::string unknown_archive_path;

    // Presence session settings
    float activation_window;
    float known_threshold;
    float unknown_threshold;
    std::string similarity_metric;

    // History settings
    int history_capacity;
    int history_default_limit;
    bool load_history_on_start;

    // Identity persistence: "folder" or "postgres"
    std::string persistence;

    // Database configuration
    std::string db_host;
    int db_port;
    std::string db_name;
    std::string db_user;
    std::string db_password;

    // Model paths
    std::string face_detector_model;
    std::string embedding_model_path;
    std::string emotion_model_path;

    // Detection settings
    float detector_score_threshold;
    float min_face_size;

    bool visualize;

    Config();
    bool load(const std::string& filename);
    void setDefaults();

private:
    std::map<std::string, std::string> configMap;
    bool parseFile(const std::string& filename);
    void validate();
    std::string trim(const std::string& str);
    std::string getValue(const std::string& key, const std::string& defaultValue);
    int getValueInt(const std::string& key, int defaultValue);
    float getValueFloat(const std::string& key, float defaultValue);
    bool getValueBool(const std::string& key, bool defaultValue);
};

#endif // CONFIG_HPP
