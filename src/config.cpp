#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace facesift {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

std::string Config::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool Config::load(const std::string& path) {
    validation_errors_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key-value pair
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            data_[current_section][key] = value;
        }
    }

    bool valid = validate();

    if (!validation_errors_.empty()) {
        Logger::getInstance().warning("Configuration validation found " +
            std::to_string(validation_errors_.size()) + " issue(s) in " + path + ":");
        for (const auto& error : validation_errors_) {
            Logger::getInstance().warning("  - " + error);
        }
    }

    return valid;
}

std::optional<std::string> Config::getString(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it == data_.end()) {
        return std::nullopt;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }

    return key_it->second;
}

std::optional<int> Config::getInt(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        int parsed = std::stoi(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> Config::getDouble(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        double parsed = std::stod(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> Config::getBool(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }

    return std::nullopt;
}

std::optional<std::vector<std::string>> Config::getList(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    std::vector<std::string> items;
    std::stringstream ss(*value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void Config::set(const std::string& section, const std::string& key, const std::string& value) {
    data_[section][key] = value;
}

bool Config::validateInt(const std::string& section, const std::string& key, int min_val, int max_val) {
    auto raw = getString(section, key);
    if (!raw.has_value()) {
        return true;  // Optional value, not set
    }

    auto value = getInt(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " = " + *raw + " is not an integer");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateDouble(const std::string& section, const std::string& key, double min_val, double max_val) {
    auto raw = getString(section, key);
    if (!raw.has_value()) {
        return true;
    }

    auto value = getDouble(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " = " + *raw + " is not a number");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateBool(const std::string& section, const std::string& key) {
    auto raw = getString(section, key);
    if (!raw.has_value() || getBool(section, key).has_value()) {
        return true;
    }
    validation_errors_.push_back("[" + section + "]." + key + " = " + *raw + " is not a boolean");
    return false;
}

bool Config::validate() {
    bool all_valid = true;

    // Detection
    auto preset = getString("detection", "preset");
    if (preset.has_value() && *preset != "accurate" && *preset != "fast") {
        validation_errors_.push_back("[detection].preset must be 'accurate' or 'fast', got '" + *preset + "'");
        all_valid = false;
    }
    all_valid &= validateBool("detection", "use_gray");
    all_valid &= validateBool("detection", "dynamic_size");
    all_valid &= validateBool("detection", "equalize_histogram");
    all_valid &= validateDouble("detection", "image_scale", 0.05, 4.0);
    all_valid &= validateInt("detection", "min_face_size", 1, 4096);
    all_valid &= validateInt("detection", "max_face_size", 1, 4096);
    all_valid &= validateDouble("detection", "min_face_ratio", 0.0, 1.0);
    all_valid &= validateDouble("detection", "max_face_ratio", 0.0, 1.0);
    all_valid &= validateDouble("detection", "scale_factor", 1.01, 2.0);
    all_valid &= validateInt("detection", "min_neighbors", 0, 20);
    all_valid &= validateDouble("detection", "confidence_threshold", 0.0, 1.0);
    all_valid &= validateDouble("detection", "overlap_threshold", 0.0, 1.0);

    // Logical consistency: min size must not exceed max size
    auto min_size = getInt("detection", "min_face_size");
    auto max_size = getInt("detection", "max_face_size");
    if (min_size.has_value() && max_size.has_value() && *min_size > *max_size) {
        validation_errors_.push_back(
            "[detection].min_face_size (" + std::to_string(*min_size) +
            ") must be <= max_face_size (" + std::to_string(*max_size) + ")");
        all_valid = false;
    }

    // Recognition
    all_valid &= validateDouble("recognition", "threshold", -1.0, 1.0);
    all_valid &= validateInt("recognition", "num_threads", 1, 64);
    all_valid &= validateDouble("recognition", "detection_confidence", 0.0, 1.0);

    // Enrollment
    all_valid &= validateDouble("enrollment", "outlier_threshold", -1.0, 1.0);
    all_valid &= validateInt("enrollment", "outlier_iterations", 0, 10);
    all_valid &= validateInt("enrollment", "threads", 1, 32);

    // Logging
    auto level = getString("logging", "level");
    if (level.has_value() && !Logger::parseLevel(*level).has_value()) {
        validation_errors_.push_back("[logging].level '" + *level + "' is not one of debug, info, warning, error");
        all_valid = false;
    }
    all_valid &= validateInt("logging", "max_lines", 0, 1000000);

    return all_valid;
}

} // namespace facesift
