#ifndef FACESIFT_CLI_COMMON_H
#define FACESIFT_CLI_COMMON_H

/**
 * CLI Common Utilities and Includes
 *
 * Provides shared headers and utilities for CLI commands
 */

// ========== Standard Library Includes ==========
#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <iomanip>
#include <memory>
#include <optional>

// ========== facesift Includes ==========
#include "../config.h"
#include "../logger.h"
#include "../image.h"
#include "../detection_pipeline.h"
#include "../detectors/cascade_detector.h"
#include "config_paths.h"

// ========== Common Helper Functions ==========

namespace facesift {
namespace cli {

/**
 * Load configuration from CONFIG_DIR/facesift.conf and apply the
 * [logging] section to the Logger
 *
 * Falls back to built-in defaults if the file is not found
 *
 * @return Reference to the Config singleton
 */
inline Config& loadDefaultConfig() {
    Config& config = Config::getInstance();
    std::string config_path = std::string(CONFIG_DIR) + "/facesift.conf";
    config.load(config_path);  // Missing file = defaults

    Logger& logger = Logger::getInstance();
    if (auto level = config.getString("logging", "level")) {
        if (auto parsed = Logger::parseLevel(*level)) {
            logger.setLogLevel(*parsed);
        }
    }
    if (auto max_lines = config.getInt("logging", "max_lines")) {
        if (*max_lines >= 0) {
            logger.setMaxLines(static_cast<size_t>(*max_lines));
        }
    }
    if (auto file = config.getString("logging", "file")) {
        if (!file->empty()) {
            logger.setLogFile(*file);
        }
    }
    return config;
}

/**
 * Faces directory for enrollment ([enrollment] faces_dir, else FACES_DIR)
 */
inline std::string getFacesDir(const Config& config) {
    if (auto dir = config.getString("enrollment", "faces_dir")) {
        if (!dir->empty()) {
            return *dir;
        }
    }
    return std::string(FACES_DIR);
}

/**
 * Check if a file exists
 */
inline bool fileExists(const std::string& filepath) {
    std::ifstream f(filepath);
    return f.good();
}

/**
 * Build a detection pipeline on the configured cascade files
 * ([detection] cascade, else the bundled alt2/default cascades)
 *
 * @return nullptr (after printing the reason) if no cascade loads
 */
inline std::unique_ptr<DetectionPipeline> createPipeline(const Config& config) {
    std::vector<std::string> cascades = CascadeDetector::defaultCascadePaths();
    if (auto configured = config.getList("detection", "cascade")) {
        if (!configured->empty()) {
            cascades = *configured;
        }
    }

    try {
        return std::make_unique<DetectionPipeline>(std::make_unique<CascadeDetector>(cascades));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return nullptr;
    }
}

/**
 * Print boxes one per line: "  #i x=.. y=.. w=.. h=.."
 */
inline void printFaces(const std::vector<Rect>& faces) {
    for (size_t i = 0; i < faces.size(); i++) {
        const Rect& r = faces[i];
        std::cout << "  #" << i << " x=" << r.x << " y=" << r.y
                  << " w=" << r.width << " h=" << r.height << std::endl;
    }
}

} // namespace cli
} // namespace facesift

#endif // FACESIFT_CLI_COMMON_H
