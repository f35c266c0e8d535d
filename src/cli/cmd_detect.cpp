#include "commands.h"
#include "cli_common.h"
#include "../detection_options.h"
#include "../image_decoder.h"
#include <chrono>

namespace facesift {

using namespace facesift::cli;

int cmd_detect(const std::vector<std::string>& args) {
    std::string image_path;
    std::optional<std::string> preset;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--preset") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --preset requires a value (fast|accurate)" << std::endl;
                return 1;
            }
            preset = args[++i];
        } else if (image_path.empty()) {
            image_path = args[i];
        } else {
            std::cerr << "Error: unexpected argument: " << args[i] << std::endl;
            return 1;
        }
    }

    if (image_path.empty()) {
        std::cerr << "Error: image path required" << std::endl;
        std::cerr << "Usage: facesift detect <image> [--preset fast|accurate]" << std::endl;
        return 1;
    }

    Config& config = loadDefaultConfig();
    if (preset) {
        if (!DetectionOptions::preset(*preset)) {
            std::cerr << "Error: unknown preset: " << *preset << std::endl;
            return 1;
        }
        config.set("detection", "preset", *preset);
    }
    DetectionOptions options = DetectionOptions::fromConfig(config);

    Image image;
    if (!decodeImageFile(image_path, image)) {
        std::cerr << "Error: failed to load image: " << image_path << std::endl;
        return 1;
    }

    auto pipeline = createPipeline(config);
    if (!pipeline) {
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    DetectionResult result = pipeline->detect(image.view(), options);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!result.ok) {
        std::cerr << "Error: detection failed: " << result.error << std::endl;
        return 1;
    }

    std::cout << image_path << ": " << image.width() << "x" << image.height() << ", "
              << result.faces.size() << " face(s) in " << elapsed << "ms" << std::endl;
    printFaces(result.faces);
    return 0;
}

} // namespace facesift
