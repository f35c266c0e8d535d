#include "commands.h"
#include "cli_common.h"
#include "../enrollment.h"
#include "../models/gallery_store.h"
#include "../models/ncnn_embedder.h"

namespace facesift {

using namespace facesift::cli;

int cmd_enroll(const std::vector<std::string>& args) {
    Config& config = loadDefaultConfig();

    std::string faces_dir;
    std::string out_path;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--out") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --out requires a file path" << std::endl;
                return 1;
            }
            out_path = args[++i];
        } else if (faces_dir.empty()) {
            faces_dir = args[i];
        } else {
            std::cerr << "Error: unexpected argument: " << args[i] << std::endl;
            return 1;
        }
    }
    if (faces_dir.empty()) {
        faces_dir = getFacesDir(config);
    }

    auto sources = Enrollment::scanSource(faces_dir);
    if (sources.empty()) {
        std::cerr << "Error: no identity directories in " << faces_dir << std::endl;
        return 1;
    }
    std::cout << "Enrolling " << sources.size() << " identit" << (sources.size() == 1 ? "y" : "ies")
              << " from " << faces_dir << "..." << std::endl;

    Enrollment enrollment(ncnnEmbedderFactory(NcnnEmbedderOptions::fromConfig(config)),
                          EnrollmentOptions::fromConfig(config));

    GalleryRegistry registry;
    size_t loaded = 0;
    try {
        loaded = enrollment.rebuild(registry, faces_dir);
    } catch (const ModelUnavailableError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Install detection/recognition models in " << MODELS_DIR
                  << " or set [recognition] model in the config" << std::endl;
        return 1;
    }

    auto gallery = registry.snapshot();
    for (const auto& entry : *gallery) {
        std::cout << "  ✓ " << entry.first << " (" << entry.second.sample_count << " samples)" << std::endl;
    }
    for (const auto& source : sources) {
        if (gallery->find(source.name) == gallery->end()) {
            std::cout << "  ✗ " << source.name << " (no usable face in "
                      << source.images.size() << " images)" << std::endl;
        }
    }
    std::cout << "Enrolled " << loaded << " of " << sources.size() << std::endl;

    if (!out_path.empty()) {
        if (!GalleryStore::save(out_path, *gallery)) {
            std::cerr << "Error: failed to save gallery to " << out_path << std::endl;
            return 1;
        }
        std::cout << "Gallery saved to " << out_path << std::endl;
    }

    return loaded > 0 ? 0 : 1;
}

} // namespace facesift
