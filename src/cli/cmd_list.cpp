#include "commands.h"
#include "cli_common.h"
#include "../models/gallery_store.h"

namespace facesift {

using namespace facesift::cli;

int cmd_list(const std::string& gallery_path) {
    loadDefaultConfig();

    Gallery gallery;
    if (!GalleryStore::load(gallery_path, gallery)) {
        std::cerr << "Error: cannot read gallery: " << gallery_path << std::endl;
        return 1;
    }

    std::cout << "Enrolled identities:" << std::endl;
    if (gallery.empty()) {
        std::cout << "  (none)" << std::endl;
    } else {
        for (const auto& entry : gallery) {
            const Identity& identity = entry.second;
            std::cout << "  " << identity.name << " (" << identity.sample_count << " samples, "
                      << identity.mean_embedding.size() << "D)" << std::endl;
        }
    }
    std::cout << "Total: " << gallery.size() << " identit" << (gallery.size() == 1 ? "y" : "ies") << std::endl;

    return 0;
}

} // namespace facesift
