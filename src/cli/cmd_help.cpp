#include <iostream>
#include "commands.h"
#include "config_paths.h"

namespace facesift {

void print_usage() {
    std::cout << "facesift - face detection post-processing and identity matching" << std::endl;
    std::cout << "Version: " << VERSION << std::endl << std::endl;
    std::cout << "Usage: facesift <command> [options]" << std::endl << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  detect <image> [--preset fast|accurate]      Detect faces in an image" << std::endl;
    std::cout << "  enroll [faces_dir] [--out <gallery.bin>]     Enroll identities from faces_dir/<name>/*.jpg" << std::endl;
    std::cout << "  match <gallery.bin> <image>                  Find the enrolled face in an image" << std::endl;
    std::cout << "  list <gallery.bin>                           List identities in a gallery file" << std::endl;
    std::cout << "  version                                      Show version information" << std::endl;
    std::cout << "  help                                         Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration: " << CONFIG_DIR << "/facesift.conf" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  facesift detect photo.jpg --preset fast             # Quick cascade detection" << std::endl;
    std::cout << "  facesift enroll ~/faces --out gallery.bin           # Build a gallery" << std::endl;
    std::cout << "  facesift match gallery.bin frame.png                # Locate the enrolled person" << std::endl;
    std::cout << "  facesift list gallery.bin                           # Show enrolled identities" << std::endl;
}

} // namespace facesift
