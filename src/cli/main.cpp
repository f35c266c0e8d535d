#include <iostream>
#include <string>
#include <vector>
#include "commands.h"
#include "config_paths.h"

using namespace facesift;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-v") {
        std::cout << "facesift version " << VERSION << std::endl;
        return 0;
    }

    if (command == "detect") {
        return cmd_detect(args);
    }

    if (command == "enroll") {
        return cmd_enroll(args);
    }

    if (command == "match") {
        if (args.size() < 2) {
            std::cerr << "Error: gallery and image required" << std::endl;
            std::cerr << "Usage: facesift match <gallery.bin> <image>" << std::endl;
            return 1;
        }
        return cmd_match(args[0], args[1]);
    }

    if (command == "list") {
        if (args.empty()) {
            std::cerr << "Error: gallery file required" << std::endl;
            std::cerr << "Usage: facesift list <gallery.bin>" << std::endl;
            return 1;
        }
        return cmd_list(args[0]);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
