#ifndef FACESIFT_CLI_COMMANDS_H
#define FACESIFT_CLI_COMMANDS_H

#include <string>
#include <vector>

namespace facesift {

/**
 * Command Functions for the facesift CLI
 *
 * Each command function returns:
 *   - 0 on success
 *   - 1 on failure
 */

/**
 * Detect faces in an image file and print their boxes
 *
 * @param args [0] = image path, optional "--preset fast|accurate"
 * @return 0 on success, 1 on failure
 */
int cmd_detect(const std::vector<std::string>& args);

/**
 * Enroll every identity directory under a faces directory
 *
 * @param args optional faces directory (default: [enrollment] faces_dir or FACES_DIR),
 *             optional "--out <gallery.bin>" to save the result
 * @return 0 if at least one identity was enrolled, 1 otherwise
 */
int cmd_enroll(const std::vector<std::string>& args);

/**
 * Locate the enrolled face in an image (or every face if the gallery is empty)
 *
 * @param gallery_path Gallery file written by "enroll --out"
 * @param image_path   Image to search
 * @return 0 on success (including "no match"), 1 on error
 */
int cmd_match(const std::string& gallery_path, const std::string& image_path);

/**
 * List identities stored in a gallery file
 *
 * @param gallery_path Gallery file
 * @return 0 on success, 1 on failure
 */
int cmd_list(const std::string& gallery_path);

/**
 * Print usage information and command help
 */
void print_usage();

} // namespace facesift

#endif // FACESIFT_CLI_COMMANDS_H
