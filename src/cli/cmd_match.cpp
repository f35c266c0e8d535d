#include "commands.h"
#include "cli_common.h"
#include "../face_service.h"
#include "../image_decoder.h"
#include "../models/gallery_store.h"
#include "../models/ncnn_embedder.h"

namespace facesift {

using namespace facesift::cli;

int cmd_match(const std::string& gallery_path, const std::string& image_path) {
    Config& config = loadDefaultConfig();

    Gallery gallery;
    if (!GalleryStore::load(gallery_path, gallery)) {
        std::cerr << "Error: cannot read gallery: " << gallery_path << std::endl;
        return 1;
    }
    GalleryRegistry registry(std::move(gallery));

    Image image;
    if (!decodeImageFile(image_path, image)) {
        std::cerr << "Error: failed to load image: " << image_path << std::endl;
        return 1;
    }

    auto pipeline = createPipeline(config);
    if (!pipeline) {
        return 1;
    }

    std::unique_ptr<NcnnEmbedder> embedder;
    if (registry.size() > 0) {
        embedder = std::make_unique<NcnnEmbedder>(NcnnEmbedderOptions::fromConfig(config));
        InitReport report = embedder->initialize();
        if (!report.ok()) {
            std::cerr << "Error: recognition model unavailable: " << report.summary() << std::endl;
            return 1;
        }
    }

    FaceService service(*pipeline, embedder.get(), registry, RecognitionOptions::fromConfig(config));

    FrameFaces result;
    try {
        result = service.locate(image.view(), DetectionOptions::fromConfig(config));
    } catch (const ModelUnavailableError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << image_path << ": " << matchStatusName(result.status);
    if (result.status == MatchStatus::MATCHED) {
        std::cout << " " << result.identity << " (score " << std::fixed << std::setprecision(3)
                  << result.score << ")";
    } else if (result.status == MatchStatus::NO_MATCH) {
        std::cout << " (best score " << std::fixed << std::setprecision(3) << result.score << ")";
    }
    std::cout << ", " << result.faces.size() << " face(s)" << std::endl;
    printFaces(result.faces);

    return 0;
}

} // namespace facesift
