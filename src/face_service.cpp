#include "face_service.h"
#include "config.h"
#include "frame_converter.h"
#include "geometry.h"
#include "logger.h"

namespace facesift {

RecognitionOptions RecognitionOptions::fromConfig(const Config& config) {
    RecognitionOptions options;
    if (auto threshold = config.getDouble("recognition", "threshold")) {
        options.threshold = static_cast<float>(*threshold);
    }
    return options;
}

FaceService::FaceService(DetectionPipeline& pipeline, EmbeddingModel* model,
                         GalleryRegistry& registry, RecognitionOptions options)
    : pipeline_(pipeline), model_(model), registry_(registry), options_(options) {}

FrameFaces FaceService::locate(const ImageView& frame, const DetectionOptions& options) {
    FrameFaces result;
    std::shared_ptr<const Gallery> gallery = registry_.snapshot();

    if (gallery->empty() || model_ == nullptr) {
        result.status = MatchStatus::NO_GALLERY;
        DetectionResult detection = pipeline_.detect(frame, options);
        if (detection.ok) {
            result.faces = std::move(detection.faces);
        }
        return result;
    }

    if (!model_->available()) {
        throw ModelUnavailableError("Embedding model unavailable: " + model_->name());
    }

    if (frame.empty()) {
        result.status = MatchStatus::NO_MATCH;
        return result;
    }

    MatchResult match;
    try {
        std::vector<FaceEmbedding> candidates;
        if (frame.channels() == 3) {
            candidates = model_->embed(frame);
        } else {
            Image bgr = toBGR(frame);
            candidates = model_->embed(bgr.view());
        }
        match = matchIdentity(candidates, *gallery, options_.threshold);
    } catch (const ModelUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("Identity search failed: ") + e.what());
        result.status = MatchStatus::NO_MATCH;
        return result;
    }

    result.status = match.status;
    result.score = match.score;
    if (match.matched()) {
        result.identity = match.identity;
        result.faces.push_back(clampToFrame(match.box, frame.width(), frame.height()));
    }
    return result;
}

} // namespace facesift
