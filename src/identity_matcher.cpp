#include "identity_matcher.h"
#include "logger.h"
#include <limits>

namespace facesift {

const char* matchStatusName(MatchStatus status) {
    switch (status) {
        case MatchStatus::NO_GALLERY: return "no_gallery";
        case MatchStatus::MATCHED: return "matched";
        case MatchStatus::NO_MATCH: return "no_match";
    }
    return "unknown";
}

MatchResult matchIdentity(const std::vector<FaceEmbedding>& candidates,
                          const Gallery& gallery,
                          float threshold) {
    MatchResult result;
    if (gallery.empty()) {
        result.status = MatchStatus::NO_GALLERY;
        return result;
    }

    const FaceEmbedding* best_face = nullptr;
    const Identity* best_identity = nullptr;
    float best_score = -std::numeric_limits<float>::infinity();
    size_t skipped = 0;

    for (const auto& face : candidates) {
        for (const auto& entry : gallery) {
            const Identity& identity = entry.second;
            if (face.embedding.empty() || face.embedding.size() != identity.mean_embedding.size()) {
                skipped++;
                continue;
            }

            float score = dot(face.embedding, identity.mean_embedding);
            if (score > best_score) {
                best_score = score;
                best_face = &face;
                best_identity = &identity;
            }
        }
    }

    if (skipped > 0) {
        Logger::getInstance().debug("Identity match skipped " + std::to_string(skipped) +
                                    " pair(s) with mismatched dimensions");
    }

    if (best_face == nullptr) {
        result.status = MatchStatus::NO_MATCH;
        return result;
    }

    result.score = best_score;
    if (best_score >= threshold) {
        result.status = MatchStatus::MATCHED;
        result.box = best_face->box;
        result.identity = best_identity->name;
        Logger::getInstance().debug("Matched " + result.identity + " (score " +
                                    std::to_string(best_score) + ")");
    } else {
        result.status = MatchStatus::NO_MATCH;
        Logger::getInstance().debug("Best match " + best_identity->name + " rejected (score " +
                                    std::to_string(best_score) + " < " + std::to_string(threshold) + ")");
    }
    return result;
}

} // namespace facesift
