#ifndef FACESIFT_IDENTITY_MATCHER_H
#define FACESIFT_IDENTITY_MATCHER_H

#include "embedding.h"
#include "gallery.h"
#include <string>
#include <vector>

namespace facesift {

constexpr float DEFAULT_MATCH_THRESHOLD = 0.35f;

enum class MatchStatus {
    NO_GALLERY,   // nothing enrolled, search not attempted
    MATCHED,      // best pair reached the threshold
    NO_MATCH      // searched, best pair rejected (or nothing comparable)
};

const char* matchStatusName(MatchStatus status);

struct MatchResult {
    MatchStatus status = MatchStatus::NO_GALLERY;
    Rect box;              // valid when MATCHED
    std::string identity;  // valid when MATCHED
    float score = 0.0f;    // best score seen (MATCHED or NO_MATCH)

    bool matched() const { return status == MatchStatus::MATCHED; }
};

// Scores every (face, identity) pair by dot product and accepts the best
// one if it reaches threshold. Faces are visited in input order, identities
// in name order; ties keep the first pair seen. Faces whose embedding
// length differs from an identity's are not compared with it.
MatchResult matchIdentity(const std::vector<FaceEmbedding>& candidates,
                          const Gallery& gallery,
                          float threshold = DEFAULT_MATCH_THRESHOLD);

} // namespace facesift

#endif // FACESIFT_IDENTITY_MATCHER_H
