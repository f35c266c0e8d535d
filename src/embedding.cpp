#include "embedding.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace facesift {

float l2Norm(const Embedding& v) {
    double sum = 0.0;
    for (float val : v) {
        sum += static_cast<double>(val) * val;
    }
    return static_cast<float>(std::sqrt(sum));
}

void l2Normalize(Embedding& v) {
    float norm = l2Norm(v);
    if (norm > 0.0f) {
        for (float& val : v) {
            val /= norm;
        }
    }
}

Embedding normalized(Embedding v) {
    l2Normalize(v);
    return v;
}

float dot(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Embedding size mismatch: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return static_cast<float>(sum);
}

} // namespace facesift
