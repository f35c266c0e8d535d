#include "aggregator.h"
#include "logger.h"
#include <string>

namespace facesift {

Embedding meanEmbedding(const std::vector<Embedding>& samples) {
    if (samples.empty()) {
        return {};
    }

    const size_t dim = samples.front().size();
    std::vector<double> sum(dim, 0.0);
    for (const auto& sample : samples) {
        for (size_t i = 0; i < dim; i++) {
            sum[i] += sample[i];
        }
    }

    Embedding mean(dim);
    for (size_t i = 0; i < dim; i++) {
        mean[i] = static_cast<float>(sum[i] / samples.size());
    }
    l2Normalize(mean);
    return mean;
}

std::vector<Embedding> filterOutliers(const std::vector<Embedding>& samples,
                                      float outlier_threshold, int max_iterations) {
    std::vector<Embedding> kept;
    kept.reserve(samples.size());

    for (size_t i = 0; i < samples.size(); i++) {
        const auto& sample = samples[i];
        if (sample.empty()) {
            Logger::getInstance().warning("Skipping empty embedding sample #" + std::to_string(i));
            continue;
        }
        if (!kept.empty() && sample.size() != kept.front().size()) {
            Logger::getInstance().warning("Skipping embedding sample #" + std::to_string(i) +
                ": dimension " + std::to_string(sample.size()) + " != " +
                std::to_string(kept.front().size()));
            continue;
        }
        kept.push_back(normalized(sample));
    }

    for (int round = 0; round < max_iterations; round++) {
        if (kept.size() <= 1) {
            break;
        }

        Embedding mean = meanEmbedding(kept);

        std::vector<Embedding> next;
        next.reserve(kept.size());
        for (auto& sample : kept) {
            if (dot(sample, mean) >= outlier_threshold) {
                next.push_back(sample);
            }
        }

        if (next.size() == kept.size()) {
            break;
        }
        if (next.empty()) {
            Logger::getInstance().debug("Outlier round " + std::to_string(round + 1) +
                " would reject every sample, keeping " + std::to_string(kept.size()));
            break;
        }

        Logger::getInstance().debug("Outlier round " + std::to_string(round + 1) + ": dropped " +
            std::to_string(kept.size() - next.size()) + " of " + std::to_string(kept.size()));
        kept = std::move(next);
    }

    return kept;
}

std::optional<Embedding> aggregateEmbeddings(const std::vector<Embedding>& samples,
                                             float outlier_threshold, int max_iterations) {
    std::vector<Embedding> kept = filterOutliers(samples, outlier_threshold, max_iterations);
    if (kept.empty()) {
        return std::nullopt;
    }
    return meanEmbedding(kept);
}

} // namespace facesift
