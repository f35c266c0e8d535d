// Embedding primitives and enrollment aggregation checks

#include "test_common.h"
#include "../src/aggregator.h"
#include <cmath>
#include <stdexcept>

using namespace facesift;
using facesift::test::axis;
using facesift::test::check;
using facesift::test::near;

static void testPrimitives() {
    facesift::test::section("embedding primitives");

    Embedding v = {3.0f, 4.0f};
    check(near(l2Norm(v), 5.0f), "l2Norm of (3,4) is 5");
    l2Normalize(v);
    check(near(v[0], 0.6f) && near(v[1], 0.8f), "l2Normalize scales to unit length");

    Embedding zero = {0.0f, 0.0f, 0.0f};
    l2Normalize(zero);
    check(zero[0] == 0.0f && zero[1] == 0.0f && zero[2] == 0.0f, "zero vector left unchanged");

    check(near(dot(axis(4, 0), axis(4, 0)), 1.0f), "dot of identical unit vectors is 1");
    check(near(dot(axis(4, 0), axis(4, 1)), 0.0f), "dot of orthogonal vectors is 0");

    bool threw = false;
    try {
        dot(axis(3, 0), axis(4, 0));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "dot rejects length mismatch");
}

static void testAggregate() {
    facesift::test::section("aggregateEmbeddings");

    check(!aggregateEmbeddings({}).has_value(), "empty input is absent");

    auto single = aggregateEmbeddings({{2.0f, 0.0f, 0.0f}});
    check(single.has_value() && near((*single)[0], 1.0f), "single sample is returned normalized");

    std::vector<Embedding> samples = {
        {1.0f, 0.1f, 0.0f, 0.0f},
        {1.0f, -0.1f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.1f, 0.0f},
        {1.0f, 0.0f, -0.1f, 0.0f},
        {0.0f, 0.0f, 0.0f, 1.0f},   // orthogonal to the others' mean
    };

    auto kept = filterOutliers(samples, 0.3f, 2);
    check(kept.size() == 4, "orthogonal sample rejected");

    auto mean = aggregateEmbeddings(samples, 0.3f, 2);
    check(mean.has_value(), "aggregate present");
    if (mean) {
        check(near(l2Norm(*mean), 1.0f, 1e-5f), "aggregate has unit norm");
        check(std::fabs(dot(*mean, axis(4, 3))) < 1e-5f, "orthogonal sample excluded from the mean");
        check(dot(*mean, axis(4, 0)) > 0.999f, "mean points along the cluster");
    }

    auto unfiltered = filterOutliers(samples, 0.3f, 0);
    check(unfiltered.size() == 5, "zero iterations keeps everything");

    auto lenient = filterOutliers(samples, -1.0f, 2);
    check(lenient.size() == 5, "threshold -1 keeps everything");
}

static void testEdgeCases() {
    facesift::test::section("aggregation edge cases");

    // Opposite samples: the mean is zero, every dot is 0 < 0.3
    auto opposite = filterOutliers({{1.0f, 0.0f}, {-1.0f, 0.0f}}, 0.3f, 2);
    check(opposite.size() == 2, "round rejecting everything is discarded");

    auto mixed = filterOutliers({{1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f}}, 0.3f, 0);
    check(mixed.size() == 2, "sample with a different length skipped");

    auto with_empty = filterOutliers({{}, {0.0f, 5.0f}}, 0.3f, 2);
    check(with_empty.size() == 1 && near(with_empty[0][1], 1.0f), "empty sample skipped, rest normalized");

    // Two clusters 3:1 - the single far sample goes, the cluster stays
    auto clustered = filterOutliers({
        axis(3, 0), axis(3, 0), axis(3, 0), {-1.0f, 0.05f, 0.0f}
    }, 0.3f, 2);
    check(clustered.size() == 3, "minority opposite sample rejected");

    bool normalized = true;
    for (const auto& e : clustered) {
        if (!near(l2Norm(e), 1.0f, 1e-5f)) normalized = false;
    }
    check(normalized, "kept samples are normalized");
}

int main() {
    std::cout << "Aggregator tests" << std::endl;
    testPrimitives();
    testAggregate();
    testEdgeCases();
    return facesift::test::finish("test_aggregator");
}
