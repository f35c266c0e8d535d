// Confidence gate and non-maximum suppression checks

#include "test_common.h"
#include "../src/geometry.h"
#include "../src/suppression.h"
#include <algorithm>
#include <cstdlib>

using namespace facesift;
using facesift::test::check;
using facesift::test::str;

static bool contains(const std::vector<Rect>& rects, const Rect& r) {
    return std::find(rects.begin(), rects.end(), r) != rects.end();
}

static void testScoreCandidates() {
    facesift::test::section("scoreCandidates");

    std::vector<Rect> rects = {
        Rect(0, 0, 64, 64),     // 1.0
        Rect(0, 0, 10, 10),     // 0.65
        Rect(0, 0, 20, 100),    // 0.75
        Rect(0, 0, 5, 50),      // 0.4
    };

    auto kept = scoreCandidates(rects, 0.5f);
    check(kept.size() == 3, "drops candidates below 0.5");
    check(kept.size() == 3 && kept[0].rect == rects[0] && kept[1].rect == rects[1] && kept[2].rect == rects[2],
          "input order preserved");

    auto strict = scoreCandidates(rects, 0.7f);
    check(strict.size() == 2, "higher threshold keeps fewer");

    auto boundary = scoreCandidates({Rect(0, 0, 64, 64)}, 1.0f);
    check(boundary.size() == 1, "score equal to threshold is kept");

    check(scoreCandidates({}, 0.5f).empty(), "empty input gives empty output");
}

static void testSuppressOverlaps() {
    facesift::test::section("suppressOverlaps");

    // Two overlapping equal-area boxes: input order decides
    std::vector<Rect> result = postProcessCandidates({Rect(10, 10, 100, 100), Rect(20, 20, 100, 100)}, 0.5f, 0.3f);
    check(result.size() == 1, "overlapping pair collapses to one box");
    check(result.size() == 1 && result[0] == Rect(10, 10, 100, 100), "first of equal areas survives");

    std::vector<Rect> swapped = postProcessCandidates({Rect(20, 20, 100, 100), Rect(10, 10, 100, 100)}, 0.5f, 0.3f);
    check(swapped.size() == 1 && swapped[0] == Rect(20, 20, 100, 100), "swapped input keeps the new first");

    // Larger area wins regardless of its confidence
    std::vector<DetectionCandidate> candidates = {
        {Rect(10, 10, 60, 60), 1.0f},
        {Rect(5, 5, 80, 80), 0.5f},
    };
    auto by_area = suppressOverlaps(candidates, 0.3f);
    check(by_area.size() == 1 && by_area[0] == Rect(5, 5, 80, 80), "ordering is by area, not confidence");

    // Non-overlapping boxes all survive, largest first
    auto separate = suppressOverlaps({
        {Rect(0, 0, 40, 40), 1.0f},
        {Rect(100, 0, 60, 60), 1.0f},
        {Rect(200, 0, 50, 50), 1.0f},
    }, 0.3f);
    check(separate.size() == 3, "disjoint boxes all kept");
    check(separate.size() == 3 && separate[0] == Rect(100, 0, 60, 60) && separate[2] == Rect(0, 0, 40, 40),
          "output ordered by descending area");

    // Overlap exactly at threshold is suppressed: IoU(a,b) = 1/3
    auto at_threshold = suppressOverlaps({
        {Rect(0, 0, 10, 10), 1.0f},
        {Rect(5, 0, 10, 10), 1.0f},
    }, 50.0f / 150.0f);
    check(at_threshold.size() == 1, "overlap equal to threshold suppresses");

    auto below = suppressOverlaps({
        {Rect(0, 0, 10, 10), 1.0f},
        {Rect(5, 0, 10, 10), 1.0f},
    }, 0.34f);
    check(below.size() == 2, "overlap below threshold keeps both");

    check(suppressOverlaps({}, 0.3f).empty(), "empty input gives empty output");
}

static void testSuppressionProperties() {
    facesift::test::section("suppression properties (randomized)");

    std::srand(1234);
    bool pairwise_ok = true;
    bool subset_ok = true;

    for (int trial = 0; trial < 200; trial++) {
        std::vector<Rect> rects;
        int n = 1 + std::rand() % 25;
        for (int i = 0; i < n; i++) {
            int size = 20 + std::rand() % 120;
            rects.emplace_back(std::rand() % 300, std::rand() % 300, size, size + std::rand() % 20);
        }

        const float threshold = 0.3f;
        std::vector<Rect> kept = postProcessCandidates(rects, 0.0f, threshold);

        for (size_t i = 0; i < kept.size(); i++) {
            if (!contains(rects, kept[i])) {
                subset_ok = false;
            }
            for (size_t j = i + 1; j < kept.size(); j++) {
                if (overlap(kept[i], kept[j]) >= threshold) {
                    pairwise_ok = false;
                    std::cout << "    " << str(kept[i]) << " vs " << str(kept[j]) << std::endl;
                }
            }
        }
    }

    check(pairwise_ok, "kept boxes are pairwise below the overlap threshold");
    check(subset_ok, "kept boxes are a subset of the input");
}

int main() {
    std::cout << "Suppression tests" << std::endl;
    testScoreCandidates();
    testSuppressOverlaps();
    testSuppressionProperties();
    return facesift::test::finish("test_suppression");
}
