// RetinaFace face detector
// Reference: https://github.com/deepinsight/insightface/tree/master/detection/retinaface

#include "retinaface.h"
#include "../geometry.h"
#include "../logger.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace facesift {

namespace {

struct StrideConfig {
    int feat_stride;
    float scales[2];
};

// Anchors for one feature stride (single 1:1 ratio, two scales)
ncnn::Mat generateAnchors(int base_size, const float* scales, int num_scale) {
    ncnn::Mat anchors;
    anchors.create(4, num_scale);

    const float cx = base_size * 0.5f;
    const float cy = base_size * 0.5f;

    for (int j = 0; j < num_scale; j++) {
        float rs = base_size * scales[j];

        float* anchor = anchors.row(j);
        anchor[0] = cx - rs * 0.5f;
        anchor[1] = cy - rs * 0.5f;
        anchor[2] = cx + rs * 0.5f;
        anchor[3] = cy + rs * 0.5f;
    }

    return anchors;
}

void generateProposals(const ncnn::Mat& anchors, int feat_stride, const ncnn::Mat& score_blob,
                       const ncnn::Mat& bbox_blob, float prob_threshold,
                       std::vector<DetectionCandidate>& proposals) {
    const int w = score_blob.w;
    const int h = score_blob.h;
    const int num_anchors = anchors.h;

    for (int q = 0; q < num_anchors; q++) {
        const float* anchor = anchors.row(q);
        const ncnn::Mat score = score_blob.channel(q + num_anchors);
        const ncnn::Mat bbox = bbox_blob.channel_range(q * 4, 4);

        float anchor_y = anchor[1];
        const float anchor_w = anchor[2] - anchor[0];
        const float anchor_h = anchor[3] - anchor[1];

        for (int i = 0; i < h; i++) {
            float anchor_x = anchor[0];

            for (int j = 0; j < w; j++) {
                const int index = i * w + j;
                const float prob = score[index];

                if (prob >= prob_threshold) {
                    float dx = bbox.channel(0)[index];
                    float dy = bbox.channel(1)[index];
                    float dw = bbox.channel(2)[index];
                    float dh = bbox.channel(3)[index];

                    float cx = anchor_x + anchor_w * 0.5f;
                    float cy = anchor_y + anchor_h * 0.5f;

                    float pb_cx = cx + anchor_w * dx;
                    float pb_cy = cy + anchor_h * dy;
                    float pb_w = anchor_w * std::exp(dw);
                    float pb_h = anchor_h * std::exp(dh);

                    float x0 = pb_cx - pb_w * 0.5f;
                    float y0 = pb_cy - pb_h * 0.5f;
                    float x1 = pb_cx + pb_w * 0.5f;
                    float y1 = pb_cy + pb_h * 0.5f;

                    DetectionCandidate candidate;
                    candidate.rect = Rect(static_cast<int>(x0), static_cast<int>(y0),
                                          static_cast<int>(x1 - x0 + 1), static_cast<int>(y1 - y0 + 1));
                    candidate.confidence = prob;
                    proposals.push_back(candidate);
                }

                anchor_x += feat_stride;
            }

            anchor_y += feat_stride;
        }
    }
}

// Greedy NMS over proposals already sorted by descending probability
std::vector<DetectionCandidate> nmsSorted(const std::vector<DetectionCandidate>& sorted, float nms_threshold) {
    std::vector<DetectionCandidate> picked;
    for (const auto& candidate : sorted) {
        bool keep = true;
        for (const auto& kept : picked) {
            if (overlap(candidate.rect, kept.rect) > nms_threshold) {
                keep = false;
                break;
            }
        }
        if (keep) {
            picked.push_back(candidate);
        }
    }
    return picked;
}

} // namespace

std::vector<DetectionCandidate> detectWithRetinaFace(ncnn::Net& net, const ncnn::Mat& in,
                                                     int img_w, int img_h,
                                                     float prob_threshold, float nms_threshold) {
    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    ex.input("data", in);

    static const StrideConfig strides[] = {
        {32, {32.f, 16.f}},
        {16, {8.f, 4.f}},
        {8, {2.f, 1.f}},
    };

    std::vector<DetectionCandidate> proposals;
    for (const auto& stride : strides) {
        const std::string suffix = "_stride" + std::to_string(stride.feat_stride);

        ncnn::Mat score_blob, bbox_blob;
        if (ex.extract(("face_rpn_cls_prob_reshape" + suffix).c_str(), score_blob) != 0 ||
            ex.extract(("face_rpn_bbox_pred" + suffix).c_str(), bbox_blob) != 0) {
            Logger::getInstance().warning("RetinaFace: missing outputs for stride " +
                                          std::to_string(stride.feat_stride));
            continue;
        }

        ncnn::Mat anchors = generateAnchors(16, stride.scales, 2);
        generateProposals(anchors, stride.feat_stride, score_blob, bbox_blob, prob_threshold, proposals);
    }

    std::stable_sort(proposals.begin(), proposals.end(),
                     [](const DetectionCandidate& a, const DetectionCandidate& b) {
                         return a.confidence > b.confidence;
                     });

    std::vector<DetectionCandidate> faces;
    for (auto& obj : nmsSorted(proposals, nms_threshold)) {
        // Clip to image size
        float x0 = static_cast<float>(obj.rect.x);
        float y0 = static_cast<float>(obj.rect.y);
        float x1 = x0 + obj.rect.width;
        float y1 = y0 + obj.rect.height;

        x0 = std::max(std::min(x0, (float)img_w - 1), 0.f);
        y0 = std::max(std::min(y0, (float)img_h - 1), 0.f);
        x1 = std::max(std::min(x1, (float)img_w - 1), 0.f);
        y1 = std::max(std::min(y1, (float)img_h - 1), 0.f);

        obj.rect = Rect(static_cast<int>(x0), static_cast<int>(y0),
                        static_cast<int>(x1 - x0), static_cast<int>(y1 - y0));

        if (!obj.rect.empty()) {
            faces.push_back(obj);
        }
    }

    return faces;
}

} // namespace facesift
