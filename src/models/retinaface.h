#ifndef FACESIFT_RETINAFACE_H
#define FACESIFT_RETINAFACE_H

#include "../suppression.h"
#include <ncnn/net.h>
#include <vector>

namespace facesift {

// RetinaFace (mnet.25-opt)
// Input: "data" layer, RGB, any size
// Output: face_rpn_{cls_prob_reshape,bbox_pred}_stride{32,16,8}
// Returns boxes in input pixel coordinates, clipped to the image,
// after probability-ordered NMS.
std::vector<DetectionCandidate> detectWithRetinaFace(ncnn::Net& net, const ncnn::Mat& in,
                                                     int img_w, int img_h,
                                                     float prob_threshold = 0.8f,
                                                     float nms_threshold = 0.4f);

} // namespace facesift

#endif // FACESIFT_RETINAFACE_H
