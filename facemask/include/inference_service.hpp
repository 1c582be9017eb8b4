#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "face_types.hpp"

namespace facemask {

// Face detector backend. Implementations are not required to be reentrant;
// InferenceAdapter guarantees a single caller at a time.
class FaceInferenceService {
public:
    virtual ~FaceInferenceService() = default;

    // Loads the model on first use, updates the score threshold on later calls.
    virtual void initialize(float confidence_threshold) = 0;

    // Runs the detector on a BGR surface. Boxes are normalized to the surface size.
    virtual std::vector<RawDetection> infer(const cv::Mat& surface) = 0;

    virtual std::string name() const = 0;
};

}  // namespace facemask
