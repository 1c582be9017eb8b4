#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "face_types.hpp"

namespace facemask {

struct ConfidenceExtractor {
    std::string name;
    std::function<std::optional<float>(const RawDetection&)> get;
};

// Known confidence carriers, highest priority first:
// score, score_data[0], confidence, label_scores[0].value, value.
const std::vector<ConfidenceExtractor>& default_confidence_extractors();

// Tries each extractor in order. When none yields a value the result is
// `threshold + epsilon` with measured == false. That value only says the
// detector accepted the box at `threshold`; it is not a measured score.
ScoredDetection extract_confidence(const RawDetection& det, float threshold, float epsilon,
                                   const std::vector<ConfidenceExtractor>& extractors =
                                       default_confidence_extractors());

}  // namespace facemask
