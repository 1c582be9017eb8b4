#include "confidence.hpp"

#include <algorithm>

namespace facemask {

const std::vector<ConfidenceExtractor>& default_confidence_extractors() {
    static const std::vector<ConfidenceExtractor> extractors = {
        {"score", [](const RawDetection& d) { return d.score; }},
        {"score_data",
         [](const RawDetection& d) -> std::optional<float> {
             if (d.score_data.empty()) return std::nullopt;
             return d.score_data.front();
         }},
        {"confidence", [](const RawDetection& d) { return d.confidence; }},
        {"label_scores",
         [](const RawDetection& d) -> std::optional<float> {
             if (d.label_scores.empty()) return std::nullopt;
             return d.label_scores.front().value;
         }},
        {"value", [](const RawDetection& d) { return d.value; }},
    };
    return extractors;
}

ScoredDetection extract_confidence(const RawDetection& det, float threshold, float epsilon,
                                   const std::vector<ConfidenceExtractor>& extractors) {
    ScoredDetection out;
    out.box = det.box;
    for (const auto& ex : extractors) {
        if (auto value = ex.get(det)) {
            out.confidence = std::clamp(*value, 0.0f, 1.0f);
            out.measured = true;
            return out;
        }
    }
    out.confidence = std::clamp(threshold + epsilon, 0.0f, 1.0f);
    out.measured = false;
    return out;
}

}  // namespace facemask
