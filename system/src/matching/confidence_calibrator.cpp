// ============= src/matching/confidence_calibrator.cpp =============
#include "matching/confidence_calibrator.hpp"
#include <algorithm>
#include <cmath>

namespace facematch {

float ConfidenceCalibrator::calibrate(float distance, float threshold, const DescriptorKind& kind) {
    if (std::isnan(distance)) return 0.0f;

    double confidence = 0.0;

    if (kind.metric == DistanceMetricType::ChiSquare) {
        // Chi-square no tiene cota superior: se escala contra el threshold
        if (threshold <= 0.0f || distance >= threshold) return 0.0f;
        confidence = (threshold - distance) / static_cast<double>(threshold) * 100.0;
    } else {
        confidence = (1.0 - distance) * 100.0;
    }

    confidence = std::clamp(confidence, 0.0, 100.0);
    return static_cast<float>(std::round(confidence * 100.0) / 100.0);
}

} // namespace facematch
