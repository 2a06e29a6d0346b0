// ============= src/matching/distance_metric.cpp =============
#include "matching/distance_metric.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace facematch {

namespace {

// Vista sin copia sobre el vector (compareHist / norm solo leen)
cv::Mat as_row(const std::vector<float>& v) {
    return cv::Mat(1, static_cast<int>(v.size()), CV_32F, const_cast<float*>(v.data()));
}

void check_sizes(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        throw std::invalid_argument("descriptor size mismatch: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }
}

} // namespace

float EuclideanMetric::distance(const std::vector<float>& a, const std::vector<float>& b) const {
    check_sizes(a, b);
    return static_cast<float>(cv::norm(as_row(a), as_row(b), cv::NORM_L2));
}

float ChiSquareMetric::distance(const std::vector<float>& a, const std::vector<float>& b) const {
    check_sizes(a, b);
    // Misma variante que usa LBPHFaceRecognizer::predict
    return static_cast<float>(cv::compareHist(as_row(a), as_row(b), cv::HISTCMP_CHISQR_ALT));
}

float BhattacharyyaMetric::distance(const std::vector<float>& a, const std::vector<float>& b) const {
    check_sizes(a, b);
    return static_cast<float>(cv::compareHist(as_row(a), as_row(b), cv::HISTCMP_BHATTACHARYYA));
}

std::unique_ptr<DistanceMetric> make_metric(DistanceMetricType type) {
    switch (type) {
        case DistanceMetricType::Euclidean:     return std::make_unique<EuclideanMetric>();
        case DistanceMetricType::ChiSquare:     return std::make_unique<ChiSquareMetric>();
        case DistanceMetricType::Bhattacharyya: return std::make_unique<BhattacharyyaMetric>();
    }
    throw std::invalid_argument("unknown distance metric");
}

} // namespace facematch
