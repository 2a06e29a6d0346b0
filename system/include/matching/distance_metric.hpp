// ============= include/matching/distance_metric.hpp =============
/*
 * Metricas de distancia por DescriptorKind (menor = mas parecido)
 *
 * - Euclidean:     embeddings dlib / ArcFace   (cv::norm L2)
 * - ChiSquare:     histogramas LBPH            (cv::compareHist CHISQR_ALT)
 * - Bhattacharyya: histogramas normalizados    (cv::compareHist, rango [0,1])
 */

#pragma once
#include "core/types.hpp"
#include <memory>
#include <vector>

namespace facematch {

class DistanceMetric {
public:
    virtual ~DistanceMetric() = default;

    // Ambos vectores deben tener la misma dimension (lo garantiza la Gallery)
    virtual float distance(const std::vector<float>& a, const std::vector<float>& b) const = 0;

    virtual DistanceMetricType type() const = 0;
};

class EuclideanMetric : public DistanceMetric {
public:
    float distance(const std::vector<float>& a, const std::vector<float>& b) const override;
    DistanceMetricType type() const override { return DistanceMetricType::Euclidean; }
};

class ChiSquareMetric : public DistanceMetric {
public:
    float distance(const std::vector<float>& a, const std::vector<float>& b) const override;
    DistanceMetricType type() const override { return DistanceMetricType::ChiSquare; }
};

class BhattacharyyaMetric : public DistanceMetric {
public:
    float distance(const std::vector<float>& a, const std::vector<float>& b) const override;
    DistanceMetricType type() const override { return DistanceMetricType::Bhattacharyya; }
};

std::unique_ptr<DistanceMetric> make_metric(DistanceMetricType type);

} // namespace facematch
