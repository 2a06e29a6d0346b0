// ============= include/detection/face_pipeline.hpp =============
/*
 * Interfaces de los colaboradores externos
 *
 * FaceDetector::detect()  -> cajas en el orden del detector
 * FaceEmbedder::embed()   -> Descriptor de una caja (lanza si falla)
 *
 * Ambas pueden llamarse desde varios threads a la vez; cada
 * implementacion se encarga de su propia sincronizacion.
 */

#pragma once
#include "core/types.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace facematch {

class FaceDetector {
public:
    virtual ~FaceDetector() = default;
    virtual std::vector<BoundingBox> detect(const cv::Mat& image) = 0;
};

class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;
    virtual Descriptor embed(const cv::Mat& image, const BoundingBox& box) = 0;
};

} // namespace facematch
