// ============= include/detection/cascade_detector.hpp =============
/*
 * Detector Haar cascade (OpenCV)
 *
 * - Grayscale + detectMultiScale(scale 1.1, neighbors 5, min 30x30)
 * - Devuelve las cajas en el orden de OpenCV, sin reordenar
 * - CascadeClassifier no es thread-safe: detect() serializa con mutex
 */

#pragma once
#include "detection/face_pipeline.hpp"
#include "core/config.hpp"
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>

namespace facematch {

class CascadeFaceDetector : public FaceDetector {
private:
    cv::CascadeClassifier cascade;
    std::mutex cascade_mutex;

    double scale_factor;
    int min_neighbors;
    int min_size;

public:
    // Lanza RecognitionError(DetectorUnavailable) si el XML no carga
    explicit CascadeFaceDetector(const DetectorConfig& config);

    std::vector<BoundingBox> detect(const cv::Mat& image) override;
};

} // namespace facematch
