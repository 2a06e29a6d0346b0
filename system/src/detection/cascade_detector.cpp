// ============= src/detection/cascade_detector.cpp =============
#include "detection/cascade_detector.hpp"
#include "core/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace facematch {

CascadeFaceDetector::CascadeFaceDetector(const DetectorConfig& config)
    : scale_factor(config.scale_factor),
      min_neighbors(config.min_neighbors),
      min_size(config.min_size)
{
    spdlog::info("Inicializando Haar cascade detector");
    spdlog::info("   Cascade: {}", config.cascade_path);

    if (!cascade.load(config.cascade_path)) {
        throw RecognitionError(ErrorCode::DetectorUnavailable,
                               "cannot load cascade " + config.cascade_path);
    }

    spdlog::info("✓ Detector ready (scale={:.2f}, neighbors={}, min={}px)",
                 scale_factor, min_neighbors, min_size);
}

std::vector<BoundingBox> CascadeFaceDetector::detect(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    std::vector<cv::Rect> faces;
    {
        std::lock_guard<std::mutex> lock(cascade_mutex);
        cascade.detectMultiScale(gray, faces, scale_factor, min_neighbors, 0,
                                 cv::Size(min_size, min_size));
    }

    std::vector<BoundingBox> boxes;
    boxes.reserve(faces.size());
    for (const auto& r : faces) {
        boxes.push_back(BoundingBox::from_rect(r));
    }

    spdlog::debug("Cascade: {} faces in {}x{}", boxes.size(), image.cols, image.rows);
    return boxes;
}

} // namespace facematch
