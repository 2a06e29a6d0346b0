// ============= src/detection/image_loader.cpp =============
#include "detection/image_loader.hpp"
#include "core/errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace facematch {

cv::Mat decode_image(const std::vector<uint8_t>& encoded) {
    if (encoded.empty()) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure, "empty image buffer");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(encoded, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure, e.what());
    }

    if (image.empty()) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure,
                               "could not decode " + std::to_string(encoded.size()) + " bytes");
    }
    return image;
}

cv::Mat load_image(const std::string& path) {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure, "could not load image " + path);
    }
    return image;
}

cv::Mat limit_image_size(const cv::Mat& image, int max_width, int max_height) {
    if (image.empty() || max_width <= 0 || max_height <= 0) return image;
    if (image.cols <= max_width && image.rows <= max_height) return image;

    double scale = std::min(static_cast<double>(max_width) / image.cols,
                            static_cast<double>(max_height) / image.rows);

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(), scale, scale, cv::INTER_AREA);

    spdlog::info("Resized image {}x{} -> {}x{} for processing",
                 image.cols, image.rows, resized.cols, resized.rows);
    return resized;
}

} // namespace facematch
