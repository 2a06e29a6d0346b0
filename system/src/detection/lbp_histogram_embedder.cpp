// ============= src/detection/lbp_histogram_embedder.cpp =============
#include "detection/lbp_histogram_embedder.hpp"
#include "core/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace facematch {

LbpHistogramEmbedder::LbpHistogramEmbedder(int face_size, int grid_x, int grid_y)
    : face_size(face_size), grid_x(grid_x), grid_y(grid_y)
{
    if (face_size < 16 || grid_x < 1 || grid_y < 1) {
        throw std::invalid_argument("invalid LBPH parameters");
    }
}

// ==================== PREPROCESSING ====================

cv::Mat LbpHistogramEmbedder::preprocess(const cv::Mat& image, const BoundingBox& box) const {
    cv::Rect roi = box.to_rect() & cv::Rect(0, 0, image.cols, image.rows);
    if (roi.width <= 0 || roi.height <= 0) {
        throw RecognitionError(ErrorCode::EmbedderFailure, "face box outside the image");
    }

    cv::Mat gray;
    cv::Mat face = image(roi);
    if (face.channels() == 3) {
        cv::cvtColor(face, gray, cv::COLOR_BGR2GRAY);
    } else if (face.channels() == 4) {
        cv::cvtColor(face, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = face;
    }

    cv::Mat resized, equalized;
    cv::resize(gray, resized, cv::Size(face_size, face_size));
    cv::equalizeHist(resized, equalized);
    return equalized;
}

cv::Mat LbpHistogramEmbedder::lbp_image(const cv::Mat& gray) {
    cv::Mat dst = cv::Mat::zeros(gray.rows - 2, gray.cols - 2, CV_8UC1);

    for (int i = 1; i < gray.rows - 1; i++) {
        for (int j = 1; j < gray.cols - 1; j++) {
            uchar center = gray.at<uchar>(i, j);
            uchar code = 0;
            code |= (gray.at<uchar>(i - 1, j - 1) >= center) << 7;
            code |= (gray.at<uchar>(i - 1, j    ) >= center) << 6;
            code |= (gray.at<uchar>(i - 1, j + 1) >= center) << 5;
            code |= (gray.at<uchar>(i,     j + 1) >= center) << 4;
            code |= (gray.at<uchar>(i + 1, j + 1) >= center) << 3;
            code |= (gray.at<uchar>(i + 1, j    ) >= center) << 2;
            code |= (gray.at<uchar>(i + 1, j - 1) >= center) << 1;
            code |= (gray.at<uchar>(i,     j - 1) >= center) << 0;
            dst.at<uchar>(i - 1, j - 1) = code;
        }
    }
    return dst;
}

// ==================== EMBED ====================

Descriptor LbpHistogramEmbedder::embed(const cv::Mat& image, const BoundingBox& box) {
    if (image.empty()) {
        throw RecognitionError(ErrorCode::EmbedderFailure, "empty image");
    }

    cv::Mat lbp = lbp_image(preprocess(image, box));

    const int cell_w = lbp.cols / grid_x;
    const int cell_h = lbp.rows / grid_y;

    std::vector<float> values;
    values.reserve(descriptor_dim());

    const int channels[] = {0};
    const int hist_size[] = {256};
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    for (int gy = 0; gy < grid_y; gy++) {
        for (int gx = 0; gx < grid_x; gx++) {
            cv::Mat cell = lbp(cv::Rect(gx * cell_w, gy * cell_h, cell_w, cell_h));

            cv::Mat hist;
            cv::calcHist(&cell, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
            hist /= static_cast<float>(cell.total());

            values.insert(values.end(), hist.begin<float>(), hist.end<float>());
        }
    }

    return Descriptor(DescriptorType::Histogram, std::move(values));
}

} // namespace facematch
