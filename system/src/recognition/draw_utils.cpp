// ============= src/recognition/draw_utils.cpp =============
#include "recognition/draw_utils.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace facematch {
namespace DrawUtils {

cv::Scalar confidence_color(const MatchResult& result, const DrawConfig& config) {
    if (!result.is_known) return config.unknown_color;
    if (result.confidence >= config.high_confidence) return config.high_color;
    if (result.confidence >= config.medium_confidence) return config.medium_color;
    return config.low_color;
}

std::string face_label(const MatchResult& result) {
    if (!result.is_known) return "Unknown";

    std::string label = fmt::format("{} ({:.1f}%)", result.matched_label, result.confidence);

    auto it = result.attributes.find("employee_id");
    if (it != result.attributes.end() && !it->second.empty()) {
        label += " - " + it->second;
    }
    return label;
}

std::string summary_text(const RecognitionRun& run) {
    return fmt::format("Faces: {} | Recognized: {} | Time: {:.2f}s",
                       run.total_detected, run.total_recognized,
                       run.processing_duration_ms / 1000.0);
}

void draw_text_with_background(cv::Mat& frame, const std::string& text,
                               const cv::Point& position,
                               const cv::Scalar& text_color,
                               const cv::Scalar& bg_color,
                               const DrawConfig& config) {
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(text, config.font, config.font_scale,
                                         config.thickness, &baseline);

    cv::rectangle(frame,
                 cv::Point(position.x - 5, position.y - text_size.height - 5),
                 cv::Point(position.x + text_size.width + 5, position.y + baseline + 5),
                 bg_color, cv::FILLED);

    cv::putText(frame, text, position,
               config.font, config.font_scale, text_color, config.thickness);
}

void draw_face(cv::Mat& frame, const MatchResult& result, const cv::Rect& box,
               const DrawConfig& config) {
    cv::Scalar color = confidence_color(result, config);
    int box_thickness = result.is_known ? config.known_box_thickness : config.unknown_box_thickness;

    cv::rectangle(frame, box, color, box_thickness);

    // Etiqueta en el borde inferior
    cv::rectangle(frame,
                 cv::Point(box.x, box.y + box.height - config.label_height),
                 cv::Point(box.x + box.width, box.y + box.height),
                 color, cv::FILLED);
    cv::putText(frame, face_label(result),
               cv::Point(box.x + 5, box.y + box.height - 8),
               config.font, config.font_scale, config.text_color, config.thickness);

    if (config.show_index) {
        cv::putText(frame, "#" + std::to_string(result.observation.index + 1),
                   cv::Point(box.x + 5, box.y + 20),
                   config.font, config.index_font_scale, color, config.thickness);
    }
}

cv::Mat annotate(const cv::Mat& image, const RecognitionRun& run, const DrawConfig& config) {
    if (image.empty()) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure, "cannot annotate an empty image");
    }

    cv::Mat frame;
    if (image.channels() == 1) {
        cv::cvtColor(image, frame, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, frame, cv::COLOR_BGRA2BGR);
    } else {
        frame = image.clone();
    }

    // Cajas en coordenadas de la imagen procesada
    double sx = run.image_width > 0 ? static_cast<double>(frame.cols) / run.image_width : 1.0;
    double sy = run.image_height > 0 ? static_cast<double>(frame.rows) / run.image_height : 1.0;

    for (const auto& result : run.per_face_results) {
        const BoundingBox& b = result.observation.box;
        int left = static_cast<int>(std::lround(b.left * sx));
        int top = static_cast<int>(std::lround(b.top * sy));
        int right = static_cast<int>(std::lround(b.right * sx));
        int bottom = static_cast<int>(std::lround(b.bottom * sy));

        draw_face(frame, result, cv::Rect(left, top, right - left, bottom - top), config);
    }

    if (config.show_summary) {
        DrawConfig summary = config;
        summary.font_scale = config.summary_font_scale;
        draw_text_with_background(frame, summary_text(run), cv::Point(10, 30),
                                  config.text_color, config.summary_bg, summary);
    }

    spdlog::debug("Annotated {} faces on {}x{} image",
                  run.per_face_results.size(), frame.cols, frame.rows);
    return frame;
}

}
} // namespace facematch
