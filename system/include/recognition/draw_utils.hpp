// ============= include/recognition/draw_utils.hpp =============
/*
 * Draw Utils - imagen anotada de un RecognitionRun
 *
 * Por cara:
 * - Caja coloreada segun confianza (mas gruesa si es conocida)
 *     >= 80%  verde
 *     >= 50%  naranja
 *     <  50%  amarillo
 *     unknown rojo
 * - Etiqueta "nombre (xx.x%) - employee_id" sobre fondo de color
 *   en el borde inferior de la caja
 * - "#n" junto a la esquina superior izquierda
 *
 * Arriba a la izquierda un resumen:
 *   "Faces: N | Recognized: M | Time: X.XXs" sobre fondo negro
 *
 * Las cajas del run estan en coordenadas de la imagen procesada
 * (image_width x image_height); si la imagen recibida tiene otro
 * tamaño se escalan.
 */

#pragma once
#include "core/types.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

namespace facematch {
namespace DrawUtils {

    struct DrawConfig {
        bool show_summary = true;
        bool show_index = true;

        // BGR
        cv::Scalar high_color = cv::Scalar(0, 255, 0);
        cv::Scalar medium_color = cv::Scalar(0, 165, 255);
        cv::Scalar low_color = cv::Scalar(0, 255, 255);
        cv::Scalar unknown_color = cv::Scalar(0, 0, 255);
        cv::Scalar text_color = cv::Scalar(255, 255, 255);
        cv::Scalar summary_bg = cv::Scalar(0, 0, 0);

        float high_confidence = 80.0f;
        float medium_confidence = 50.0f;

        int font = cv::FONT_HERSHEY_SIMPLEX;
        double font_scale = 0.6;
        double index_font_scale = 0.5;
        double summary_font_scale = 0.7;
        int thickness = 2;
        int known_box_thickness = 3;
        int unknown_box_thickness = 2;
        int label_height = 35;
    };

    cv::Scalar confidence_color(const MatchResult& result,
                                const DrawConfig& config = DrawConfig());

    // "Alice (95.0%) - E-001", "Unknown"
    std::string face_label(const MatchResult& result);

    std::string summary_text(const RecognitionRun& run);

    void draw_text_with_background(cv::Mat& frame, const std::string& text,
                                   const cv::Point& position,
                                   const cv::Scalar& text_color,
                                   const cv::Scalar& bg_color,
                                   const DrawConfig& config = DrawConfig());

    void draw_face(cv::Mat& frame, const MatchResult& result, const cv::Rect& box,
                   const DrawConfig& config = DrawConfig());

    // Copia BGR anotada; la imagen de entrada no se modifica.
    // Lanza RecognitionError(ImageDecodeFailure) si la imagen esta vacia
    cv::Mat annotate(const cv::Mat& image, const RecognitionRun& run,
                     const DrawConfig& config = DrawConfig());
}
} // namespace facematch
