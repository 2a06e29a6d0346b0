// ============= include/detection/lbp_histogram_embedder.hpp =============
/*
 * Descriptor LBPH (Local Binary Pattern Histograms)
 *
 * PIPELINE:
 * - Recorte de la caja (clamp a los bordes de la imagen)
 * - Grayscale -> resize 100x100 -> equalizeHist
 * - LBP radio 1, 8 vecinos (codigos 0..255)
 * - Grid 8x8, histograma de 256 bins por celda normalizado a suma 1
 *
 * OUTPUT:
 * - Descriptor Histogram de grid_x * grid_y * 256 floats (16384)
 *
 * Se compara con ChiSquareMetric; no hay entrenamiento.
 */

#pragma once
#include "detection/face_pipeline.hpp"

namespace facematch {

class LbpHistogramEmbedder : public FaceEmbedder {
private:
    int face_size;
    int grid_x;
    int grid_y;

    cv::Mat preprocess(const cv::Mat& image, const BoundingBox& box) const;
    static cv::Mat lbp_image(const cv::Mat& gray);

public:
    LbpHistogramEmbedder(int face_size = 100, int grid_x = 8, int grid_y = 8);

    Descriptor embed(const cv::Mat& image, const BoundingBox& box) override;

    size_t descriptor_dim() const { return static_cast<size_t>(grid_x * grid_y * 256); }
};

} // namespace facematch
