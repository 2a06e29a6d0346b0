// ============= include/detection/image_loader.hpp =============
#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace facematch {

// Decodifica JPEG/PNG/BMP desde memoria (cv::imdecode).
// Lanza RecognitionError(ImageDecodeFailure) si no se puede leer.
cv::Mat decode_image(const std::vector<uint8_t>& encoded);

// Carga desde disco; mismo contrato que decode_image
cv::Mat load_image(const std::string& path);

// Reduce (manteniendo aspecto) si excede max_width x max_height.
// Devuelve la misma imagen si ya entra.
cv::Mat limit_image_size(const cv::Mat& image, int max_width, int max_height);

} // namespace facematch
