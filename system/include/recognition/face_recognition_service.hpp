// ============= include/recognition/face_recognition_service.hpp =============
/*
 * Face Recognition Service - orquestador
 *
 * PIPELINE recognize():
 *   decode -> limit size -> detect -> truncar a max_faces
 *          -> embed + match por cara (ThreadPool) -> agregar -> history
 *
 * GARANTÍAS:
 * - Un run usa un unico snapshot de Gallery (fijado antes de detectar)
 * - Resultados en orden de indice del detector, no de finalizacion
 * - Fallo del embedder en una cara -> esa cara queda "unknown"
 * - Fallo del history sink -> se loguea y se descarta
 * - Cancelacion entre matches -> RecognitionError(Cancelled), sin history
 *
 * ERRORES DE TODA LA LLAMADA:
 * - ImageDecodeFailure, DetectorUnavailable, Cancelled
 */

#pragma once
#include "core/cancel_token.hpp"
#include "core/config.hpp"
#include "core/thread_pool.hpp"
#include "core/types.hpp"
#include "database/history_sink.hpp"
#include "detection/face_pipeline.hpp"
#include "gallery/gallery.hpp"
#include "matching/matcher.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace facematch {

struct SystemInfo {
    uint64_t gallery_version = 0;
    size_t known_faces = 0;
    DescriptorKind kind;
    float threshold = 0.0f;
    int max_faces = 0;
    int worker_threads = 0;
    int max_image_width = 0;
    int max_image_height = 0;
};

class FaceRecognitionService {
public:
    FaceRecognitionService(std::shared_ptr<FaceDetector> detector,
                           std::shared_ptr<FaceEmbedder> embedder,
                           std::shared_ptr<HistorySink> history,
                           const RecognitionConfig& config = RecognitionConfig(),
                           const DetectorConfig& detector_config = DetectorConfig(),
                           std::unique_ptr<Matcher> matcher = nullptr);
    ~FaceRecognitionService();

    FaceRecognitionService(const FaceRecognitionService&) = delete;
    FaceRecognitionService& operator=(const FaceRecognitionService&) = delete;

    // ===== RECOGNITION =====

    RecognitionRun recognize(const cv::Mat& image,
                             const GallerySnapshot& gallery,
                             const RecognitionConfig& config,
                             const CancelToken* cancel = nullptr,
                             const std::string& source = "") const;

    RecognitionRun recognize(const std::vector<uint8_t>& encoded,
                             const GallerySnapshot& gallery,
                             const RecognitionConfig& config,
                             const CancelToken* cancel = nullptr,
                             const std::string& source = "") const;

    // Toma el snapshot publicado y usa la config del servicio
    RecognitionRun recognize(const cv::Mat& image,
                             const GalleryRegistry& registry,
                             const CancelToken* cancel = nullptr,
                             const std::string& source = "") const;

    // ===== ENROLLMENT =====

    // Exactamente una cara; lanza NoFaceDetected / MultipleFacesDetected /
    // EmbedderFailure / MixedDescriptorKind / DetectorUnavailable
    Descriptor prepare_entry(const cv::Mat& image, const DescriptorKind& kind) const;

    // ===== INFO =====

    SystemInfo system_info(const Gallery& gallery) const;
    const RecognitionConfig& config() const { return default_config; }

private:
    std::shared_ptr<FaceDetector> detector;
    std::shared_ptr<FaceEmbedder> embedder;
    std::shared_ptr<HistorySink> history;
    std::unique_ptr<Matcher> matcher;
    std::unique_ptr<ThreadPool> pool;

    RecognitionConfig default_config;
    DetectorConfig detector_config;

    std::vector<BoundingBox> run_detector(const cv::Mat& image) const;

    // nullopt si el run se cancelo antes del match
    std::optional<MatchResult> process_face(const cv::Mat& image,
                                            const BoundingBox& box,
                                            int index,
                                            const Gallery& gallery,
                                            float threshold,
                                            const CancelToken& cancel) const;

    void emit_history(const RecognitionRun& run) const;
};

} // namespace facematch
