// ============= src/recognition/face_recognition_service.cpp =============
#include "recognition/face_recognition_service.hpp"
#include "core/errors.hpp"
#include "core/scoped_timer.hpp"
#include "detection/image_loader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

namespace facematch {

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

FaceRecognitionService::FaceRecognitionService(std::shared_ptr<FaceDetector> detector,
                                               std::shared_ptr<FaceEmbedder> embedder,
                                               std::shared_ptr<HistorySink> history,
                                               const RecognitionConfig& config,
                                               const DetectorConfig& detector_config,
                                               std::unique_ptr<Matcher> matcher)
    : detector(std::move(detector)),
      embedder(std::move(embedder)),
      history(std::move(history)),
      matcher(std::move(matcher)),
      default_config(config),
      detector_config(detector_config)
{
    if (!this->matcher) {
        this->matcher = std::make_unique<LinearScanMatcher>();
    }

    if (config.worker_threads > 1) {
        pool = std::make_unique<ThreadPool>(static_cast<size_t>(config.worker_threads));
    }

    spdlog::info("🎭 Face Recognition Service ready");
    spdlog::info("   Threshold: {:.2f}, max faces: {}, workers: {}",
                 config.threshold, config.max_faces, config.worker_threads);
    spdlog::info("   History: {}", this->history ? "enabled" : "disabled");
}

FaceRecognitionService::~FaceRecognitionService() {
    if (pool) pool->stop();
}

// ==================== DETECTION ====================

std::vector<BoundingBox> FaceRecognitionService::run_detector(const cv::Mat& image) const {
    if (!detector) {
        throw RecognitionError(ErrorCode::DetectorUnavailable, "no face detector configured");
    }

    try {
        return detector->detect(image);
    } catch (const RecognitionError&) {
        throw;
    } catch (const std::exception& e) {
        throw RecognitionError(ErrorCode::DetectorUnavailable, e.what());
    }
}

// ==================== PER FACE ====================

std::optional<MatchResult> FaceRecognitionService::process_face(const cv::Mat& image,
                                                                const BoundingBox& box,
                                                                int index,
                                                                const Gallery& gallery,
                                                                float threshold,
                                                                const CancelToken& cancel) const
{
    MatchResult unknown;
    unknown.observation.index = index;
    unknown.observation.box = box;

    Descriptor descriptor;
    try {
        if (!embedder) {
            throw RecognitionError(ErrorCode::EmbedderFailure, "no face embedder configured");
        }
        descriptor = embedder->embed(image, box);
    } catch (const std::exception& e) {
        spdlog::warn("Face {}: embedder failed: {}", index, e.what());
        unknown.error = e.what();
        return unknown;
    }

    if (cancel.is_cancelled()) {
        return std::nullopt;
    }

    MatchResult result;
    try {
        result = matcher->match(descriptor, gallery, threshold);
    } catch (const std::exception& e) {
        // Descriptor con forma incorrecta: cuenta como fallo del embedder
        spdlog::warn("Face {}: cannot match descriptor: {}", index, e.what());
        unknown.error = e.what();
        return unknown;
    }

    result.observation.index = index;
    result.observation.box = box;
    return result;
}

// ==================== HISTORY ====================

void FaceRecognitionService::emit_history(const RecognitionRun& run) const {
    if (!history) return;

    try {
        history->append(run);
    } catch (const std::exception& e) {
        spdlog::warn("History append failed, run dropped: {}", e.what());
    }
}

// ==================== RECOGNIZE ====================

RecognitionRun FaceRecognitionService::recognize(const cv::Mat& input,
                                                 const GallerySnapshot& gallery,
                                                 const RecognitionConfig& config,
                                                 const CancelToken* cancel,
                                                 const std::string& source) const
{
    ScopedTimer timer("recognize");

    if (!gallery) {
        throw RecognitionError(ErrorCode::InvalidEntry, "no gallery snapshot");
    }
    if (input.empty()) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure, "empty image");
    }

    CancelToken local_token;
    if (!cancel && config.timeout_ms > 0) {
        local_token.set_deadline(CancelToken::Clock::now() +
                                 std::chrono::milliseconds(config.timeout_ms));
    }
    const CancelToken& token = cancel ? *cancel : local_token;

    cv::Mat image = limit_image_size(input, detector_config.max_width, detector_config.max_height);

    RecognitionRun run;
    run.timestamp = std::chrono::system_clock::now();
    run.gallery_version = gallery->version();
    run.source = source;
    run.image_width = image.cols;
    run.image_height = image.rows;

    if (gallery->empty()) {
        spdlog::warn("Gallery v{} is empty - every face will be unknown", gallery->version());
    }

    // 1. Deteccion
    std::vector<BoundingBox> boxes = run_detector(image);
    run.detected_before_truncation = static_cast<int>(boxes.size());

    // 2. Limite de caras (prefijo estable)
    const int max_faces = std::max(1, config.max_faces);
    if (static_cast<int>(boxes.size()) > max_faces) {
        std::string warning = "Too many faces detected (" + std::to_string(boxes.size()) +
                              "), processing first " + std::to_string(max_faces);
        spdlog::warn("{}", warning);
        run.warnings.push_back(warning);
        boxes.resize(static_cast<size_t>(max_faces));
    }

    // 3-4. Embed + match por cara contra el mismo snapshot
    std::vector<std::optional<MatchResult>> results(boxes.size());
    const Gallery& snapshot = *gallery;

    if (pool && boxes.size() > 1) {
        std::vector<std::future<std::optional<MatchResult>>> futures;
        futures.reserve(boxes.size());

        for (size_t i = 0; i < boxes.size(); i++) {
            futures.push_back(pool->submit([this, &image, &boxes, &snapshot, &config, &token, i]() {
                return process_face(image, boxes[i], static_cast<int>(i),
                                    snapshot, config.threshold, token);
            }));
        }

        // Esperar todas antes de get(): las tareas referencian este stack
        for (auto& f : futures) f.wait();
        for (size_t i = 0; i < futures.size(); i++) {
            results[i] = futures[i].get();
        }
    } else {
        for (size_t i = 0; i < boxes.size(); i++) {
            results[i] = process_face(image, boxes[i], static_cast<int>(i),
                                      snapshot, config.threshold, token);
            if (!results[i]) break;
        }
    }

    for (const auto& r : results) {
        if (!r) {
            spdlog::warn("Recognition cancelled ({} faces, gallery v{})",
                         boxes.size(), run.gallery_version);
            throw RecognitionError(ErrorCode::Cancelled, "recognition run cancelled");
        }
    }

    // 5. Agregado
    run.per_face_results.reserve(results.size());
    for (auto& r : results) {
        if (r->is_known) run.total_recognized++;
        run.per_face_results.push_back(std::move(*r));
    }
    run.total_detected = static_cast<int>(run.per_face_results.size());
    run.processing_duration_ms = timer.elapsed_ms();

    spdlog::info("Recognition completed: {} faces detected, {} recognized in {:.1f} ms (gallery v{})",
                 run.total_detected, run.total_recognized,
                 run.processing_duration_ms, run.gallery_version);

    // 6. History (best-effort)
    emit_history(run);

    return run;
}

RecognitionRun FaceRecognitionService::recognize(const std::vector<uint8_t>& encoded,
                                                 const GallerySnapshot& gallery,
                                                 const RecognitionConfig& config,
                                                 const CancelToken* cancel,
                                                 const std::string& source) const
{
    cv::Mat image = decode_image(encoded);
    return recognize(image, gallery, config, cancel, source);
}

RecognitionRun FaceRecognitionService::recognize(const cv::Mat& image,
                                                 const GalleryRegistry& registry,
                                                 const CancelToken* cancel,
                                                 const std::string& source) const
{
    GallerySnapshot snapshot = registry.snapshot();
    return recognize(image, snapshot, default_config, cancel, source);
}

// ==================== ENROLLMENT ====================

Descriptor FaceRecognitionService::prepare_entry(const cv::Mat& input, const DescriptorKind& kind) const {
    if (input.empty()) {
        throw RecognitionError(ErrorCode::ImageDecodeFailure, "empty image");
    }

    cv::Mat image = limit_image_size(input, detector_config.max_width, detector_config.max_height);

    std::vector<BoundingBox> boxes = run_detector(image);

    if (boxes.empty()) {
        throw RecognitionError(ErrorCode::NoFaceDetected,
            "no face detected in the image; use a clear, well-lit face");
    }
    if (boxes.size() > 1) {
        throw RecognitionError(ErrorCode::MultipleFacesDetected,
            std::to_string(boxes.size()) + " faces detected; enrollment needs exactly one");
    }

    if (!embedder) {
        throw RecognitionError(ErrorCode::EmbedderFailure, "no face embedder configured");
    }

    Descriptor descriptor;
    try {
        descriptor = embedder->embed(image, boxes.front());
    } catch (const RecognitionError&) {
        throw;
    } catch (const std::exception& e) {
        throw RecognitionError(ErrorCode::EmbedderFailure, e.what());
    }

    if (!descriptor.conforms_to(kind)) {
        throw RecognitionError(ErrorCode::MixedDescriptorKind,
            "embedder produced " + to_string(descriptor.type) + "[" +
            std::to_string(descriptor.size()) + "], gallery expects " +
            to_string(kind.type) + "[" + std::to_string(kind.dim) + "]");
    }

    spdlog::info("Enrollment descriptor ready ({}[{}])", to_string(descriptor.type), descriptor.size());
    return descriptor;
}

// ==================== INFO ====================

SystemInfo FaceRecognitionService::system_info(const Gallery& gallery) const {
    SystemInfo info;
    info.gallery_version = gallery.version();
    info.known_faces = gallery.size();
    info.kind = gallery.kind();
    info.threshold = default_config.threshold;
    info.max_faces = default_config.max_faces;
    info.worker_threads = pool ? static_cast<int>(pool->size()) : 1;
    info.max_image_width = detector_config.max_width;
    info.max_image_height = detector_config.max_height;
    return info;
}

} // namespace facematch
