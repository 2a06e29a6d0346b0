// ============= include/core/types.hpp =============
/*
 * Tipos comunes del core de matching
 *
 * - Descriptor: vector de features producido por el embedder externo
 * - DescriptorKind: tipo + dimension + metrica (una por Gallery)
 * - Entry / FaceObservation / MatchResult / RecognitionRun
 *
 * Todas las estructuras son valores: se copian o se mueven, nunca
 * se comparten mutables entre threads.
 */

#pragma once
#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace facematch {

using EntryId = int64_t;
using Attributes = std::map<std::string, std::string>;

enum class DescriptorType {
    Embedding = 0,   // dlib / ArcFace style feature vector
    Histogram = 1    // LBPH style concatenated histograms
};

enum class DistanceMetricType {
    Euclidean = 0,
    ChiSquare = 1,
    Bhattacharyya = 2
};

struct DescriptorKind {
    DescriptorType type = DescriptorType::Embedding;
    size_t dim = 128;
    DistanceMetricType metric = DistanceMetricType::Euclidean;

    static DescriptorKind embedding(size_t dim) {
        return {DescriptorType::Embedding, dim, DistanceMetricType::Euclidean};
    }

    static DescriptorKind histogram(size_t dim,
                                    DistanceMetricType metric = DistanceMetricType::ChiSquare) {
        return {DescriptorType::Histogram, dim, metric};
    }

    bool operator==(const DescriptorKind& other) const {
        return type == other.type && dim == other.dim && metric == other.metric;
    }
    bool operator!=(const DescriptorKind& other) const { return !(*this == other); }
};

struct Descriptor {
    DescriptorType type = DescriptorType::Embedding;
    std::vector<float> values;

    Descriptor() = default;
    Descriptor(DescriptorType t, std::vector<float> v)
        : type(t), values(std::move(v)) {}

    bool empty() const { return values.empty(); }
    size_t size() const { return values.size(); }

    // Mismo tipo y misma dimension que la Gallery
    bool conforms_to(const DescriptorKind& kind) const {
        return type == kind.type && values.size() == kind.dim;
    }
};

struct Entry {
    EntryId id = -1;
    std::string label;
    Descriptor descriptor;
    Attributes attributes;   // employee_id, department, position, email, phone
};

// (top, right, bottom, left) en pixeles, como lo reporta la API
struct BoundingBox {
    int top = 0;
    int right = 0;
    int bottom = 0;
    int left = 0;

    BoundingBox() = default;
    BoundingBox(int t, int r, int b, int l) : top(t), right(r), bottom(b), left(l) {}

    static BoundingBox from_rect(const cv::Rect& r) {
        return BoundingBox(r.y, r.x + r.width, r.y + r.height, r.x);
    }

    cv::Rect to_rect() const {
        return cv::Rect(left, top, right - left, bottom - top);
    }

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    int area() const { return width() * height(); }

    bool operator==(const BoundingBox& o) const {
        return top == o.top && right == o.right && bottom == o.bottom && left == o.left;
    }
};

struct FaceObservation {
    int index = 0;            // orden de salida del detector
    BoundingBox box;
    Descriptor descriptor;
};

struct MatchResult {
    FaceObservation observation;
    std::optional<EntryId> matched_entry_id;
    std::optional<float> raw_distance;
    float confidence = 0.0f;
    bool is_known = false;

    // Copiados de la Entry ganadora
    std::string matched_label;
    Attributes attributes;

    // Set cuando el embedder fallo para esta cara
    std::string error;
};

struct RecognitionRun {
    std::chrono::system_clock::time_point timestamp;
    int total_detected = 0;
    int total_recognized = 0;
    std::vector<MatchResult> per_face_results;
    double processing_duration_ms = 0.0;
    uint64_t gallery_version = 0;

    int detected_before_truncation = 0;
    std::vector<std::string> warnings;
    std::string source;
    int image_width = 0;
    int image_height = 0;
};

std::string to_string(DescriptorType type);
std::string to_string(DistanceMetricType metric);

} // namespace facematch
