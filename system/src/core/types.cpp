// ============= src/core/types.cpp =============
#include "core/types.hpp"
#include "core/errors.hpp"

namespace facematch {

std::string to_string(DescriptorType type) {
    switch (type) {
        case DescriptorType::Embedding: return "embedding";
        case DescriptorType::Histogram: return "histogram";
    }
    return "unknown";
}

std::string to_string(DistanceMetricType metric) {
    switch (metric) {
        case DistanceMetricType::Euclidean: return "euclidean";
        case DistanceMetricType::ChiSquare: return "chi_square";
        case DistanceMetricType::Bhattacharyya: return "bhattacharyya";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ImageDecodeFailure:    return "ImageDecodeFailure";
        case ErrorCode::DetectorUnavailable:   return "DetectorUnavailable";
        case ErrorCode::NoFaceDetected:        return "NoFaceDetected";
        case ErrorCode::MultipleFacesDetected: return "MultipleFacesDetected";
        case ErrorCode::EmbedderFailure:       return "EmbedderFailure";
        case ErrorCode::MixedDescriptorKind:   return "MixedDescriptorKind";
        case ErrorCode::InvalidEntry:          return "InvalidEntry";
        case ErrorCode::HistoryAppendFailure:  return "HistoryAppendFailure";
        case ErrorCode::Cancelled:             return "Cancelled";
        case ErrorCode::StorageFailure:        return "StorageFailure";
        case ErrorCode::DuplicateEmployeeId:   return "DuplicateEmployeeId";
        case ErrorCode::ConfigError:           return "ConfigError";
    }
    return "UnknownError";
}

} // namespace facematch
