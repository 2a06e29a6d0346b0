// ============= src/matching/matcher.cpp =============
#include "matching/matcher.hpp"
#include "matching/confidence_calibrator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <limits>

namespace facematch {

MatchResult LinearScanMatcher::match(const Descriptor& query,
                                     const Gallery& gallery,
                                     float threshold) const
{
    MatchResult result;
    result.observation.descriptor = query;

    if (gallery.empty()) {
        return result;
    }

    const auto& kind = gallery.kind();
    if (!query.conforms_to(kind)) {
        throw RecognitionError(ErrorCode::MixedDescriptorKind,
            "query " + to_string(query.type) + "[" + std::to_string(query.size()) +
            "] vs gallery " + to_string(kind.type) + "[" + std::to_string(kind.dim) + "]");
    }

    auto metric = make_metric(kind.metric);

    const Entry* best = nullptr;
    float best_distance = std::numeric_limits<float>::infinity();

    for (const auto& entry : gallery.entries()) {
        float d = metric->distance(query.values, entry.descriptor.values);

        if (d < best_distance || (d == best_distance && best && entry.id < best->id)) {
            best_distance = d;
            best = &entry;
        }
    }

    // Solo NaN en todas las distancias deja best en null
    if (!best) {
        spdlog::warn("Matcher: no comparable entry in gallery v{}", gallery.version());
        return result;
    }

    result.raw_distance = best_distance;

    if (best_distance <= threshold) {
        result.is_known = true;
        result.matched_entry_id = best->id;
        result.matched_label = best->label;
        result.attributes = best->attributes;
        result.confidence = ConfidenceCalibrator::calibrate(best_distance, threshold, kind);
    }

    spdlog::debug("Matcher: best={} ({}) d={:.4f} thr={:.2f} -> {}",
                  best->id, best->label, best_distance, threshold,
                  result.is_known ? "known" : "unknown");

    return result;
}

} // namespace facematch
