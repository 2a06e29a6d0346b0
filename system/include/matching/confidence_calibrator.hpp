// ============= include/matching/confidence_calibrator.hpp =============
#pragma once
#include "core/types.hpp"

namespace facematch {

// Distancia cruda -> confianza en [0,100], no creciente con la distancia.
//
//   ChiSquare:                max(0, (threshold - d) / threshold * 100), 0 si d >= threshold
//   Euclidean, Bhattacharyya: max(0, 1 - d) * 100
//
// Se elige por metrica, no por tipo de descriptor: un histograma comparado
// con Bhattacharyya ya tiene distancias en [0,1].
//
// Redondeado a 2 decimales.
class ConfidenceCalibrator {
public:
    static float calibrate(float distance, float threshold, const DescriptorKind& kind);
};

} // namespace facematch
