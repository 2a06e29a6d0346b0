// ============= include/matching/matcher.hpp =============
/*
 * Matcher 1:N contra un snapshot de Gallery
 *
 * ALGORITMO (LinearScanMatcher):
 * - Distancia a cada entry con la metrica del kind de la Gallery
 * - Minimo global; empate exacto -> gana el Entry.id menor
 * - Gallery vacia -> resultado "unknown" sin calcular distancias
 * - Aceptado (is_known) si min_distance <= threshold
 *
 * Galerias de decenas a pocos miles de identidades: el scan lineal
 * alcanza. Un indice aproximado (HNSW, etc.) puede implementar la
 * misma interfaz Matcher.
 */

#pragma once
#include "core/types.hpp"
#include "gallery/gallery.hpp"
#include "matching/distance_metric.hpp"

namespace facematch {

class Matcher {
public:
    virtual ~Matcher() = default;

    // Lanza MixedDescriptorKind si query no conforma con gallery.kind()
    virtual MatchResult match(const Descriptor& query,
                              const Gallery& gallery,
                              float threshold) const = 0;
};

class LinearScanMatcher : public Matcher {
public:
    MatchResult match(const Descriptor& query,
                      const Gallery& gallery,
                      float threshold) const override;
};

} // namespace facematch
