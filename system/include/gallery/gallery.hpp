// ============= include/gallery/gallery.hpp =============
/*
 * Gallery - snapshot inmutable de identidades enroladas
 *
 * CARACTERÍSTICAS:
 * - Una Gallery es homogenea: todas las entries comparten DescriptorKind
 * - Inmutable una vez construida (solo se lee desde los matchers)
 * - Versionada: cada refresh publica una version nueva
 *
 * PUBLICACION (GalleryRegistry):
 * - snapshot(): copia del shared_ptr publicado, O(1), sin bloquear
 * - publish(): swap atomico del puntero; los publish concurrentes
 *   se serializan (gana el ultimo). La version publicada siempre crece:
 *   una Gallery con version vieja se re-numera antes de publicarse
 * - Las versiones viejas se liberan cuando el ultimo run las suelta
 */

#pragma once
#include "core/types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace facematch {

class Gallery {
public:
    // Lanza MixedDescriptorKind / InvalidEntry
    static std::shared_ptr<const Gallery> build(std::vector<Entry> entries,
                                                const DescriptorKind& kind,
                                                uint64_t version);

    static std::shared_ptr<const Gallery> empty(const DescriptorKind& kind,
                                                uint64_t version = 0);

    uint64_t version() const { return gallery_version; }
    const DescriptorKind& kind() const { return gallery_kind; }
    const std::vector<Entry>& entries() const { return gallery_entries; }

    size_t size() const { return gallery_entries.size(); }
    bool empty() const { return gallery_entries.empty(); }

    const Entry* find(EntryId id) const;

private:
    friend class GalleryRegistry;

    Gallery(std::vector<Entry> entries, const DescriptorKind& kind, uint64_t version)
        : gallery_version(version), gallery_kind(kind), gallery_entries(std::move(entries)) {}

    uint64_t gallery_version;
    DescriptorKind gallery_kind;
    std::vector<Entry> gallery_entries;
};

using GallerySnapshot = std::shared_ptr<const Gallery>;

class GalleryRegistry {
public:
    explicit GalleryRegistry(const DescriptorKind& kind);

    GallerySnapshot snapshot() const;

    // Devuelve el snapshot efectivamente publicado (puede traer otra version)
    GallerySnapshot publish(GallerySnapshot next);

    // Construye con la siguiente version y publica
    GallerySnapshot publish_entries(std::vector<Entry> entries);

    uint64_t version() const { return snapshot()->version(); }
    const DescriptorKind& kind() const { return registry_kind; }

private:
    DescriptorKind registry_kind;
    GallerySnapshot published;

    std::mutex writer_mutex;      // solo writers; los readers nunca lo toman
    uint64_t next_version = 1;

    void swap_locked(GallerySnapshot next);
};

} // namespace facematch
