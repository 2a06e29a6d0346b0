// ============= src/gallery/gallery.cpp =============
#include "gallery/gallery.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace facematch {

// ==================== GALLERY ====================

GallerySnapshot Gallery::build(std::vector<Entry> entries,
                               const DescriptorKind& kind,
                               uint64_t version)
{
    std::unordered_set<EntryId> seen;
    seen.reserve(entries.size());

    for (const auto& e : entries) {
        if (!e.descriptor.conforms_to(kind)) {
            throw RecognitionError(ErrorCode::MixedDescriptorKind,
                "entry " + std::to_string(e.id) + " has " + to_string(e.descriptor.type) +
                "[" + std::to_string(e.descriptor.size()) + "], gallery expects " +
                to_string(kind.type) + "[" + std::to_string(kind.dim) + "]");
        }
        if (e.label.empty()) {
            throw RecognitionError(ErrorCode::InvalidEntry,
                "entry " + std::to_string(e.id) + " has an empty label");
        }
        if (!seen.insert(e.id).second) {
            throw RecognitionError(ErrorCode::InvalidEntry,
                "duplicate entry id " + std::to_string(e.id));
        }
    }

    return GallerySnapshot(new Gallery(std::move(entries), kind, version));
}

GallerySnapshot Gallery::empty(const DescriptorKind& kind, uint64_t version) {
    return GallerySnapshot(new Gallery({}, kind, version));
}

const Entry* Gallery::find(EntryId id) const {
    auto it = std::find_if(gallery_entries.begin(), gallery_entries.end(),
                           [id](const Entry& e) { return e.id == id; });
    return it != gallery_entries.end() ? &*it : nullptr;
}

// ==================== REGISTRY ====================

GalleryRegistry::GalleryRegistry(const DescriptorKind& kind)
    : registry_kind(kind), published(Gallery::empty(kind, 0))
{
}

GallerySnapshot GalleryRegistry::snapshot() const {
    return std::atomic_load(&published);
}

GallerySnapshot GalleryRegistry::publish(GallerySnapshot next) {
    if (!next) {
        throw RecognitionError(ErrorCode::InvalidEntry, "cannot publish a null gallery");
    }
    if (next->kind() != registry_kind) {
        throw RecognitionError(ErrorCode::MixedDescriptorKind,
            "gallery kind " + to_string(next->kind().type) +
            " does not match registry kind " + to_string(registry_kind.type));
    }

    std::lock_guard<std::mutex> lock(writer_mutex);

    if (next->version() < next_version) {
        // Gana el contenido del ultimo writer, pero con version nueva
        spdlog::warn("Gallery v{} is not newer than v{}, republished as v{}",
                     next->version(), next_version - 1, next_version);
        next = GallerySnapshot(new Gallery(next->entries(), next->kind(), next_version));
    }

    swap_locked(next);
    return next;
}

GallerySnapshot GalleryRegistry::publish_entries(std::vector<Entry> entries) {
    // Writers serializados: la version publicada siempre crece.
    // Los readers siguen usando su snapshot sin tomar este lock.
    std::lock_guard<std::mutex> lock(writer_mutex);

    auto next = Gallery::build(std::move(entries), registry_kind, next_version);
    swap_locked(next);
    return next;
}

void GalleryRegistry::swap_locked(GallerySnapshot next) {
    auto previous = std::atomic_load(&published);

    std::atomic_store(&published, next);
    next_version = next->version() + 1;

    spdlog::info("✓ Gallery published: v{} -> v{} ({} entries)",
                 previous->version(), next->version(), next->size());
}

} // namespace facematch
