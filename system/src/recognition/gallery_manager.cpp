// ============= src/recognition/gallery_manager.cpp =============
#include "recognition/gallery_manager.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace facematch {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

Attributes clean_attributes(const Attributes& attributes) {
    Attributes clean;
    for (const auto& kv : attributes) {
        std::string value = trim(kv.second);
        if (!value.empty()) clean[kv.first] = value;
    }
    return clean;
}

} // namespace

GalleryManager::GalleryManager(std::shared_ptr<FaceStore> store,
                               std::shared_ptr<GalleryRegistry> registry,
                               std::shared_ptr<FaceRecognitionService> service)
    : store(std::move(store)),
      registry(std::move(registry)),
      service(std::move(service))
{
    if (!this->store || !this->registry || !this->service) {
        throw std::invalid_argument("GalleryManager needs a store, a registry and a service");
    }
}

// ==================== REFRESH ====================

size_t GalleryManager::refresh() {
    // Leer y publicar bajo el mismo lock: un refresh con una lectura
    // vieja no puede publicar despues de uno con la lectura nueva
    std::lock_guard<std::mutex> lock(refresh_mutex);

    std::vector<Entry> entries = store->list_all();

    try {
        GallerySnapshot published = registry->publish_entries(std::move(entries));
        return published->size();
    } catch (const RecognitionError& e) {
        // La version anterior sigue publicada
        spdlog::error("Gallery refresh failed, keeping v{}: {}", registry->version(), e.what());
        throw;
    }
}

// ==================== ENROLL ====================

EntryId GalleryManager::enroll(const cv::Mat& image,
                               const std::string& label,
                               const Attributes& attributes)
{
    std::string name = trim(label);
    if (name.empty()) {
        throw RecognitionError(ErrorCode::InvalidEntry, "name is required");
    }

    Descriptor descriptor = service->prepare_entry(image, registry->kind());

    EntryId id = store->add(name, descriptor, clean_attributes(attributes));

    try {
        refresh();
    } catch (const RecognitionError& e) {
        // Sin publicar no queda enrolado: se deshace el insert
        spdlog::warn("Enrollment of '{}' rolled back (ID={})", name, id);
        try {
            store->remove(id);
        } catch (const RecognitionError& rollback_error) {
            spdlog::error("Rollback of face ID={} failed: {}", id, rollback_error.what());
        }
        throw;
    }

    spdlog::info("✓ Enrolled '{}' (ID={}, gallery v{})", name, id, registry->version());
    return id;
}

// ==================== UPDATE ====================

bool GalleryManager::update(EntryId id, const Attributes& attributes) {
    if (!store->update_attributes(id, clean_attributes(attributes))) {
        spdlog::warn("Face ID={} not found", id);
        return false;
    }

    refresh();
    return true;
}

// ==================== REMOVE ====================

bool GalleryManager::remove(EntryId id) {
    if (!store->remove(id)) {
        spdlog::warn("Face ID={} not found", id);
        return false;
    }

    refresh();
    return true;
}

} // namespace facematch
