// ============= include/recognition/gallery_manager.hpp =============
/*
 * Gallery Manager - ciclo de vida de la Gallery
 *
 * FLUJO:
 *   enroll():  prepare_entry -> FaceStore::add -> refresh
 *   update():  FaceStore::update_attributes -> refresh
 *   remove():  FaceStore::remove -> refresh
 *   refresh(): FaceStore::list_all -> Gallery::build -> publish
 *
 * Si el refresh de un enroll falla, la fila insertada se borra.
 *
 * Nunca modifica una Gallery publicada: cada cambio publica una
 * version nueva completa. Los runs en curso siguen con su snapshot.
 */

#pragma once
#include "database/face_store.hpp"
#include "gallery/gallery.hpp"
#include "recognition/face_recognition_service.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace facematch {

class GalleryManager {
private:
    std::shared_ptr<FaceStore> store;
    std::shared_ptr<GalleryRegistry> registry;
    std::shared_ptr<FaceRecognitionService> service;

    std::mutex refresh_mutex;

public:
    GalleryManager(std::shared_ptr<FaceStore> store,
                   std::shared_ptr<GalleryRegistry> registry,
                   std::shared_ptr<FaceRecognitionService> service);

    // Devuelve la cantidad de entries publicadas
    size_t refresh();

    // Lanza NoFaceDetected / MultipleFacesDetected / EmbedderFailure /
    // InvalidEntry / DuplicateEmployeeId / StorageFailure
    EntryId enroll(const cv::Mat& image,
                   const std::string& label,
                   const Attributes& attributes = {});

    // Reemplaza los atributos y republica. false si el id no existe
    bool update(EntryId id, const Attributes& attributes);

    bool remove(EntryId id);

    GallerySnapshot snapshot() const { return registry->snapshot(); }
};

} // namespace facematch
