#include "database/embedding_store.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

namespace facevault {

EmbeddingStore::EmbeddingStore(FaceDetector& detector)
    : detector(&detector) {}

EmbeddingStore::EmbeddingStore()
    : detector(nullptr) {}

// ==================== ENROLL ====================

Status EmbeddingStore::enroll(const std::string& identity, const Bytes& image_bytes) {
    std::string name = trim_copy(identity);
    if (!is_safe_name(name)) {
        spdlog::warn("enroll: nombre invalido '{}'", identity);
        return Status::InvalidName;
    }

    if (!detector) {
        throw DetectionError("enroll: store abierto sin detector de rostros");
    }

    spdlog::info("Procesando imagen para {}: {} bytes", name, image_bytes.size());

    auto faces = detector->detect(image_bytes);
    if (faces.empty()) {
        spdlog::warn("enroll failed: no face detected - name={}", name);
        return Status::NoFaceDetected;
    }

    if (faces.size() > 1) {
        spdlog::info("{} rostros en la imagen de {}, usando el primero", faces.size(), name);
    }

    TimeKey tk = next_time_key();
    save_enrollment(name, tk.key, faces.front().embedding, image_bytes);
    bump_generation();

    spdlog::info("✓ Enrolled {} ({})", name, tk.key);
    return Status::Ok;
}

// ==================== DELETE ====================

Status EmbeddingStore::delete_enrollment(const std::string& identity, const std::string& image_ref) {
    Status st = remove_enrollment(identity, image_ref);
    if (st == Status::Ok) {
        bump_generation();
        spdlog::info("✓ Deleted enrollment {}/{}", identity, image_ref);
    }
    return st;
}

Status EmbeddingStore::delete_identity(const std::string& identity) {
    Status st = remove_identity(identity);
    if (st == Status::Ok) {
        bump_generation();
        spdlog::info("✓ Deleted identity: {}", identity);
    }
    return st;
}

}  // namespace facevault
