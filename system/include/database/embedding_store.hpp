// ============= include/database/embedding_store.hpp =============
/*
 * Embedding Store - identidades enroladas
 *
 * CARACTERÍSTICAS:
 * - Por identidad: lista de embeddings de referencia + imagen original
 * - Cada registro se identifica por una clave temporal (YYYYmmdd_HHMMSS_ffffff)
 * - Contador de generacion: cada mutacion lo incrementa (enroll, delete_enrollment,
 *   delete_identity). EmbeddingCache lo compara para recargar el snapshot.
 *
 * BACKENDS:
 * - FileEmbeddingStore:   known/<nombre>/<clave>.jpg + <clave>.npy
 * - SqliteEmbeddingStore: tabla enrollments (embedding + imagen como BLOB)
 *
 * OPERACIONES:
 * - enroll(): detectar rostro y guardar (solo el primer rostro detectado)
 * - list_identities() / list_enrollments()
 * - delete_enrollment() / delete_identity()
 * - load_snapshot(): contenido completo, orden determinista
 *
 * Sin detector (herramientas de diagnostico) el store es de solo lectura
 * para enroll(): lanza DetectionError. Consultas y borrados funcionan igual.
 */

#pragma once
#include "core/types.hpp"
#include "detection/face_detector.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facevault {

struct IdentityEmbeddings {
    std::string name;
    std::vector<Embedding> embeddings;
};

// Ordenado por nombre; embeddings por clave de creacion
using EmbeddingSnapshot = std::vector<IdentityEmbeddings>;

class EmbeddingStore {
public:
    explicit EmbeddingStore(FaceDetector& detector);
    EmbeddingStore();
    virtual ~EmbeddingStore() = default;

    EmbeddingStore(const EmbeddingStore&) = delete;
    EmbeddingStore& operator=(const EmbeddingStore&) = delete;

    // NoFaceDetected si el detector no encuentra rostros; InvalidName si el nombre
    // no sirve como clave. Lanza DetectionError / StorageError.
    Status enroll(const std::string& identity, const Bytes& image_bytes);

    Status delete_enrollment(const std::string& identity, const std::string& image_ref);
    Status delete_identity(const std::string& identity);

    virtual std::vector<IdentityInfo> list_identities() = 0;

    // Referencias de imagen, la mas reciente primero. Vacio si no existe.
    virtual std::vector<std::string> list_enrollments(const std::string& identity) = 0;

    // std::nullopt si no existe o si la referencia escapa del registro de la identidad
    virtual std::optional<Bytes> read_enrollment_image(const std::string& identity,
                                                       const std::string& image_ref) = 0;

    virtual EmbeddingSnapshot load_snapshot() = 0;

    virtual bool has_identity(const std::string& identity) = 0;

    uint64_t generation() const { return generation_counter.load(); }

protected:
    virtual void save_enrollment(const std::string& identity,
                                 const std::string& key,
                                 const Embedding& embedding,
                                 const Bytes& image_bytes) = 0;

    virtual Status remove_enrollment(const std::string& identity, const std::string& image_ref) = 0;
    virtual Status remove_identity(const std::string& identity) = 0;

private:
    FaceDetector* detector;
    std::atomic<uint64_t> generation_counter{0};

    void bump_generation() { generation_counter.fetch_add(1); }
};

}  // namespace facevault
