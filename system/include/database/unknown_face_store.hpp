// ============= include/database/unknown_face_store.hpp =============
/*
 * Unknown Face Store - rostros no identificados
 *
 * LAYOUT: unknown/unknown_<clave>/
 * ├── image.jpg       - imagen completa (requerida)
 * ├── face.jpg        - recorte del rostro (opcional, best-effort)
 * └── metadata.json   - se escribe al final; sin metadata el registro no existe
 *
 * metadata.json: {"id", "timestamp", "image_path", "has_face_image"}
 */

#pragma once
#include "core/types.hpp"
#include "detection/face_detector.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace facevault {

struct UnknownFace {
    std::string id;
    std::string timestamp;
    std::string image_path;     // relativo a la raiz de almacenamiento
    bool has_face_image = false;
};

enum class UnknownImage {
    Full,
    Face
};

class UnknownFaceStore {
public:
    // detector opcional: solo se usa para extraer el recorte cuando create() no lo recibe
    UnknownFaceStore(const std::filesystem::path& storage_root, FaceDetector* detector = nullptr);
    virtual ~UnknownFaceStore() = default;

    // Imagen completa + recorte ya calculado. Lanza StorageError si falla la imagen
    // completa o la metadata; un recorte que no se puede escribir es un warning.
    virtual Outcome<std::string> create(const Bytes& image_bytes, const Bytes& face_bytes);

    // Sin recorte: intenta extraer el primer rostro de la imagen (best-effort)
    Outcome<std::string> create(const Bytes& image_bytes);

    // La mas reciente primero
    std::vector<UnknownFace> list();

    std::optional<UnknownFace> get(const std::string& id);

    std::optional<Bytes> read_image(const std::string& id, UnknownImage kind);

    // Recorte si existe, si no la imagen completa
    std::optional<Bytes> read_best_image(const std::string& id);

    Status remove(const std::string& id);

    const std::filesystem::path& root() const { return unknown_root; }

private:
    std::filesystem::path storage_root;
    std::filesystem::path unknown_root;
    FaceDetector* detector;

    std::optional<std::filesystem::path> record_dir(const std::string& id) const;
    Bytes extract_face(const Bytes& image_bytes, std::vector<std::string>& warnings);

    static std::optional<UnknownFace> parse_metadata(const std::filesystem::path& dir);
};

}  // namespace facevault
