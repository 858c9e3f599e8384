// ============= include/database/event_store.hpp =============
/*
 * Recognition Event Store - historial de reconocimientos
 *
 * LAYOUT: recognitions/recognition_<clave>/
 * ├── original.jpg    - imagen enviada
 * ├── face_<i>.jpg    - recorte de cada rostro detectado (i = face_index)
 * └── metadata.json   - se escribe al final
 *
 * metadata.json:
 * {
 *   "event_id": "recognition_20251124_143052_123456",
 *   "timestamp": "2025-11-24T14:30:52.123456",
 *   "total_faces": 2,
 *   "faces": [
 *     {"face_index": 0, "known_person": true, "name_person": "Alice", "distance": 0.31,
 *      "location": {"top": 10, "right": 90, "bottom": 110, "left": 12},
 *      "face_image": "face_0.jpg"},
 *     ...
 *   ]
 * }
 *
 * "distance" es null cuando no habia identidades enroladas.
 */

#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace facevault {

struct RecognitionEvent {
    std::string event_id;
    std::string timestamp;
    int total_faces = 0;
    std::vector<FaceResult> faces;
};

class EventStore {
public:
    explicit EventStore(const std::filesystem::path& storage_root);

    // `crops[i]` corresponde a `faces[i]`; un recorte vacio no se escribe.
    // Lanza StorageError: el evento es el artefacto primario.
    // Devuelve el evento tal como quedo persistido (face_image ya asignado).
    RecognitionEvent create(const Bytes& original_image,
                            const std::vector<FaceResult>& faces,
                            const std::vector<Bytes>& crops);

    // El mas reciente primero; metadata corrupta se registra y se omite
    std::vector<RecognitionEvent> list();

    std::optional<RecognitionEvent> get(const std::string& event_id);

    std::optional<Bytes> read_original(const std::string& event_id);
    std::optional<Bytes> read_face(const std::string& event_id, int face_index);

    Status remove(const std::string& event_id);

    const std::filesystem::path& root() const { return events_root; }

private:
    std::filesystem::path events_root;

    std::optional<std::filesystem::path> record_dir(const std::string& event_id) const;

    static std::string face_file_name(int face_index);
    static std::optional<RecognitionEvent> parse_metadata(const std::filesystem::path& dir);
};

}  // namespace facevault
