// ============= include/recognition/curation.hpp =============
/*
 * Curation - operaciones de gestion sobre los stores
 *
 * - enroll(): alta directa de una imagen bajo un nombre
 * - name_unknown_face(): enrola el mejor recorte de un Unknown Face y lo borra
 *   solo si el enroll tuvo exito (si el borrado falla queda como warning)
 * - promote_event_face(): enrola el recorte face_<i>.jpg de un evento pasado;
 *   el evento se conserva
 * - delete_*: NotFound si no existe, el almacenamiento queda igual
 *
 * Todas las mutaciones del EmbeddingStore incrementan su generacion, asi que el
 * EmbeddingCache recarga solo en la siguiente consulta.
 */

#pragma once
#include "core/types.hpp"
#include "database/embedding_store.hpp"
#include "database/event_store.hpp"
#include "database/unknown_face_store.hpp"
#include <string>

namespace facevault {

class CurationService {
public:
    CurationService(EmbeddingStore& known, UnknownFaceStore& unknown_faces, EventStore& events);

    Status enroll(const std::string& identity, const Bytes& image_bytes);

    Outcome<Status> name_unknown_face(const std::string& unknown_id, const std::string& identity);

    Status promote_event_face(const std::string& event_id, int face_index, const std::string& identity);

    Status delete_identity(const std::string& identity);
    Status delete_enrollment(const std::string& identity, const std::string& image_ref);
    Status delete_unknown_face(const std::string& unknown_id);
    Status delete_event(const std::string& event_id);

private:
    EmbeddingStore& known;
    UnknownFaceStore& unknown_faces;
    EventStore& events;
};

}  // namespace facevault
