#include "recognition/curation.hpp"
#include <spdlog/spdlog.h>

namespace facevault {

CurationService::CurationService(EmbeddingStore& known, UnknownFaceStore& unknown_faces, EventStore& events)
    : known(known),
      unknown_faces(unknown_faces),
      events(events)
{
}

Status CurationService::enroll(const std::string& identity, const Bytes& image_bytes) {
    return known.enroll(identity, image_bytes);
}

Outcome<Status> CurationService::name_unknown_face(const std::string& unknown_id, const std::string& identity) {
    Outcome<Status> outcome;

    auto image = unknown_faces.read_best_image(unknown_id);
    if (!image) {
        spdlog::warn("Unknown face not found: {}", unknown_id);
        outcome.value = Status::NotFound;
        return outcome;
    }

    outcome.value = known.enroll(identity, *image);
    if (outcome.value != Status::Ok) {
        spdlog::warn("No se pudo nombrar {} como {}: {}", unknown_id, identity, to_string(outcome.value));
        return outcome;
    }

    try {
        Status removed = unknown_faces.remove(unknown_id);
        if (removed != Status::Ok) {
            outcome.warn("unknown face " + unknown_id + " was already gone after enrollment");
        }
    } catch (const std::exception& e) {
        spdlog::error("Enrolled {} but failed to remove unknown face {}: {}", identity, unknown_id, e.what());
        outcome.warn("unknown face " + unknown_id + " not removed: " + e.what());
    }

    spdlog::info("✓ Unknown face {} enrolado como {}", unknown_id, identity);
    return outcome;
}

Status CurationService::promote_event_face(const std::string& event_id, int face_index, const std::string& identity) {
    auto crop = events.read_face(event_id, face_index);
    if (!crop) {
        spdlog::warn("Face {} not found in recognition event {}", face_index, event_id);
        return Status::NotFound;
    }

    Status status = known.enroll(identity, *crop);
    if (status == Status::Ok) {
        spdlog::info("✓ Rostro {} de {} enrolado como {}", face_index, event_id, identity);
    }
    return status;
}

Status CurationService::delete_identity(const std::string& identity) {
    return known.delete_identity(identity);
}

Status CurationService::delete_enrollment(const std::string& identity, const std::string& image_ref) {
    return known.delete_enrollment(identity, image_ref);
}

Status CurationService::delete_unknown_face(const std::string& unknown_id) {
    return unknown_faces.remove(unknown_id);
}

Status CurationService::delete_event(const std::string& event_id) {
    return events.remove(event_id);
}

}  // namespace facevault
