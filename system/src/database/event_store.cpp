#include "database/event_store.hpp"
#include "core/errors.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace facevault {

namespace {

Json::Value face_to_json(const FaceResult& face) {
    Json::Value j;
    j["face_index"] = face.face_index;
    j["known_person"] = face.matched;
    j["name_person"] = face.name;
    j["distance"] = face.distance ? Json::Value(*face.distance) : Json::Value(Json::nullValue);

    Json::Value loc;
    loc["top"] = face.box.top;
    loc["right"] = face.box.right;
    loc["bottom"] = face.box.bottom;
    loc["left"] = face.box.left;
    j["location"] = loc;

    j["face_image"] = face.face_image;
    return j;
}

FaceResult face_from_json(const Json::Value& j) {
    FaceResult face;
    face.face_index = j.get("face_index", 0).asInt();
    face.matched = j.get("known_person", false).asBool();
    face.name = j.get("name_person", "").asString();

    const Json::Value& dist = j["distance"];
    if (dist.isNumeric()) {
        face.distance = dist.asDouble();
    }

    const Json::Value& loc = j["location"];
    if (loc.isObject()) {
        face.box.top = loc.get("top", 0).asInt();
        face.box.right = loc.get("right", 0).asInt();
        face.box.bottom = loc.get("bottom", 0).asInt();
        face.box.left = loc.get("left", 0).asInt();
    }

    face.face_image = j.get("face_image", "").asString();
    return face;
}

}  // namespace

EventStore::EventStore(const fs::path& storage_root)
    : events_root(storage_root / Config::RECOGNITIONS_DIR)
{
    std::error_code ec;
    fs::create_directories(events_root, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + events_root.string() + ": " + ec.message());
    }
}

std::string EventStore::face_file_name(int face_index) {
    return "face_" + std::to_string(face_index) + ".jpg";
}

std::optional<fs::path> EventStore::record_dir(const std::string& event_id) const {
    if (!is_safe_name(event_id)) return std::nullopt;
    return events_root / event_id;
}

// ==================== CREATE ====================

RecognitionEvent EventStore::create(const Bytes& original_image,
                                    const std::vector<FaceResult>& faces,
                                    const std::vector<Bytes>& crops)
{
    TimeKey tk = next_time_key();

    RecognitionEvent event;
    event.event_id = Config::EVENT_ID_PREFIX + tk.key;
    event.timestamp = tk.iso;
    event.total_faces = static_cast<int>(faces.size());
    event.faces = faces;

    fs::path dir = events_root / event.event_id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + dir.string() + ": " + ec.message());
    }

    write_file_bytes(dir / Config::EVENT_ORIGINAL_FILE, original_image);
    spdlog::debug("Saved original image for recognition event: event_id={}", event.event_id);

    Json::Value faces_json(Json::arrayValue);
    for (size_t i = 0; i < event.faces.size(); ++i) {
        FaceResult& face = event.faces[i];
        face.face_image = face_file_name(face.face_index);

        if (i < crops.size() && !crops[i].empty()) {
            write_file_bytes(dir / face.face_image, crops[i]);
        } else {
            spdlog::warn("Sin recorte para face_index={} en {}", face.face_index, event.event_id);
        }

        faces_json.append(face_to_json(face));
    }

    Json::Value meta;
    meta["event_id"] = event.event_id;
    meta["timestamp"] = event.timestamp;
    meta["total_faces"] = event.total_faces;
    meta["faces"] = faces_json;

    write_json_file(dir / Config::METADATA_FILE, meta);

    spdlog::info("Saved recognition event: event_id={}, faces={}", event.event_id, event.total_faces);
    return event;
}

// ==================== QUERY ====================

std::optional<RecognitionEvent> EventStore::parse_metadata(const fs::path& dir) {
    auto meta = read_json_file(dir / Config::METADATA_FILE);
    if (!meta || !meta->isObject()) return std::nullopt;

    RecognitionEvent event;
    event.event_id = (*meta).get("event_id", dir.filename().string()).asString();
    event.timestamp = (*meta).get("timestamp", "").asString();

    const Json::Value& faces = (*meta)["faces"];
    if (faces.isArray()) {
        for (const auto& f : faces) {
            event.faces.push_back(face_from_json(f));
        }
    }
    event.total_faces = (*meta).get("total_faces", static_cast<int>(event.faces.size())).asInt();
    return event;
}

std::vector<RecognitionEvent> EventStore::list() {
    std::vector<RecognitionEvent> events;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(events_root, ec)) {
        if (!entry.is_directory()) continue;

        try {
            auto event = parse_metadata(entry.path());
            if (event) events.push_back(std::move(*event));
        } catch (const StorageError& e) {
            spdlog::error("Error loading recognition event {}: {}", entry.path().filename().string(), e.what());
        }
    }

    std::sort(events.begin(), events.end(), [](const RecognitionEvent& a, const RecognitionEvent& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.event_id > b.event_id;
    });
    return events;
}

std::optional<RecognitionEvent> EventStore::get(const std::string& event_id) {
    auto dir = record_dir(event_id);
    if (!dir) return std::nullopt;

    try {
        return parse_metadata(*dir);
    } catch (const StorageError& e) {
        spdlog::error("Error loading recognition event {}: {}", event_id, e.what());
        return std::nullopt;
    }
}

std::optional<Bytes> EventStore::read_original(const std::string& event_id) {
    auto dir = record_dir(event_id);
    if (!dir) return std::nullopt;
    return read_file_bytes(*dir / Config::EVENT_ORIGINAL_FILE);
}

std::optional<Bytes> EventStore::read_face(const std::string& event_id, int face_index) {
    auto dir = record_dir(event_id);
    if (!dir || face_index < 0) return std::nullopt;
    return read_file_bytes(*dir / face_file_name(face_index));
}

// ==================== DELETE ====================

Status EventStore::remove(const std::string& event_id) {
    auto dir = record_dir(event_id);
    std::error_code ec;
    if (!dir || !fs::is_directory(*dir, ec)) {
        return Status::NotFound;
    }

    fs::remove_all(*dir, ec);
    if (ec) {
        throw StorageError("No se pudo borrar " + event_id + ": " + ec.message());
    }

    spdlog::info("Deleted recognition event: event_id={}", event_id);
    return Status::Ok;
}

}  // namespace facevault
