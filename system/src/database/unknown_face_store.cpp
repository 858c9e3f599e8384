#include "database/unknown_face_store.hpp"
#include "detection/image_codec.hpp"
#include "core/errors.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace facevault {

UnknownFaceStore::UnknownFaceStore(const fs::path& storage_root, FaceDetector* detector)
    : storage_root(storage_root),
      unknown_root(storage_root / Config::UNKNOWN_DIR),
      detector(detector)
{
    std::error_code ec;
    fs::create_directories(unknown_root, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + unknown_root.string() + ": " + ec.message());
    }
}

std::optional<fs::path> UnknownFaceStore::record_dir(const std::string& id) const {
    if (!is_safe_name(id)) return std::nullopt;
    return unknown_root / id;
}

// ==================== CREATE ====================

Outcome<std::string> UnknownFaceStore::create(const Bytes& image_bytes, const Bytes& face_bytes) {
    Outcome<std::string> out;

    TimeKey tk = next_time_key();
    std::string face_id = Config::UNKNOWN_ID_PREFIX + tk.key;
    fs::path dir = unknown_root / face_id;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + dir.string() + ": " + ec.message());
    }

    fs::path image_file = dir / Config::UNKNOWN_IMAGE_FILE;
    write_file_bytes(image_file, image_bytes);
    spdlog::info("Saved unknown face full image: face_id={}, size={} bytes", face_id, image_bytes.size());

    bool has_face = false;
    if (!face_bytes.empty()) {
        try {
            write_file_bytes(dir / Config::UNKNOWN_FACE_FILE, face_bytes);
            has_face = true;
        } catch (const StorageError& e) {
            spdlog::warn("Failed to save cropped face (continuing anyway): face_id={}, error={}",
                         face_id, e.what());
            out.warn("cropped face not saved for " + face_id + ": " + e.what());
        }
    }

    Json::Value meta;
    meta["id"] = face_id;
    meta["timestamp"] = tk.iso;
    meta["image_path"] = (fs::path(Config::UNKNOWN_DIR) / face_id / Config::UNKNOWN_IMAGE_FILE).generic_string();
    meta["has_face_image"] = has_face;

    write_json_file(dir / Config::METADATA_FILE, meta);

    out.value = face_id;
    return out;
}

Outcome<std::string> UnknownFaceStore::create(const Bytes& image_bytes) {
    std::vector<std::string> warnings;
    Bytes face = extract_face(image_bytes, warnings);

    auto out = create(image_bytes, face);
    out.warnings.insert(out.warnings.begin(), warnings.begin(), warnings.end());
    return out;
}

Bytes UnknownFaceStore::extract_face(const Bytes& image_bytes, std::vector<std::string>& warnings) {
    if (!detector) {
        warnings.push_back("no detector available for face extraction");
        return {};
    }

    try {
        auto faces = detector->detect(image_bytes);
        if (faces.empty()) {
            spdlog::warn("No faces detected in image for extraction");
            warnings.push_back("no face detected for extraction");
            return {};
        }

        cv::Mat img = decode_image(image_bytes);
        Bytes crop = crop_to_jpeg(img, faces.front().box, Config::JPEG_QUALITY);
        if (crop.empty()) {
            warnings.push_back("face crop is empty");
        }
        return crop;
    } catch (const DetectionError& e) {
        spdlog::warn("Error extracting face from image: {}", e.what());
        warnings.push_back(std::string("face extraction failed: ") + e.what());
        return {};
    }
}

// ==================== QUERY ====================

std::optional<UnknownFace> UnknownFaceStore::parse_metadata(const fs::path& dir) {
    auto meta = read_json_file(dir / Config::METADATA_FILE);
    if (!meta || !meta->isObject()) return std::nullopt;

    UnknownFace face;
    face.id = (*meta).get("id", dir.filename().string()).asString();
    face.timestamp = (*meta).get("timestamp", "").asString();
    face.image_path = (*meta).get("image_path", "").asString();
    face.has_face_image = (*meta).get("has_face_image", false).asBool();
    return face;
}

std::vector<UnknownFace> UnknownFaceStore::list() {
    std::vector<UnknownFace> faces;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(unknown_root, ec)) {
        if (!entry.is_directory()) continue;
        if (!fs::exists(entry.path() / Config::UNKNOWN_IMAGE_FILE, ec)) continue;

        try {
            auto face = parse_metadata(entry.path());
            if (face) faces.push_back(*face);
        } catch (const StorageError& e) {
            spdlog::error("Error loading unknown face {}: {}", entry.path().filename().string(), e.what());
        }
    }

    std::sort(faces.begin(), faces.end(), [](const UnknownFace& a, const UnknownFace& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.id > b.id;
    });
    return faces;
}

std::optional<UnknownFace> UnknownFaceStore::get(const std::string& id) {
    auto dir = record_dir(id);
    if (!dir) return std::nullopt;

    try {
        return parse_metadata(*dir);
    } catch (const StorageError& e) {
        spdlog::error("Error loading unknown face {}: {}", id, e.what());
        return std::nullopt;
    }
}

std::optional<Bytes> UnknownFaceStore::read_image(const std::string& id, UnknownImage kind) {
    auto dir = record_dir(id);
    if (!dir) return std::nullopt;

    const char* file = kind == UnknownImage::Face ? Config::UNKNOWN_FACE_FILE : Config::UNKNOWN_IMAGE_FILE;
    return read_file_bytes(*dir / file);
}

std::optional<Bytes> UnknownFaceStore::read_best_image(const std::string& id) {
    auto data = read_image(id, UnknownImage::Face);
    if (data && !data->empty()) {
        spdlog::info("Using cropped face image: face_id={}, size={} bytes", id, data->size());
        return data;
    }

    data = read_image(id, UnknownImage::Full);
    if (data) {
        spdlog::info("Using full image: face_id={}, size={} bytes", id, data->size());
    }
    return data;
}

// ==================== DELETE ====================

Status UnknownFaceStore::remove(const std::string& id) {
    auto dir = record_dir(id);
    std::error_code ec;
    if (!dir || !fs::is_directory(*dir, ec)) {
        return Status::NotFound;
    }

    fs::remove_all(*dir, ec);
    if (ec) {
        throw StorageError("No se pudo borrar " + id + ": " + ec.message());
    }

    spdlog::info("Deleted unknown face: face_id={}", id);
    return Status::Ok;
}

}  // namespace facevault
