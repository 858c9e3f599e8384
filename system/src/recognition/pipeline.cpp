#include "recognition/pipeline.hpp"
#include "detection/image_codec.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace facevault {

RecognitionPipeline::RecognitionPipeline(FaceDetector& detector,
                                         EmbeddingCache& cache,
                                         EventStore& events,
                                         UnknownFaceStore& unknown_faces,
                                         double tolerance)
    : detector(detector),
      cache(cache),
      events(events),
      unknown_faces(unknown_faces),
      tolerance(tolerance)
{
}

ProcessResult RecognitionPipeline::process(const Bytes& image_bytes) {
    auto t_start = std::chrono::steady_clock::now();
    ProcessResult result;

    // ===== DETECCION (sin escrituras) =====
    std::vector<DetectedFace> detections = detector.detect(image_bytes);
    cv::Mat image = decode_image(image_bytes);

    std::vector<Bytes> crops;
    crops.reserve(detections.size());
    for (const auto& det : detections) {
        crops.push_back(crop_to_jpeg(image, det.box, Config::JPEG_QUALITY));
    }

    // ===== MATCH =====
    const double tol = tolerance.load();
    for (size_t i = 0; i < detections.size(); ++i) {
        MatchResult m = cache.match(detections[i].embedding, tol);

        FaceResult face;
        face.face_index = static_cast<int>(i);
        face.box = detections[i].box;
        face.matched = m.matched;
        face.name = m.identity;
        face.distance = m.distance;
        result.faces.push_back(std::move(face));
    }
    result.total_faces = static_cast<int>(result.faces.size());

    // ===== EVENTO (fatal si falla) =====
    RecognitionEvent event = events.create(image_bytes, result.faces, crops);
    result.event_id = event.event_id;
    result.faces = event.faces;

    // ===== UNKNOWN FACES (best-effort) =====
    for (size_t i = 0; i < result.faces.size(); ++i) {
        const FaceResult& face = result.faces[i];
        if (face.matched) continue;

        try {
            Outcome<std::string> created = unknown_faces.create(image_bytes, crops[i]);
            result.unknown_ids.push_back(created.value);
            for (auto& w : created.warnings) {
                result.warnings.push_back(std::move(w));
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to save unknown face {} of {}: {}", face.face_index, result.event_id, e.what());
            result.warnings.push_back("unknown face " + std::to_string(face.face_index) +
                                      " not saved: " + e.what());
        }
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_start).count();

    int known = static_cast<int>(std::count_if(result.faces.begin(), result.faces.end(),
                                               [](const FaceResult& f) { return f.matched; }));
    spdlog::info("Recognition {}: {} faces, {} known, {} unknown ({} ms)",
                 result.event_id, result.total_faces, known, result.total_faces - known, ms);
    return result;
}

std::vector<std::string> matched_identities(const ProcessResult& result) {
    std::vector<std::string> names;
    for (const auto& face : result.faces) {
        if (face.matched && !face.name.empty()) names.push_back(face.name);
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

std::pair<bool, std::string> first_face_answer(const ProcessResult& result) {
    if (result.faces.empty()) {
        return {false, ""};
    }
    const FaceResult& first = result.faces.front();
    return {first.matched, first.matched ? first.name : std::string()};
}

}  // namespace facevault
