// ============= include/recognition/pipeline.hpp =============
/*
 * Recognition Pipeline - deteccion + match + registro
 *
 * FLUJO por imagen:
 * 1. Detector -> boxes + embeddings (DetectionError aborta antes de escribir nada)
 * 2. Decodificar la imagen y recortar cada rostro (tambien antes de escribir)
 * 3. Match independiente de cada rostro contra el cache (orden de deteccion)
 * 4. Evento de reconocimiento: original + recortes + metadata (fallo = fatal)
 * 5. Un Unknown Face por cada rostro sin match (fallo = warning, no revierte el evento)
 *
 * Cero rostros: resultado vacio, pero el evento se escribe igual.
 */

#pragma once
#include "config.hpp"
#include "core/types.hpp"
#include "detection/face_detector.hpp"
#include "recognition/embedding_cache.hpp"
#include "database/event_store.hpp"
#include "database/unknown_face_store.hpp"
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace facevault {

struct ProcessResult {
    std::vector<FaceResult> faces;
    int total_faces = 0;
    std::string event_id;
    std::vector<std::string> unknown_ids;
    std::vector<std::string> warnings;
};

class RecognitionPipeline {
public:
    RecognitionPipeline(FaceDetector& detector,
                        EmbeddingCache& cache,
                        EventStore& events,
                        UnknownFaceStore& unknown_faces,
                        double tolerance = Config::DEFAULT_TOLERANCE);

    ProcessResult process(const Bytes& image_bytes);

    void set_tolerance(double t) { tolerance.store(t); }
    double get_tolerance() const { return tolerance.load(); }

private:
    FaceDetector& detector;
    EmbeddingCache& cache;
    EventStore& events;
    UnknownFaceStore& unknown_faces;
    std::atomic<double> tolerance;
};

// Nombres reconocidos, ordenados y sin duplicados (para el webhook)
std::vector<std::string> matched_identities(const ProcessResult& result);

// Respuesta de un solo rostro: (matched, nombre) del primero; (false, "") sin rostros
std::pair<bool, std::string> first_face_answer(const ProcessResult& result);

}  // namespace facevault
