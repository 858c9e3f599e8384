// ============= include/detection/face_detector.hpp =============
/*
 * Face Detector - interfaz
 *
 * Entrada: bytes de imagen (JPEG/PNG/...)
 * Salida:  una entrada por rostro, en orden de deteccion:
 *          - bounding box (top/right/bottom/left, pixeles de la imagen original)
 *          - embedding de longitud fija
 *
 * Un resultado vacio es valido (cero rostros).
 * Bytes ilegibles -> DetectionError.
 */

#pragma once
#include "core/types.hpp"
#include <vector>

namespace facevault {

class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::vector<DetectedFace> detect(const Bytes& image_bytes) = 0;
};

}  // namespace facevault
