// ============= include/detection/lazy_detector.hpp =============
/*
 * Lazy Face Detector
 *
 * Envuelve un detector real y lo construye en la primera llamada a detect().
 * Comandos que solo consultan o borran (identities, events list, settings)
 * nunca cargan los modelos ONNX.
 *
 * Si la fabrica lanza (modelos ausentes), detect() propaga el error y el
 * siguiente detect() vuelve a intentarlo.
 */

#pragma once
#include "detection/face_detector.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace facevault {

class LazyFaceDetector : public FaceDetector {
public:
    using Factory = std::function<std::unique_ptr<FaceDetector>()>;

    explicit LazyFaceDetector(Factory factory);

    std::vector<DetectedFace> detect(const Bytes& image_bytes) override;

    bool is_loaded();

private:
    Factory factory;
    std::unique_ptr<FaceDetector> impl;
    std::mutex load_mutex;

    FaceDetector& get();
};

}  // namespace facevault
