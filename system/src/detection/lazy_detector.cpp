#include "detection/lazy_detector.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace facevault {

LazyFaceDetector::LazyFaceDetector(Factory factory)
    : factory(std::move(factory)) {}

FaceDetector& LazyFaceDetector::get() {
    std::lock_guard<std::mutex> lock(load_mutex);
    if (!impl) {
        spdlog::debug("Cargando detector de rostros");
        impl = factory();
        if (!impl) {
            throw DetectionError("La fabrica del detector no devolvio instancia");
        }
    }
    return *impl;
}

std::vector<DetectedFace> LazyFaceDetector::detect(const Bytes& image_bytes) {
    return get().detect(image_bytes);
}

bool LazyFaceDetector::is_loaded() {
    std::lock_guard<std::mutex> lock(load_mutex);
    return impl != nullptr;
}

}  // namespace facevault
