#include "detection/sface_detector.hpp"
#include "detection/image_codec.hpp"
#include "core/errors.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>

namespace facevault {

SFaceDetector::Options::Options()
    : detection_model(Config::DEFAULT_DETECTION_MODEL),
      recognition_model(Config::DEFAULT_RECOGNITION_MODEL),
      score_threshold(Config::DEFAULT_SCORE_THRESHOLD),
      nms_threshold(Config::DEFAULT_NMS_THRESHOLD),
      top_k(Config::DEFAULT_TOP_K) {}

// ==================== CONSTRUCTOR ====================

SFaceDetector::SFaceDetector(const Options& options)
    : options(options)
{
    spdlog::info("Inicializando YuNet + SFace");
    spdlog::info("   Detection model: {}", options.detection_model);
    spdlog::info("   Recognition model: {}", options.recognition_model);
    spdlog::info("   Score threshold: {:.2f}", options.score_threshold);

    if (!std::filesystem::exists(options.detection_model)) {
        throw std::runtime_error("No existe el modelo de deteccion: " + options.detection_model);
    }
    if (!std::filesystem::exists(options.recognition_model)) {
        throw std::runtime_error("No existe el modelo de reconocimiento: " + options.recognition_model);
    }

    detector = cv::FaceDetectorYN::create(
        options.detection_model, "", cv::Size(320, 320),
        options.score_threshold, options.nms_threshold, options.top_k);
    recognizer = cv::FaceRecognizerSF::create(options.recognition_model, "");

    if (!detector || !recognizer) {
        throw std::runtime_error("No se pudieron cargar los modelos YuNet/SFace");
    }

    spdlog::info("✓ Detector ready (embedding size: {})", embedding_size);
}

// ==================== DETECT ====================

BoundingBox SFaceDetector::to_box(const cv::Mat& face_row, int width, int height) {
    // fila YuNet: x, y, w, h, 5 landmarks (x,y), score
    float x = face_row.at<float>(0, 0);
    float y = face_row.at<float>(0, 1);
    float w = face_row.at<float>(0, 2);
    float h = face_row.at<float>(0, 3);

    BoundingBox box;
    box.left = static_cast<int>(std::lround(x));
    box.top = static_cast<int>(std::lround(y));
    box.right = static_cast<int>(std::lround(x + w));
    box.bottom = static_cast<int>(std::lround(y + h));
    return clamp_box(box, width, height);
}

std::vector<DetectedFace> SFaceDetector::detect(const Bytes& image_bytes) {
    cv::Mat img = decode_image(image_bytes);

    std::vector<DetectedFace> result;
    std::lock_guard<std::mutex> lock(infer_mutex);

    cv::Mat faces;
    try {
        detector->setInputSize(img.size());
        detector->detect(img, faces);
    } catch (const cv::Exception& e) {
        throw DetectionError(std::string("YuNet failed: ") + e.what());
    }

    if (faces.empty()) {
        spdlog::debug("0 rostros detectados ({}x{})", img.cols, img.rows);
        return result;
    }

    result.reserve(faces.rows);
    for (int i = 0; i < faces.rows; ++i) {
        cv::Mat aligned, feature;
        try {
            recognizer->alignCrop(img, faces.row(i), aligned);
            recognizer->feature(aligned, feature);
        } catch (const cv::Exception& e) {
            throw DetectionError(std::string("SFace failed: ") + e.what());
        }

        if (feature.empty() || feature.type() != CV_32F) {
            throw DetectionError("SFace returned an invalid embedding");
        }

        DetectedFace face;
        face.box = to_box(faces.row(i), img.cols, img.rows);
        cv::Mat flat = feature.reshape(1, 1);
        face.embedding.assign(flat.ptr<float>(0), flat.ptr<float>(0) + flat.cols);
        result.push_back(std::move(face));
    }

    spdlog::debug("{} rostro(s) detectados ({}x{})", result.size(), img.cols, img.rows);
    return result;
}

}  // namespace facevault
