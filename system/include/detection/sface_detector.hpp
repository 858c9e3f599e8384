// ============= include/detection/sface_detector.hpp =============
/*
 * YuNet + SFace - OpenCV DNN (CPU)
 *
 * CARACTERÍSTICAS:
 * - Deteccion: cv::FaceDetectorYN (YuNet ONNX), 5 landmarks por rostro
 * - Alineacion: FaceRecognizerSF::alignCrop (112x112)
 * - Embedding: FaceRecognizerSF::feature, 128 floats
 * - Sin GPU: una imagen por llamada, sincrono
 *
 * SALIDA:
 * - Rostros en el orden devuelto por YuNet
 * - Boxes ajustados a los limites de la imagen
 */

#pragma once
#include "detection/face_detector.hpp"
#include <opencv2/opencv.hpp>
#include <opencv2/objdetect.hpp>
#include <string>
#include <mutex>

namespace facevault {

class SFaceDetector : public FaceDetector {
public:
    struct Options {
        std::string detection_model;
        std::string recognition_model;
        float score_threshold;
        float nms_threshold;
        int top_k;

        Options();
    };

    explicit SFaceDetector(const Options& options);

    std::vector<DetectedFace> detect(const Bytes& image_bytes) override;

    int get_embedding_size() const { return embedding_size; }

private:
    Options options;
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    std::mutex infer_mutex;     // YuNet cambia input size por imagen
    int embedding_size = 128;

    static BoundingBox to_box(const cv::Mat& face_row, int width, int height);
};

}  // namespace facevault
