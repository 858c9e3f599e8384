#include "detection/image_codec.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace facevault {

cv::Mat decode_image(const Bytes& image_bytes) {
    if (image_bytes.empty()) {
        throw DetectionError("empty image");
    }

    cv::Mat img;
    try {
        img = cv::imdecode(image_bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DetectionError(std::string("cannot decode image: ") + e.what());
    }

    if (img.empty()) {
        throw DetectionError("cannot decode image (" + std::to_string(image_bytes.size()) + " bytes)");
    }
    return img;
}

BoundingBox clamp_box(const BoundingBox& box, int width, int height) {
    BoundingBox b;
    b.left = std::clamp(box.left, 0, width);
    b.right = std::clamp(box.right, 0, width);
    b.top = std::clamp(box.top, 0, height);
    b.bottom = std::clamp(box.bottom, 0, height);
    return b;
}

Bytes encode_jpeg(const cv::Mat& image, int quality) {
    Bytes out;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", image, out, params)) {
        return {};
    }
    return out;
}

Bytes crop_to_jpeg(const cv::Mat& image, const BoundingBox& box, int quality) {
    BoundingBox b = clamp_box(box, image.cols, image.rows);
    if (b.empty()) {
        spdlog::warn("crop vacio: box=({},{},{},{}) imagen={}x{}",
                     box.top, box.right, box.bottom, box.left, image.cols, image.rows);
        return {};
    }

    cv::Rect roi(b.left, b.top, b.width(), b.height());
    return encode_jpeg(image(roi), quality);
}

}  // namespace facevault
