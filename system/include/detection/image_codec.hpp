// ============= include/detection/image_codec.hpp =============
#pragma once
#include "core/types.hpp"
#include <opencv2/opencv.hpp>

namespace facevault {

// Decodifica bytes a BGR. Lanza DetectionError si la imagen no se puede leer.
cv::Mat decode_image(const Bytes& image_bytes);

// Recorta `box` (ajustado a los limites de la imagen) y lo codifica como JPEG.
// Devuelve vacio si el box queda sin area.
Bytes crop_to_jpeg(const cv::Mat& image, const BoundingBox& box, int quality = 95);

Bytes encode_jpeg(const cv::Mat& image, int quality = 95);

BoundingBox clamp_box(const BoundingBox& box, int width, int height);

}  // namespace facevault
