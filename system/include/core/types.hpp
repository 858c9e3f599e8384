// ============= include/core/types.hpp =============
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace facevault {

using Bytes = std::vector<unsigned char>;
using Embedding = std::vector<float>;

// Pixel box in the original image (face_recognition order: top, right, bottom, left)
struct BoundingBox {
    int top = 0;
    int right = 0;
    int bottom = 0;
    int left = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    bool empty() const { return width() <= 0 || height() <= 0; }

    bool operator==(const BoundingBox& o) const {
        return top == o.top && right == o.right && bottom == o.bottom && left == o.left;
    }
};

struct DetectedFace {
    BoundingBox box;
    Embedding embedding;
};

struct MatchResult {
    bool matched = false;
    std::string identity;               // vacío si no hay match
    std::optional<double> distance;     // ausente si no hay identidades
};

struct FaceResult {
    int face_index = 0;
    BoundingBox box;
    bool matched = false;
    std::string name;
    std::optional<double> distance;
    std::string face_image;             // "face_<index>.jpg"
};

enum class Status {
    Ok,
    NotFound,
    NoFaceDetected,
    InvalidName
};

const char* to_string(Status s);

// Primary value plus advisory warnings from best-effort side writes
template<typename T>
struct Outcome {
    T value{};
    std::vector<std::string> warnings;

    bool has_warnings() const { return !warnings.empty(); }
    void warn(std::string msg) { warnings.push_back(std::move(msg)); }
};

struct IdentityInfo {
    std::string name;
    int enrollment_count = 0;
};

}  // namespace facevault
