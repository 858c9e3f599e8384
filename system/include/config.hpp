// ============= include/config.hpp =============
#pragma once
#include <string>

namespace Config {

    // Storage defaults
    constexpr const char* DEFAULT_STORAGE_ROOT = "faces";
    constexpr const char* DEFAULT_STORAGE_BACKEND = "filesystem";
    constexpr const char* DEFAULT_SQLITE_PATH = "faces/known.db";

    constexpr const char* KNOWN_DIR = "known";
    constexpr const char* UNKNOWN_DIR = "unknown";
    constexpr const char* RECOGNITIONS_DIR = "recognitions";
    constexpr const char* SETTINGS_FILE = "settings.json";

    // Record file names
    constexpr const char* METADATA_FILE = "metadata.json";
    constexpr const char* UNKNOWN_IMAGE_FILE = "image.jpg";
    constexpr const char* UNKNOWN_FACE_FILE = "face.jpg";
    constexpr const char* EVENT_ORIGINAL_FILE = "original.jpg";

    constexpr const char* UNKNOWN_ID_PREFIX = "unknown_";
    constexpr const char* EVENT_ID_PREFIX = "recognition_";

    // Recognition defaults
    constexpr double DEFAULT_TOLERANCE = 0.75;
    constexpr int JPEG_QUALITY = 95;

    // Detector defaults (YuNet + SFace)
    constexpr const char* DEFAULT_DETECTION_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* DEFAULT_RECOGNITION_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr float DEFAULT_SCORE_THRESHOLD = 0.9f;
    constexpr float DEFAULT_NMS_THRESHOLD = 0.3f;
    constexpr int DEFAULT_TOP_K = 5000;

    // Logging
    constexpr const char* DEFAULT_LOG_LEVEL = "info";
    constexpr const char* DEFAULT_LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    constexpr const char* DEFAULT_CONFIG_FILE = "config.toml";
}
