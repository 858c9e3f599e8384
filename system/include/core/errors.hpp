// ============= include/core/errors.hpp =============
#pragma once
#include <stdexcept>
#include <string>

namespace facevault {

// Imagen ilegible o fallo del detector. Se lanza antes de cualquier escritura.
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Fallo al escribir un artefacto primario (evento, imagen requerida, metadata)
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace facevault
