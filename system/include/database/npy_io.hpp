// ============= include/database/npy_io.hpp =============
/*
 * Lectura/escritura de embeddings en formato NumPy .npy (v1.0)
 *
 * Soportado: arrays 1-D, little endian, '<f8' o '<f4', C order.
 * Se escribe siempre '<f8' (float64), igual que los .npy existentes en known/.
 */

#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace facevault {

// Lanza StorageError
void save_npy(const std::filesystem::path& path, const Embedding& embedding);

// std::nullopt si el archivo no existe o el formato no es soportado
std::optional<Embedding> load_npy(const std::filesystem::path& path);

Bytes encode_npy(const Embedding& embedding);
std::optional<Embedding> decode_npy(const Bytes& data);

}  // namespace facevault
