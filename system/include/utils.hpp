// ============= include/utils.hpp =============
#pragma once
#include "core/types.hpp"
#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include <json/json.h>

namespace facevault {

// Lector minimo de TOML: secciones, key = value, strings entre comillas, comentarios '#'
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    bool parse(const std::string& content);

    bool has(const std::string& key) const { return values.count(key) > 0; }

    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;
};

// Clave temporal con precision de microsegundos, estrictamente creciente en el proceso.
//   key: "20251124_143052_123456"  (orden lexicografico = orden de creacion)
//   iso: "2025-11-24T14:30:52.123456"
struct TimeKey {
    std::string key;
    std::string iso;
};

TimeKey next_time_key();

std::string trim_copy(const std::string& s);

// Nombre usable como directorio: sin separadores, sin '.'/'..', sin caracteres de control
bool is_safe_name(const std::string& name);

// true si `candidate` resuelve dentro de `root`
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

// ===== FILE IO =====

std::optional<Bytes> read_file_bytes(const std::filesystem::path& path);

// Lanza StorageError
void write_file_bytes(const std::filesystem::path& path, const Bytes& data);

// Escribe en "<path>.tmp" y renombra; los lectores nunca ven un archivo a medias
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

// ===== JSON =====

// std::nullopt si no existe; lanza StorageError si no se puede parsear
std::optional<Json::Value> read_json_file(const std::filesystem::path& path);

void write_json_file(const std::filesystem::path& path, const Json::Value& value);

}  // namespace facevault
