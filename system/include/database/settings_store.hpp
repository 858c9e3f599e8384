// ============= include/database/settings_store.hpp =============
#pragma once
#include "config.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace facevault {

struct Settings {
    std::string webhook_url;
    bool webhook_enabled = false;
    double tolerance = Config::DEFAULT_TOLERANCE;
};

// settings.json; se reemplaza completo en cada save()
class SettingsStore {
public:
    SettingsStore(const std::filesystem::path& storage_root, double default_tolerance = Config::DEFAULT_TOLERANCE);

    // Valores por defecto si el archivo no existe. Lanza StorageError si esta corrupto.
    Settings load() const;

    void save(const Settings& settings);

    bool exists() const;

private:
    std::filesystem::path settings_file;
    double default_tolerance;
};

// webhook habilitado, URL no vacia y al menos un nombre reconocido
bool should_notify(const Settings& settings, const std::vector<std::string>& matched_names);

}  // namespace facevault
