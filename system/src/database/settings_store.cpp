#include "database/settings_store.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace facevault {

SettingsStore::SettingsStore(const fs::path& storage_root, double default_tolerance)
    : settings_file(storage_root / Config::SETTINGS_FILE),
      default_tolerance(default_tolerance)
{
    std::error_code ec;
    fs::create_directories(storage_root, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + storage_root.string() + ": " + ec.message());
    }
}

bool SettingsStore::exists() const {
    std::error_code ec;
    return fs::exists(settings_file, ec);
}

Settings SettingsStore::load() const {
    Settings settings;
    settings.tolerance = default_tolerance;

    auto json = read_json_file(settings_file);
    if (!json) {
        return settings;
    }
    if (!json->isObject()) {
        throw StorageError("settings.json is not an object");
    }

    settings.webhook_url = json->get("webhook_url", "").asString();
    settings.webhook_enabled = json->get("webhook_enabled", false).asBool();

    const Json::Value& tol = (*json)["tolerance"];
    if (tol.isNumeric()) {
        settings.tolerance = tol.asDouble();
    }
    return settings;
}

void SettingsStore::save(const Settings& settings) {
    Json::Value json;
    json["webhook_url"] = settings.webhook_url;
    json["webhook_enabled"] = settings.webhook_enabled;
    json["tolerance"] = settings.tolerance;

    write_json_file(settings_file, json);

    spdlog::info("Settings updated: webhook_enabled={}, webhook_url={}, tolerance={:.2f}",
                 settings.webhook_enabled,
                 settings.webhook_url.empty() ? "empty" : std::string(20, '*'),
                 settings.tolerance);
}

bool should_notify(const Settings& settings, const std::vector<std::string>& matched_names) {
    return settings.webhook_enabled &&
           !trim_copy(settings.webhook_url).empty() &&
           !matched_names.empty();
}

}  // namespace facevault
