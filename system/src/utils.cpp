#include "utils.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace facevault {

const char* to_string(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::NotFound: return "not found";
        case Status::NoFaceDetected: return "no face detected";
        case Status::InvalidName: return "invalid name";
    }
    return "unknown";
}

// ==================== SIMPLE TOML ====================

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

bool SimpleToml::parse(const std::string& content) {
    std::istringstream in(content);
    std::string line, section;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            // comentario al final de la linea
            auto hash = val.find('#');
            if (hash != std::string::npos) val = trim(val.substr(0, hash));
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try { return std::stoi(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("config: '{}' no es un entero, usando {}", key, def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try { return std::stof(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("config: '{}' no es un numero, usando {}", key, def);
        return def;
    }
}

double SimpleToml::get_double(const std::string& key, double def) const {
    if (!has(key)) return def;
    try { return std::stod(get(key)); }
    catch (const std::exception&) {
        spdlog::warn("config: '{}' no es un numero, usando {}", key, def);
        return def;
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    return v == "true" || v == "1";
}

// ==================== TIME KEYS ====================

TimeKey next_time_key() {
    static std::mutex key_mutex;
    static int64_t last_us = 0;

    std::lock_guard<std::mutex> lock(key_mutex);

    auto now = std::chrono::system_clock::now();
    int64_t us = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count();
    if (us <= last_us) {
        us = last_us + 1;
    }
    last_us = us;

    std::time_t secs = static_cast<std::time_t>(us / 1000000);
    int micros = static_cast<int>(us % 1000000);
    std::tm tm_local{};
    localtime_r(&secs, &tm_local);

    TimeKey tk;
    {
        std::ostringstream ss;
        ss << std::put_time(&tm_local, "%Y%m%d_%H%M%S") << "_"
           << std::setw(6) << std::setfill('0') << micros;
        tk.key = ss.str();
    }
    {
        std::ostringstream ss;
        ss << std::put_time(&tm_local, "%Y-%m-%dT%H:%M:%S") << "."
           << std::setw(6) << std::setfill('0') << micros;
        tk.iso = ss.str();
    }
    return tk;
}

// ==================== NAMES & PATHS ====================

std::string trim_copy(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_safe_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (trim_copy(name) != name) return false;

    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    std::error_code ec;
    auto base = std::filesystem::weakly_canonical(root, ec);
    if (ec) return false;
    auto target = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) return false;

    auto rel = target.lexically_relative(base);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

// ==================== FILE IO ====================

std::optional<Bytes> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) return std::nullopt;

    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return data;
}

void write_file_bytes(const std::filesystem::path& path, const Bytes& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StorageError("cannot open for writing: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file.good()) {
        throw StorageError("write failed: " + path.string());
    }
}

void write_file_atomic(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("cannot open for writing: " + tmp.string());
        }
        file << content;
        file.flush();
        if (!file.good()) {
            throw StorageError("write failed: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw StorageError("rename failed: " + path.string());
    }
}

// ==================== JSON ====================

std::optional<Json::Value> read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, file, &root, &errs)) {
        throw StorageError("invalid JSON in " + path.string() + ": " + errs);
    }
    return root;
}

void write_json_file(const std::filesystem::path& path, const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    write_file_atomic(path, Json::writeString(builder, value));
}

}  // namespace facevault
