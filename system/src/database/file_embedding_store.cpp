#include "database/file_embedding_store.hpp"
#include "database/npy_io.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace facevault {

FileEmbeddingStore::FileEmbeddingStore(const fs::path& known_root, FaceDetector& detector)
    : EmbeddingStore(detector), known_root(known_root)
{
    init_root();
}

FileEmbeddingStore::FileEmbeddingStore(const fs::path& known_root)
    : EmbeddingStore(), known_root(known_root)
{
    init_root();
}

void FileEmbeddingStore::init_root() {
    std::error_code ec;
    fs::create_directories(known_root, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + known_root.string() + ": " + ec.message());
    }
    spdlog::info("Embedding store (filesystem): {}", known_root.string());
}

fs::path FileEmbeddingStore::identity_dir(const std::string& identity) const {
    return known_root / identity;
}

bool FileEmbeddingStore::has_identity(const std::string& identity) {
    if (!is_safe_name(identity)) return false;
    std::error_code ec;
    return fs::is_directory(identity_dir(identity), ec);
}

std::optional<fs::path> FileEmbeddingStore::resolve_image(const std::string& identity,
                                                          const std::string& image_ref) const {
    if (!is_safe_name(identity) || image_ref.empty()) return std::nullopt;

    // solo "<clave>.jpg": el .npy se borra junto con su imagen, nunca por separado
    fs::path ref(image_ref);
    if (ref.filename().string() != image_ref || ref.extension() != ".jpg") {
        spdlog::warn("Referencia de imagen invalida: identity={}, ref={}", identity, image_ref);
        return std::nullopt;
    }

    fs::path dir = identity_dir(identity);
    fs::path file = dir / image_ref;
    if (!is_within(dir, file)) {
        spdlog::error("Path traversal rechazado: identity={}, ref={}", identity, image_ref);
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) return std::nullopt;
    return file;
}

// ==================== WRITE ====================

void FileEmbeddingStore::save_enrollment(const std::string& identity,
                                         const std::string& key,
                                         const Embedding& embedding,
                                         const Bytes& image_bytes)
{
    std::lock_guard<std::mutex> lock(write_mutex);

    fs::path dir = identity_dir(identity);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError("No se pudo crear " + dir.string() + ": " + ec.message());
    }

    fs::path image_file = dir / (key + ".jpg");
    fs::path encoding_file = dir / (key + ".npy");

    // imagen primero; el .npy es lo que hace visible el registro al snapshot
    write_file_bytes(image_file, image_bytes);
    try {
        save_npy(encoding_file, embedding);
    } catch (const StorageError&) {
        fs::remove(image_file, ec);
        throw;
    }

    spdlog::debug("Saved {} + {}", image_file.string(), encoding_file.filename().string());
}

Status FileEmbeddingStore::remove_enrollment(const std::string& identity, const std::string& image_ref) {
    std::lock_guard<std::mutex> lock(write_mutex);

    auto file = resolve_image(identity, image_ref);
    if (!file) return Status::NotFound;

    fs::path encoding_file = *file;
    encoding_file.replace_extension(".npy");

    std::error_code ec;
    if (!fs::remove(*file, ec) || ec) {
        throw StorageError("No se pudo borrar " + file->string() + ": " + ec.message());
    }
    fs::remove(encoding_file, ec);
    if (ec) {
        spdlog::warn("No se pudo borrar {}: {}", encoding_file.string(), ec.message());
    }
    return Status::Ok;
}

Status FileEmbeddingStore::remove_identity(const std::string& identity) {
    std::lock_guard<std::mutex> lock(write_mutex);

    if (!has_identity(identity)) return Status::NotFound;

    std::error_code ec;
    fs::remove_all(identity_dir(identity), ec);
    if (ec) {
        throw StorageError("No se pudo borrar " + identity + ": " + ec.message());
    }
    return Status::Ok;
}

// ==================== QUERY ====================

std::vector<IdentityInfo> FileEmbeddingStore::list_identities() {
    std::vector<IdentityInfo> result;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(known_root, ec)) {
        if (!entry.is_directory()) continue;

        IdentityInfo info;
        info.name = entry.path().filename().string();
        for (const auto& f : fs::directory_iterator(entry.path(), ec)) {
            if (f.is_regular_file() && f.path().extension() == ".jpg") {
                info.enrollment_count++;
            }
        }
        result.push_back(info);
    }

    std::sort(result.begin(), result.end(),
              [](const IdentityInfo& a, const IdentityInfo& b) { return a.name < b.name; });
    return result;
}

std::vector<std::string> FileEmbeddingStore::list_enrollments(const std::string& identity) {
    std::vector<std::string> refs;
    if (!has_identity(identity)) return refs;

    std::error_code ec;
    for (const auto& f : fs::directory_iterator(identity_dir(identity), ec)) {
        if (f.is_regular_file() && f.path().extension() == ".jpg") {
            refs.push_back(f.path().filename().string());
        }
    }

    std::sort(refs.rbegin(), refs.rend());
    return refs;
}

std::optional<Bytes> FileEmbeddingStore::read_enrollment_image(const std::string& identity,
                                                               const std::string& image_ref) {
    auto file = resolve_image(identity, image_ref);
    if (!file) return std::nullopt;
    return read_file_bytes(*file);
}

EmbeddingSnapshot FileEmbeddingStore::load_snapshot() {
    EmbeddingSnapshot snapshot;

    std::vector<fs::path> dirs;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(known_root, ec)) {
        if (entry.is_directory()) dirs.push_back(entry.path());
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        std::vector<fs::path> files;
        for (const auto& f : fs::directory_iterator(dir, ec)) {
            if (f.is_regular_file() && f.path().extension() == ".npy") {
                files.push_back(f.path());
            }
        }
        std::sort(files.begin(), files.end());

        IdentityEmbeddings ident;
        ident.name = dir.filename().string();
        for (const auto& file : files) {
            auto emb = load_npy(file);
            if (emb) ident.embeddings.push_back(std::move(*emb));
        }

        if (!ident.embeddings.empty()) {
            snapshot.push_back(std::move(ident));
        }
    }

    return snapshot;
}

}  // namespace facevault
