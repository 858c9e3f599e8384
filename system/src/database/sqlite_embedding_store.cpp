#include "database/sqlite_embedding_store.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>

namespace facevault {

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteEmbeddingStore::SqliteEmbeddingStore(const std::string& db_path, FaceDetector& detector)
    : EmbeddingStore(detector), db(nullptr), db_path(db_path)
{
    open();
}

SqliteEmbeddingStore::SqliteEmbeddingStore(const std::string& db_path)
    : EmbeddingStore(), db(nullptr), db_path(db_path)
{
    open();
}

void SqliteEmbeddingStore::open() {
    spdlog::info("Inicializando Embedding Store (SQLite)");
    spdlog::info("   Path: {}", db_path);

    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw StorageError("No se pudo crear " + p.parent_path().string() + ": " + ec.message());
        }
    }

    if (!init_database()) {
        throw StorageError("No se pudo inicializar la base de datos: " + db_path);
    }

    spdlog::info("Database ready ({} enrollments)", count_enrollments());
}

SqliteEmbeddingStore::~SqliteEmbeddingStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool SqliteEmbeddingStore::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", sqlite3_errmsg(db));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }

    if (!create_tables()) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

bool SqliteEmbeddingStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS enrollments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            image_ref TEXT NOT NULL,
            embedding BLOB NOT NULL,
            image BLOB NOT NULL,
            created_at TEXT NOT NULL,
            UNIQUE(name, image_ref)
        );
        CREATE INDEX IF NOT EXISTS idx_enrollments_name ON enrollments(name);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : "?");
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> SqliteEmbeddingStore::serialize_embedding(const Embedding& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

Embedding SqliteEmbeddingStore::deserialize_embedding(const unsigned char* data, int size) {
    Embedding emb(size / sizeof(float));
    if (data && !emb.empty()) {
        std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    }
    return emb;
}

// ==================== WRITE ====================

void SqliteEmbeddingStore::save_enrollment(const std::string& identity,
                                           const std::string& key,
                                           const Embedding& embedding,
                                           const Bytes& image_bytes)
{
    std::lock_guard<std::mutex> lock(db_mutex);

    auto blob = serialize_embedding(embedding);
    std::string image_ref = key + ".jpg";
    std::string created_at = next_time_key().iso;

    const char* sql = "INSERT INTO enrollments (name, image_ref, embedding, image, created_at) "
                      "VALUES (?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, image_ref.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 4, image_bytes.data(), static_cast<int>(image_bytes.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, created_at.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("Failed to insert: ") + sqlite3_errmsg(db));
    }

    spdlog::debug("Inserted enrollment {} ({})", identity, image_ref);
}

Status SqliteEmbeddingStore::remove_enrollment(const std::string& identity, const std::string& image_ref) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "DELETE FROM enrollments WHERE name = ? AND image_ref = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, image_ref.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("Failed to delete: ") + sqlite3_errmsg(db));
    }
    return sqlite3_changes(db) > 0 ? Status::Ok : Status::NotFound;
}

Status SqliteEmbeddingStore::remove_identity(const std::string& identity) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "DELETE FROM enrollments WHERE name = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("Failed to delete: ") + sqlite3_errmsg(db));
    }
    return sqlite3_changes(db) > 0 ? Status::Ok : Status::NotFound;
}

// ==================== QUERY ====================

bool SqliteEmbeddingStore::has_identity(const std::string& identity) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "SELECT 1 FROM enrollments WHERE name = ? LIMIT 1";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

std::vector<IdentityInfo> SqliteEmbeddingStore::list_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<IdentityInfo> result;

    const char* sql = "SELECT name, COUNT(*) FROM enrollments GROUP BY name ORDER BY name";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        IdentityInfo info;
        info.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        info.enrollment_count = sqlite3_column_int(stmt, 1);
        result.push_back(info);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<std::string> SqliteEmbeddingStore::list_enrollments(const std::string& identity) {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<std::string> refs;

    const char* sql = "SELECT image_ref FROM enrollments WHERE name = ? ORDER BY image_ref DESC";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return refs;

    sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        refs.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }

    sqlite3_finalize(stmt);
    return refs;
}

std::optional<Bytes> SqliteEmbeddingStore::read_enrollment_image(const std::string& identity,
                                                                 const std::string& image_ref) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "SELECT image FROM enrollments WHERE name = ? AND image_ref = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return std::nullopt;

    sqlite3_bind_text(stmt, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, image_ref.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Bytes> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* blob = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, 0));
        int size = sqlite3_column_bytes(stmt, 0);
        result = blob ? Bytes(blob, blob + size) : Bytes();
    }

    sqlite3_finalize(stmt);
    return result;
}

EmbeddingSnapshot SqliteEmbeddingStore::load_snapshot() {
    std::lock_guard<std::mutex> lock(db_mutex);
    EmbeddingSnapshot snapshot;

    const char* sql = "SELECT name, embedding FROM enrollments ORDER BY name, image_ref";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("Failed to prepare query: ") + sqlite3_errmsg(db));
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const unsigned char* blob = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, 1));
        int blob_size = sqlite3_column_bytes(stmt, 1);

        if (snapshot.empty() || snapshot.back().name != name) {
            snapshot.push_back({name, {}});
        }
        snapshot.back().embeddings.push_back(deserialize_embedding(blob, blob_size));
    }

    sqlite3_finalize(stmt);
    return snapshot;
}

int SqliteEmbeddingStore::count_enrollments() {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "SELECT COUNT(*) FROM enrollments";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return 0;

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

}  // namespace facevault
