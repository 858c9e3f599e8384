// ============= include/database/sqlite_embedding_store.hpp =============
/*
 * Embedding Store - SQLite Backend
 *
 * TABLA: enrollments
 * ├── id (INTEGER PRIMARY KEY)
 * ├── name (TEXT)            - identidad
 * ├── image_ref (TEXT)       - "<clave>.jpg", unico por identidad
 * ├── embedding (BLOB)       - N floats
 * ├── image (BLOB)           - imagen original
 * └── created_at (TEXT)      - ISO 8601
 *
 * Mismo contrato que FileEmbeddingStore; no depende del layout known/.
 */

#pragma once
#include "database/embedding_store.hpp"
#include <mutex>
#include <sqlite3.h>

namespace facevault {

class SqliteEmbeddingStore : public EmbeddingStore {
public:
    SqliteEmbeddingStore(const std::string& db_path, FaceDetector& detector);
    explicit SqliteEmbeddingStore(const std::string& db_path);
    ~SqliteEmbeddingStore() override;

    std::vector<IdentityInfo> list_identities() override;
    std::vector<std::string> list_enrollments(const std::string& identity) override;
    std::optional<Bytes> read_enrollment_image(const std::string& identity,
                                               const std::string& image_ref) override;
    EmbeddingSnapshot load_snapshot() override;
    bool has_identity(const std::string& identity) override;

    int count_enrollments();

    bool is_open() const { return db != nullptr; }

protected:
    void save_enrollment(const std::string& identity,
                         const std::string& key,
                         const Embedding& embedding,
                         const Bytes& image_bytes) override;
    Status remove_enrollment(const std::string& identity, const std::string& image_ref) override;
    Status remove_identity(const std::string& identity) override;

private:
    sqlite3* db;
    std::string db_path;
    std::mutex db_mutex;

    void open();
    bool init_database();
    bool create_tables();

    static std::vector<unsigned char> serialize_embedding(const Embedding& emb);
    static Embedding deserialize_embedding(const unsigned char* data, int size);
};

}  // namespace facevault
