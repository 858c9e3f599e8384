// ============= include/database/file_embedding_store.hpp =============
#pragma once
#include "database/embedding_store.hpp"
#include <filesystem>
#include <mutex>

namespace facevault {

// known/<identidad>/<clave>.jpg + <clave>.npy
class FileEmbeddingStore : public EmbeddingStore {
public:
    FileEmbeddingStore(const std::filesystem::path& known_root, FaceDetector& detector);
    explicit FileEmbeddingStore(const std::filesystem::path& known_root);

    std::vector<IdentityInfo> list_identities() override;
    std::vector<std::string> list_enrollments(const std::string& identity) override;
    std::optional<Bytes> read_enrollment_image(const std::string& identity,
                                               const std::string& image_ref) override;
    EmbeddingSnapshot load_snapshot() override;
    bool has_identity(const std::string& identity) override;

    const std::filesystem::path& root() const { return known_root; }

protected:
    void save_enrollment(const std::string& identity,
                         const std::string& key,
                         const Embedding& embedding,
                         const Bytes& image_bytes) override;
    Status remove_enrollment(const std::string& identity, const std::string& image_ref) override;
    Status remove_identity(const std::string& identity) override;

private:
    std::filesystem::path known_root;

    void init_root();
    std::mutex write_mutex;

    std::filesystem::path identity_dir(const std::string& identity) const;
    std::optional<std::filesystem::path> resolve_image(const std::string& identity,
                                                       const std::string& image_ref) const;
};

}  // namespace facevault
