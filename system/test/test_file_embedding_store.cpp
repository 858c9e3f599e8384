#include "database/file_embedding_store.hpp"
#include "database/npy_io.hpp"
#include "core/errors.hpp"
#include "fake_detector.hpp"
#include <gtest/gtest.h>
#include <fstream>

namespace fs = std::filesystem;
using namespace facevault;
using namespace facevault::testing_util;

class FileEmbeddingStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakeDetector detector;
    FileEmbeddingStore store{tmp.path() / "known", detector};

    Bytes scripted_image(int seed, const Embedding& emb) {
        Bytes img = make_image(seed);
        detector.script(img, {make_face(emb)});
        return img;
    }
};

TEST_F(FileEmbeddingStoreTest, EnrollWritesImageAndEmbedding) {
    Bytes img = scripted_image(1, constant_embedding(0.25f));
    uint64_t gen = store.generation();

    ASSERT_EQ(store.enroll("alice", img), Status::Ok);
    EXPECT_GT(store.generation(), gen);

    auto refs = store.list_enrollments("alice");
    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(fs::path(refs[0]).extension(), ".jpg");

    // bytes identicos a los enviados
    auto stored = store.read_enrollment_image("alice", refs[0]);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, img);

    fs::path npy = store.root() / "alice" / refs[0];
    npy.replace_extension(".npy");
    auto emb = load_npy(npy);
    ASSERT_TRUE(emb.has_value());
    ASSERT_EQ(emb->size(), 128u);
    EXPECT_FLOAT_EQ((*emb)[0], 0.25f);
}

TEST_F(FileEmbeddingStoreTest, EnrollWithoutFaceWritesNothing) {
    Bytes img = make_image(7);
    uint64_t gen = store.generation();

    EXPECT_EQ(store.enroll("bob", img), Status::NoFaceDetected);
    EXPECT_EQ(store.generation(), gen);
    EXPECT_FALSE(store.has_identity("bob"));
    EXPECT_EQ(count_entries(store.root()), 0u);
}

TEST_F(FileEmbeddingStoreTest, EnrollUndecodableImageThrows) {
    Bytes garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    EXPECT_THROW(store.enroll("alice", garbage), DetectionError);
    EXPECT_EQ(count_entries(store.root()), 0u);
}

TEST_F(FileEmbeddingStoreTest, EnrollUsesFirstDetectedFace) {
    Bytes img = make_image(3);
    detector.script(img, {make_face(constant_embedding(0.1f)), make_face(constant_embedding(0.8f))});

    ASSERT_EQ(store.enroll("alice", img), Status::Ok);
    auto snap = store.load_snapshot();
    ASSERT_EQ(snap.size(), 1u);
    ASSERT_EQ(snap[0].embeddings.size(), 1u);
    EXPECT_FLOAT_EQ(snap[0].embeddings[0][0], 0.1f);
}

TEST_F(FileEmbeddingStoreTest, RejectsUnsafeNames) {
    Bytes img = scripted_image(1, constant_embedding(0.1f));

    EXPECT_EQ(store.enroll("", img), Status::InvalidName);
    EXPECT_EQ(store.enroll("..", img), Status::InvalidName);
    EXPECT_EQ(store.enroll("../evil", img), Status::InvalidName);
    EXPECT_EQ(store.enroll("a/b", img), Status::InvalidName);
    EXPECT_EQ(detector.calls, 0);
}

TEST_F(FileEmbeddingStoreTest, TrimsIdentityName) {
    Bytes img = scripted_image(1, constant_embedding(0.1f));
    ASSERT_EQ(store.enroll("  alice ", img), Status::Ok);
    EXPECT_TRUE(store.has_identity("alice"));
}

TEST_F(FileEmbeddingStoreTest, ListIdentitiesSortedWithCounts) {
    ASSERT_EQ(store.enroll("carol", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    ASSERT_EQ(store.enroll("alice", scripted_image(2, constant_embedding(0.2f))), Status::Ok);
    ASSERT_EQ(store.enroll("alice", scripted_image(3, constant_embedding(0.3f))), Status::Ok);

    auto ids = store.list_identities();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0].name, "alice");
    EXPECT_EQ(ids[0].enrollment_count, 2);
    EXPECT_EQ(ids[1].name, "carol");
    EXPECT_EQ(ids[1].enrollment_count, 1);
}

TEST_F(FileEmbeddingStoreTest, ListEnrollmentsNewestFirst) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    ASSERT_EQ(store.enroll("alice", scripted_image(2, constant_embedding(0.2f))), Status::Ok);

    auto refs = store.list_enrollments("alice");
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_GT(refs[0], refs[1]);

    EXPECT_TRUE(store.list_enrollments("nobody").empty());
}

TEST_F(FileEmbeddingStoreTest, SnapshotOrderedByNameThenKey) {
    ASSERT_EQ(store.enroll("bob", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    ASSERT_EQ(store.enroll("alice", scripted_image(2, constant_embedding(0.2f))), Status::Ok);
    ASSERT_EQ(store.enroll("alice", scripted_image(3, constant_embedding(0.3f))), Status::Ok);

    auto snap = store.load_snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].name, "alice");
    ASSERT_EQ(snap[0].embeddings.size(), 2u);
    EXPECT_FLOAT_EQ(snap[0].embeddings[0][0], 0.2f);
    EXPECT_FLOAT_EQ(snap[0].embeddings[1][0], 0.3f);
    EXPECT_EQ(snap[1].name, "bob");
}

TEST_F(FileEmbeddingStoreTest, DeleteEnrollmentRemovesImageAndEmbedding) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    ASSERT_EQ(store.enroll("alice", scripted_image(2, constant_embedding(0.2f))), Status::Ok);
    auto refs = store.list_enrollments("alice");
    uint64_t gen = store.generation();

    ASSERT_EQ(store.delete_enrollment("alice", refs[0]), Status::Ok);
    EXPECT_GT(store.generation(), gen);

    auto left = store.list_enrollments("alice");
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0], refs[1]);
    auto snap = store.load_snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].embeddings.size(), 1u);
}

TEST_F(FileEmbeddingStoreTest, DeleteMissingIsNotFoundAndLeavesStorageUnchanged) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    size_t entries = count_entries(store.root());
    uint64_t gen = store.generation();

    EXPECT_EQ(store.delete_identity("bob"), Status::NotFound);
    EXPECT_EQ(store.delete_enrollment("alice", "19990101_000000_000000.jpg"), Status::NotFound);
    EXPECT_EQ(store.delete_enrollment("bob", "x.jpg"), Status::NotFound);

    EXPECT_EQ(count_entries(store.root()), entries);
    EXPECT_EQ(store.generation(), gen);
}

TEST_F(FileEmbeddingStoreTest, DeleteIdentityRemovesEverything) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    ASSERT_EQ(store.delete_identity("alice"), Status::Ok);

    EXPECT_FALSE(store.has_identity("alice"));
    EXPECT_TRUE(store.load_snapshot().empty());
    EXPECT_FALSE(fs::exists(store.root() / "alice"));
}

TEST_F(FileEmbeddingStoreTest, ReadEnrollmentRejectsPathTraversal) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    ASSERT_EQ(store.enroll("bob", scripted_image(2, constant_embedding(0.2f))), Status::Ok);
    std::string bob_ref = store.list_enrollments("bob")[0];

    EXPECT_FALSE(store.read_enrollment_image("alice", "../bob/" + bob_ref).has_value());
    EXPECT_FALSE(store.read_enrollment_image("alice", "..").has_value());
    EXPECT_FALSE(store.read_enrollment_image("..", "known").has_value());
    EXPECT_EQ(store.delete_enrollment("alice", "../bob/" + bob_ref), Status::NotFound);
    EXPECT_TRUE(store.read_enrollment_image("bob", bob_ref).has_value());
}

TEST_F(FileEmbeddingStoreTest, DeleteByEmbeddingFileNameIsNotFound) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    std::string ref = store.list_enrollments("alice")[0];
    std::string npy_ref = fs::path(ref).replace_extension(".npy").string();
    ASSERT_TRUE(fs::exists(store.root() / "alice" / npy_ref));

    size_t entries = count_entries(store.root());
    uint64_t gen = store.generation();

    EXPECT_EQ(store.delete_enrollment("alice", npy_ref), Status::NotFound);
    EXPECT_FALSE(store.read_enrollment_image("alice", npy_ref).has_value());

    // el registro sigue completo: listado, contado y en el snapshot
    EXPECT_EQ(count_entries(store.root()), entries);
    EXPECT_EQ(store.generation(), gen);
    EXPECT_EQ(store.list_enrollments("alice"), std::vector<std::string>{ref});
    ASSERT_EQ(store.list_identities().size(), 1u);
    EXPECT_EQ(store.list_identities()[0].enrollment_count, 1);
    auto snap = store.load_snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].embeddings.size(), 1u);
}

TEST_F(FileEmbeddingStoreTest, ImageRefMustBeABareJpegName) {
    ASSERT_EQ(store.enroll("alice", scripted_image(1, constant_embedding(0.1f))), Status::Ok);
    std::string ref = store.list_enrollments("alice")[0];
    std::ofstream(store.root() / "alice" / "notas.txt") << "x";

    EXPECT_EQ(store.delete_enrollment("alice", "notas.txt"), Status::NotFound);
    EXPECT_EQ(store.delete_enrollment("alice", "./" + ref), Status::NotFound);
    EXPECT_TRUE(fs::exists(store.root() / "alice" / "notas.txt"));
    EXPECT_TRUE(store.read_enrollment_image("alice", ref).has_value());
}

TEST(FileEmbeddingStoreReadOnly, LoadsSnapshotWithoutDetector) {
    TempDir tmp;
    FakeDetector detector;
    {
        FileEmbeddingStore writer(tmp.path() / "known", detector);
        Bytes img = make_image(1);
        detector.script(img, {make_face(constant_embedding(0.3f))});
        ASSERT_EQ(writer.enroll("alice", img), Status::Ok);
    }

    FileEmbeddingStore reader(tmp.path() / "known");
    auto snap = reader.load_snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].name, "alice");
    EXPECT_EQ(snap[0].embeddings[0], constant_embedding(0.3f));

    EXPECT_THROW(reader.enroll("bob", make_image(2)), DetectionError);
    EXPECT_FALSE(reader.has_identity("bob"));
}
