#include "detection/lazy_detector.hpp"
#include "database/file_embedding_store.hpp"
#include "database/unknown_face_store.hpp"
#include "core/errors.hpp"
#include "fake_detector.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace facevault;
using namespace facevault::testing_util;

TEST(LazyFaceDetector, QueriesAndDeletesNeverLoadTheModel) {
    TempDir tmp;
    Bytes img = make_image(1);
    int builds = 0;

    LazyFaceDetector lazy([&]() -> std::unique_ptr<FaceDetector> {
        builds++;
        auto d = std::make_unique<FakeDetector>();
        d->script(img, {make_face(constant_embedding(0.2f))});
        return d;
    });

    FileEmbeddingStore known(tmp.path() / "known", lazy);
    UnknownFaceStore unknown_faces(tmp.path(), &lazy);

    EXPECT_TRUE(known.list_identities().empty());
    EXPECT_TRUE(known.load_snapshot().empty());
    EXPECT_TRUE(unknown_faces.list().empty());
    EXPECT_EQ(known.delete_identity("alice"), Status::NotFound);
    EXPECT_EQ(builds, 0);
    EXPECT_FALSE(lazy.is_loaded());

    ASSERT_EQ(known.enroll("alice", img), Status::Ok);
    ASSERT_EQ(known.enroll("alice", img), Status::Ok);
    EXPECT_EQ(builds, 1);
    EXPECT_TRUE(lazy.is_loaded());
}

TEST(LazyFaceDetector, FailedLoadPropagatesAndIsRetried) {
    Bytes img = make_image(2);
    int builds = 0;

    LazyFaceDetector lazy([&]() -> std::unique_ptr<FaceDetector> {
        if (builds++ == 0) {
            throw std::runtime_error("No existe el modelo de deteccion");
        }
        auto d = std::make_unique<FakeDetector>();
        d->script(img, {make_face(constant_embedding(0.2f))});
        return d;
    });

    EXPECT_THROW(lazy.detect(img), std::runtime_error);
    EXPECT_FALSE(lazy.is_loaded());

    EXPECT_EQ(lazy.detect(img).size(), 1u);
    EXPECT_EQ(builds, 2);
}

TEST(LazyFaceDetector, NullFactoryResultIsDetectionError) {
    LazyFaceDetector lazy([]() -> std::unique_ptr<FaceDetector> { return nullptr; });
    EXPECT_THROW(lazy.detect(make_image(3)), DetectionError);
}
