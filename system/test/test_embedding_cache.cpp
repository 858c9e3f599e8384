#include "recognition/embedding_cache.hpp"
#include "database/file_embedding_store.hpp"
#include "database/npy_io.hpp"
#include "fake_detector.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace facevault;
using namespace facevault::testing_util;

class EmbeddingCacheTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakeDetector detector;
    FileEmbeddingStore store{tmp.path() / "known", detector};
    EmbeddingCache cache{store};

    Embedding alice = constant_embedding(0.1f);
    Embedding bob = constant_embedding(0.9f);

    void enroll(const std::string& name, const Embedding& emb, int seed) {
        Bytes img = make_image(seed);
        detector.script(img, {make_face(emb)});
        ASSERT_EQ(store.enroll(name, img), Status::Ok);
    }
};

TEST_F(EmbeddingCacheTest, EmptyStoreNeverMatches) {
    MatchResult r = cache.match(alice, 0.75);
    EXPECT_FALSE(r.matched);
    EXPECT_FALSE(r.distance.has_value());
    EXPECT_EQ(cache.identity_count(), 0u);
}

TEST_F(EmbeddingCacheTest, EnrollIsVisibleToNextMatch) {
    EXPECT_FALSE(cache.match(alice, 0.75).matched);

    enroll("alice", alice, 1);

    MatchResult r = cache.match(alice, 0.75);
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.identity, "alice");
    EXPECT_NEAR(*r.distance, 0.0, 1e-9);
}

TEST_F(EmbeddingCacheTest, CloserEnrollmentChangesResult) {
    Embedding probe = constant_embedding(0.5f);
    enroll("bob", bob, 1);

    MatchResult before = cache.match(probe, 10.0);
    EXPECT_EQ(before.identity, "bob");

    enroll("carol", shifted(probe, 0, 0.05f), 2);

    MatchResult after = cache.match(probe, 10.0);
    EXPECT_EQ(after.identity, "carol");
    EXPECT_LT(*after.distance, *before.distance);
}

TEST_F(EmbeddingCacheTest, DeleteIdentityIsVisibleToNextMatch) {
    enroll("alice", alice, 1);
    enroll("bob", bob, 2);
    ASSERT_TRUE(cache.match(alice, 0.75).matched);

    ASSERT_EQ(store.delete_identity("alice"), Status::Ok);

    MatchResult r = cache.match(alice, 0.75);
    EXPECT_FALSE(r.matched);
    ASSERT_TRUE(r.distance.has_value());
    EXPECT_EQ(cache.identity_count(), 1u);
}

TEST_F(EmbeddingCacheTest, DeleteEnrollmentIsVisibleToNextMatch) {
    enroll("alice", alice, 1);
    ASSERT_TRUE(cache.match(alice, 0.75).matched);

    auto refs = store.list_enrollments("alice");
    ASSERT_EQ(refs.size(), 1u);
    ASSERT_EQ(store.delete_enrollment("alice", refs[0]), Status::Ok);

    EXPECT_FALSE(cache.match(alice, 0.75).matched);
}

TEST_F(EmbeddingCacheTest, RepeatedMatchesAreDeterministic) {
    enroll("alice", alice, 1);
    enroll("bob", bob, 2);

    Embedding probe = constant_embedding(0.4f);
    MatchResult first = cache.match(probe, 5.0f);
    for (int i = 0; i < 10; ++i) {
        MatchResult r = cache.match(probe, 5.0f);
        EXPECT_EQ(r.matched, first.matched);
        EXPECT_EQ(r.identity, first.identity);
        EXPECT_EQ(r.distance, first.distance);
    }
}

TEST_F(EmbeddingCacheTest, SnapshotReusedWhileStoreUnchanged) {
    enroll("alice", alice, 1);

    auto s1 = cache.snapshot();
    auto s2 = cache.snapshot();
    EXPECT_EQ(s1.get(), s2.get());

    enroll("bob", bob, 2);
    auto s3 = cache.snapshot();
    EXPECT_NE(s1.get(), s3.get());
    EXPECT_EQ(s3->size(), 2u);
    EXPECT_EQ(s1->size(), 1u);
}

TEST_F(EmbeddingCacheTest, InvalidatePicksUpExternalChanges) {
    enroll("alice", alice, 1);
    ASSERT_EQ(cache.identity_count(), 1u);

    // escrito por fuera del store: la generacion no cambia
    std::filesystem::create_directories(store.root() / "carol");
    save_npy(store.root() / "carol" / "20250101_000000_000000.npy", constant_embedding(0.5f));
    EXPECT_EQ(cache.identity_count(), 1u);

    cache.invalidate();
    EXPECT_EQ(cache.identity_count(), 2u);
}

TEST_F(EmbeddingCacheTest, ReloadReturnsFreshSnapshot) {
    enroll("alice", alice, 1);
    auto before = cache.snapshot();
    auto after = cache.reload();
    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(after->size(), 1u);
}

TEST_F(EmbeddingCacheTest, ConcurrentMatchesSeeConsistentResults) {
    enroll("alice", alice, 1);
    enroll("bob", bob, 2);

    std::vector<std::thread> threads;
    std::vector<int> ok(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 50; ++i) {
                MatchResult r = cache.match(bob, 0.75);
                if (r.matched && r.identity == "bob") ok[t]++;
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int t = 0; t < 8; ++t) {
        EXPECT_EQ(ok[t], 50);
    }
}
