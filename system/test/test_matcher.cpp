#include "recognition/matcher.hpp"
#include "fake_detector.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace facevault;
using namespace facevault::testing_util;

TEST(Matcher, EuclideanDistance) {
    Embedding a = {0.0f, 0.0f, 0.0f};
    Embedding b = {3.0f, 4.0f, 0.0f};
    EXPECT_DOUBLE_EQ(euclidean_distance(a, b), 5.0);
    EXPECT_DOUBLE_EQ(euclidean_distance(b, b), 0.0);
}

TEST(Matcher, EmptySnapshotHasNoMatchAndNoDistance) {
    EmbeddingSnapshot empty;
    MatchResult r = match_embedding(constant_embedding(0.1f), empty, 0.75);
    EXPECT_FALSE(r.matched);
    EXPECT_TRUE(r.identity.empty());
    EXPECT_FALSE(r.distance.has_value());
}

TEST(Matcher, PicksGlobalMinimumAcrossIdentities) {
    Embedding probe = constant_embedding(0.0f);
    EmbeddingSnapshot snap = {
        {"alice", {shifted(probe, 0, 0.9f), shifted(probe, 1, 0.4f)}},
        {"bob",   {shifted(probe, 2, 0.2f)}},
        {"carol", {shifted(probe, 3, 0.6f)}},
    };

    MatchResult r = match_embedding(probe, snap, 0.75);
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.identity, "bob");
    ASSERT_TRUE(r.distance.has_value());
    EXPECT_NEAR(*r.distance, 0.2, 1e-6);
}

TEST(Matcher, UsesMinimumOverAnIdentitysEmbeddings) {
    Embedding probe = constant_embedding(0.0f);
    EmbeddingSnapshot snap = {
        {"alice", {shifted(probe, 0, 2.0f), shifted(probe, 0, 0.1f)}},
        {"bob",   {shifted(probe, 0, 0.5f)}},
    };

    MatchResult r = match_embedding(probe, snap, 0.75);
    EXPECT_EQ(r.identity, "alice");
    EXPECT_NEAR(*r.distance, 0.1, 1e-6);
}

TEST(Matcher, NoMatchAboveToleranceButDistanceReported) {
    Embedding probe = constant_embedding(0.0f);
    EmbeddingSnapshot snap = {{"alice", {shifted(probe, 0, 1.5f)}}};

    MatchResult r = match_embedding(probe, snap, 0.75);
    EXPECT_FALSE(r.matched);
    EXPECT_TRUE(r.identity.empty());
    ASSERT_TRUE(r.distance.has_value());
    EXPECT_NEAR(*r.distance, 1.5, 1e-6);
}

TEST(Matcher, DistanceEqualToToleranceMatches) {
    Embedding probe = {0.0f, 0.0f};
    EmbeddingSnapshot snap = {{"alice", {{0.5f, 0.0f}}}};

    MatchResult r = match_embedding(probe, snap, 0.5);
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.identity, "alice");
}

TEST(Matcher, TieKeepsFirstIdentityInSnapshotOrder) {
    Embedding probe = constant_embedding(0.0f);
    EmbeddingSnapshot snap = {
        {"alice", {shifted(probe, 0, 0.3f)}},
        {"bob",   {shifted(probe, 1, 0.3f)}},
    };

    MatchResult r = match_embedding(probe, snap, 0.75);
    EXPECT_EQ(r.identity, "alice");
}

TEST(Matcher, SkipsEmbeddingsWithDifferentDimension) {
    Embedding probe = constant_embedding(0.0f);
    EmbeddingSnapshot snap = {
        {"legacy", {constant_embedding(0.0f, 512)}},
        {"bob",    {shifted(probe, 0, 0.4f)}},
    };

    MatchResult r = match_embedding(probe, snap, 0.75);
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.identity, "bob");
}

TEST(Matcher, MatchedIffMinimumWithinTolerance) {
    Embedding probe = constant_embedding(0.0f);
    EmbeddingSnapshot snap = {{"alice", {shifted(probe, 0, 0.6f)}}};

    for (double tol : {0.1, 0.59, 0.61, 0.75, 2.0}) {
        MatchResult r = match_embedding(probe, snap, tol);
        EXPECT_EQ(r.matched, *r.distance <= tol) << "tolerance " << tol;
    }
}

TEST(Matcher, ToleranceIsNotRoundedToFloat) {
    // 0.6f como float vale 0.60000002384...; con tolerancia 0.6 queda fuera
    Embedding probe = {0.0f};
    EmbeddingSnapshot snap = {{"alice", {{0.6f}}}};

    MatchResult r = match_embedding(probe, snap, 0.6);
    ASSERT_TRUE(r.distance.has_value());
    EXPECT_GT(*r.distance, 0.6);
    EXPECT_FALSE(r.matched);

    EXPECT_TRUE(match_embedding(probe, snap, static_cast<double>(0.6f)).matched);
}
