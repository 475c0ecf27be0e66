#include <gtest/gtest.h>

#include "../identity/match_scorer.hpp"

TEST(SimilarityTest, CosineOfIdenticalAndOrthogonalVectors) {
    EXPECT_NEAR(cosineSimilarity({1.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}), 100.0f, 1e-3f);
    EXPECT_NEAR(cosineSimilarity({1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}), 0.0f, 1e-3f);
    // Opposite vectors clamp to zero rather than going negative
    EXPECT_FLOAT_EQ(cosineSimilarity({1.0f, 0.0f}, {-1.0f, 0.0f}), 0.0f);
}

TEST(SimilarityTest, EuclideanMatchesDistanceScale) {
    EXPECT_NEAR(euclideanSimilarity({0.0f, 0.0f}, {0.3f, 0.4f}), 50.0f, 1e-3f);
    EXPECT_FLOAT_EQ(euclideanSimilarity({0.0f}, {2.0f}), 0.0f);
}

TEST(SimilarityTest, MismatchedOrEmptyVectorsScoreZero) {
    EXPECT_FLOAT_EQ(cosineSimilarity({}, {}), 0.0f);
    EXPECT_FLOAT_EQ(cosineSimilarity({1.0f}, {1.0f, 0.0f}), 0.0f);
    EXPECT_FLOAT_EQ(euclideanSimilarity({1.0f}, {1.0f, 0.0f}), 0.0f);
}

TEST(MatchScorerTest, EmptyStoreReturnsNoIdentity) {
    IdentityStore store;
    MatchScorer scorer(store);

    MatchResult result = scorer.match({1.0f, 0.0f});
    EXPECT_FALSE(result.identity_name.has_value());
    EXPECT_FLOAT_EQ(result.similarity, 0.0f);
}

TEST(MatchScorerTest, PicksHighestSimilarity) {
    IdentityStore store;
    store.add("alice", {1.0f, 0.0f});
    store.add("bob", {0.0f, 1.0f});
    MatchScorer scorer(store);

    MatchResult result = scorer.match({0.1f, 0.9f});
    ASSERT_TRUE(result.identity_name.has_value());
    EXPECT_EQ(*result.identity_name, "bob");
    EXPECT_GT(result.similarity, 90.0f);
}

TEST(MatchScorerTest, TieGoesToEarliestRegistration) {
    IdentityStore store;
    store.add("first", {1.0f});
    store.add("second", {2.0f});
    MatchScorer scorer(store, [](const std::vector<float>&, const std::vector<float>&) { return 80.0f; });

    EXPECT_EQ(*scorer.match({0.0f}).identity_name, "first");
}

TEST(MatchScorerTest, RemovedIdentityIsIgnored) {
    IdentityStore store;
    store.add("alice", {1.0f, 0.0f});
    store.add("bob", {0.7f, 0.7f});
    MatchScorer scorer(store);

    EXPECT_EQ(*scorer.match({1.0f, 0.0f}).identity_name, "alice");

    store.remove("alice");
    MatchResult result = scorer.match({1.0f, 0.0f});
    ASSERT_TRUE(result.identity_name.has_value());
    EXPECT_EQ(*result.identity_name, "bob");
    EXPECT_NEAR(result.similarity, cosineSimilarity({0.7f, 0.7f}, {1.0f, 0.0f}), 1e-4f);
}

TEST(ClassificationPolicyTest, ThreeOutcomesAtThresholds) {
    ClassificationPolicy policy{70.0f, 60.0f};
    MatchResult result;
    result.identity_name = "alice";

    result.similarity = 70.0f;
    EXPECT_EQ(policy.classify(result), MatchClass::Known);
    result.similarity = 69.9f;
    EXPECT_EQ(policy.classify(result), MatchClass::GreyZone);
    result.similarity = 60.0f;
    EXPECT_EQ(policy.classify(result), MatchClass::GreyZone);
    result.similarity = 59.9f;
    EXPECT_EQ(policy.classify(result), MatchClass::Unknown);
}

TEST(ClassificationPolicyTest, NoIdentityIsNeverKnown) {
    ClassificationPolicy policy;
    MatchResult empty;
    EXPECT_EQ(policy.classify(empty), MatchClass::Unknown);

    empty.similarity = 95.0f;
    EXPECT_EQ(policy.classify(empty), MatchClass::GreyZone);
}
