#include <gtest/gtest.h>
#include "decoding/distribution.hpp"
#include "decoding/errors.hpp"
#include "decoding/vocabulary.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace beamdec;

// ─── Validation ────────────────────────────────────────────────

TEST(DistributionTest, AcceptsProperDistribution) {
    EXPECT_NO_THROW(validateDistribution({0.0, 0.6, 0.3, 0.1}));
    EXPECT_NO_THROW(validateDistribution({0.0, 0.6, 0.3, 0.1}, 4));
}

TEST(DistributionTest, AcceptsPartialMass) {
    // Entries must be probabilities; the total need only be positive.
    EXPECT_NO_THROW(validateDistribution({0.2, 0.2}));
    EXPECT_NO_THROW(validateDistribution({0.0, 1.0 + 1e-9}));
}

TEST(DistributionTest, RejectsEntryAboveOne) {
    EXPECT_THROW(validateDistribution({0.0, 2.0, 3.0, 0.0}), OracleFailure);
    EXPECT_THROW(validateDistribution({1.01}), OracleFailure);
}

TEST(DistributionTest, RejectsEmpty) {
    EXPECT_THROW(validateDistribution({}), EmptyVocabularyDistribution);
}

TEST(DistributionTest, RejectsZeroMass) {
    EXPECT_THROW(validateDistribution({0.0, 0.0, 0.0}), EmptyVocabularyDistribution);
}

TEST(DistributionTest, RejectsNaN) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validateDistribution({0.5, nan, 0.5}), EmptyVocabularyDistribution);
}

TEST(DistributionTest, RejectsNegativeAndInfinite) {
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validateDistribution({1.5, -0.5}), EmptyVocabularyDistribution);
    EXPECT_THROW(validateDistribution({inf, 0.0}), EmptyVocabularyDistribution);
}

TEST(DistributionTest, WrongLengthIsOracleFailure) {
    EXPECT_THROW(validateDistribution({0.5, 0.5}, 4), OracleFailure);
}

// ─── Top-K ─────────────────────────────────────────────────────

TEST(DistributionTest, TopKOrdersByDescendingProbability) {
    std::vector<TokenId> top = selectTopK({0.0, 0.6, 0.3, 0.1}, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], 1);
    EXPECT_EQ(top[1], 2);
}

TEST(DistributionTest, TopKBreaksTiesByAscendingId) {
    std::vector<TokenId> top = selectTopK({0.1, 0.3, 0.3, 0.3}, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], 1);
    EXPECT_EQ(top[1], 2);
}

TEST(DistributionTest, TopKSkipsZeroProbabilityTokens) {
    std::vector<TokenId> top = selectTopK({0.0, 0.0, 0.0, 1.0}, 3);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0], 3);
}

TEST(DistributionTest, TopKLargerThanVocabulary) {
    std::vector<TokenId> top = selectTopK({0.25, 0.5, 0.25}, 10);
    EXPECT_EQ(top, (std::vector<TokenId>{1, 0, 2}));
}

TEST(DistributionTest, ArgmaxPrefersLowestIdOnTie) {
    EXPECT_EQ(argmax({0.2, 0.4, 0.4}), 1);
    EXPECT_THROW(argmax({0.0, 0.0}), EmptyVocabularyDistribution);
}

// ─── Scoring ───────────────────────────────────────────────────

TEST(DistributionTest, NegativeLogProb) {
    EXPECT_NEAR(negativeLogProb(0.6), 0.5108, 1e-4);
    EXPECT_NEAR(negativeLogProb(0.3), 1.2040, 1e-4);
    EXPECT_DOUBLE_EQ(negativeLogProb(1.0), 0.0);
    EXPECT_DOUBLE_EQ(negativeLogProb(1.0 + 1e-12), 0.0);  // never negative
}

// ─── Vocabulary ────────────────────────────────────────────────

TEST(DistributionTest, VocabularyValidation) {
    VocabularyConfig vocab;
    vocab.start_token_id = 0;
    vocab.stop_token_id = 3;
    vocab.size = 4;
    EXPECT_NO_THROW(vocab.validate());

    vocab.stop_token_id = 0;
    EXPECT_THROW(vocab.validate(), InvalidArgument);

    vocab.stop_token_id = 4;
    EXPECT_THROW(vocab.validate(), InvalidArgument);

    vocab.stop_token_id = -1;
    EXPECT_THROW(vocab.validate(), InvalidArgument);
}
