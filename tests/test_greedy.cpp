#include <gtest/gtest.h>
#include "search/greedy_search.hpp"
#include "oracles/markov_oracle.hpp"
#include "decoding/errors.hpp"

#include <cmath>
#include <vector>

using namespace beamdec;

namespace {

VocabularyConfig vocabulary() {
    VocabularyConfig vocab;
    vocab.start_token_id = 0;
    vocab.stop_token_id = 3;
    vocab.size = 4;
    return vocab;
}

} // namespace

TEST(GreedyTest, FollowsMostProbableToken) {
    MarkovDecoderOracle oracle(4);
    oracle.setTransition(0, {0.0, 0.3, 0.6, 0.1});
    oracle.setTransition(2, {0.0, 0.7, 0.1, 0.2});
    oracle.setTransition(1, {0.0, 0.1, 0.1, 0.8});
    GreedySearch search(oracle, vocabulary());

    DecodeResult result = search.decodeDetailed(MarkovDecoderOracle::initialState(), 10);

    EXPECT_EQ(result.tokens(), (std::vector<TokenId>{0, 2, 1, 3}));
    EXPECT_NEAR(result.best.score, -std::log(0.6) - std::log(0.7) - std::log(0.8), 1e-9);
    EXPECT_EQ(result.rounds, 3);
    EXPECT_EQ(result.oracle_calls, 3);
    EXPECT_TRUE(result.all_finished);
    ASSERT_EQ(result.final_beam.size(), 1u);
}

TEST(GreedyTest, StopsAtMaxSteps) {
    MarkovDecoderOracle oracle(4);
    oracle.setFallback({0.0, 0.9, 0.05, 0.05});
    GreedySearch search(oracle, vocabulary());

    DecodeResult result = search.decodeDetailed(MarkovDecoderOracle::initialState(), 4);
    EXPECT_EQ(result.tokens(), (std::vector<TokenId>{0, 1, 1, 1, 1}));
    EXPECT_TRUE(result.best.is_live);
    EXPECT_FALSE(result.all_finished);
}

TEST(GreedyTest, TieGoesToLowestId) {
    MarkovDecoderOracle oracle(4);
    oracle.setTransition(0, {0.0, 0.4, 0.4, 0.2});
    oracle.setFallback({0.0, 0.0, 0.0, 1.0});
    GreedySearch search(oracle, vocabulary());

    EXPECT_EQ(search.decode(MarkovDecoderOracle::initialState(), 5),
              (std::vector<TokenId>{0, 1, 3}));
}

TEST(GreedyTest, RejectsNonPositiveSteps) {
    MarkovDecoderOracle oracle(4);
    GreedySearch search(oracle, vocabulary());
    EXPECT_THROW(search.decode(MarkovDecoderOracle::initialState(), 0), InvalidArgument);
}
