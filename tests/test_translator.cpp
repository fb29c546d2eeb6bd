#include <gtest/gtest.h>
#include "translate/translator.hpp"
#include "oracles/markov_oracle.hpp"
#include "decoding/errors.hpp"
#include "decoding/oracle.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace beamdec;

namespace {

// Target vocabulary {<start>=0, x=1, y=2, <stop>=3}. The encoder context
// (weight 0.2) decides between x and y; after either, stop is likely.
class TranslatorTest : public ::testing::Test {
protected:
    TranslatorTest()
        : decoder_(4, 0.2), encoder_(4) {
        decoder_.setTransition(0, {0.0, 0.5, 0.5, 0.0});
        decoder_.setFallback({0.0, 0.0, 0.0, 1.0});

        config_.beam_width = 2;
        config_.max_steps = 4;
        config_.max_input_length = 8;
        config_.vocabulary.start_token_id = 0;
        config_.vocabulary.stop_token_id = 3;
    }

    MarkovDecoderOracle decoder_;
    BagOfTokensEncoder encoder_;
    DecodeConfig config_;
};

} // namespace

TEST_F(TranslatorTest, ContextSelectsOutputToken) {
    Translator translator(encoder_, decoder_, config_);

    EXPECT_EQ(translator.translate({2, 2}), (std::vector<TokenId>{0, 2, 3}));
    EXPECT_EQ(translator.translate({1, 1}), (std::vector<TokenId>{0, 1, 3}));
}

TEST_F(TranslatorTest, DetailedResultCarriesScore) {
    Translator translator(encoder_, decoder_, config_);
    DecodeResult result = translator.translateDetailed({2, 2});

    // p(y | start) = 0.8 * 0.5 + 0.2 = 0.6, p(stop | y) = 0.8
    EXPECT_NEAR(result.best.score, -std::log(0.6) - std::log(0.8), 1e-9);
    EXPECT_TRUE(result.all_finished);
}

TEST_F(TranslatorTest, RejectsEmptyAndOverlongInput) {
    Translator translator(encoder_, decoder_, config_);
    EXPECT_THROW(translator.translate({}), InvalidArgument);
    EXPECT_THROW(translator.translate(std::vector<TokenId>(9, 1)), InvalidArgument);
    EXPECT_NO_THROW(translator.translate(std::vector<TokenId>(8, 1)));
}

TEST_F(TranslatorTest, RejectsInvalidConfig) {
    config_.beam_width = 0;
    EXPECT_THROW({ Translator translator(encoder_, decoder_, config_); }, InvalidArgument);

    config_.beam_width = 2;
    config_.max_steps = 0;
    EXPECT_THROW({ Translator translator(encoder_, decoder_, config_); }, InvalidArgument);

    config_.max_steps = 4;
    config_.expansion_threads = 0;
    EXPECT_THROW({ Translator translator(encoder_, decoder_, config_); }, InvalidArgument);
}

TEST_F(TranslatorTest, EncoderFailureIsOracleFailure) {
    FunctionEncoderOracle failing([](const std::vector<TokenId>&) -> StatePtr {
        throw std::runtime_error("encoder out of memory");
    });
    Translator translator(failing, decoder_, config_);
    EXPECT_THROW(translator.translate({1}), OracleFailure);

    FunctionEncoderOracle null_state([](const std::vector<TokenId>&) -> StatePtr {
        return nullptr;
    });
    Translator null_translator(null_state, decoder_, config_);
    EXPECT_THROW(null_translator.translate({1}), OracleFailure);
}

TEST_F(TranslatorTest, NonStandardEncoderThrowBecomesOracleFailure) {
    FunctionEncoderOracle failing([](const std::vector<TokenId>&) -> StatePtr {
        throw 42;
    });
    Translator translator(failing, decoder_, config_);
    EXPECT_THROW(translator.translate({1}), OracleFailure);

    // In a batch the failure stays with its item.
    std::vector<BatchItemResult> results = translator.translateBatch({{1}, {2}}, 2);
    ASSERT_EQ(results.size(), 2u);
    for (const BatchItemResult& r : results) {
        EXPECT_FALSE(r.ok);
        EXPECT_NE(r.error.find("unknown oracle error"), std::string::npos);
    }
}

TEST_F(TranslatorTest, CancellationStopsTranslation) {
    Translator translator(encoder_, decoder_, config_);
    CancellationToken token;
    token.cancel();
    EXPECT_THROW(translator.translate({1, 1}, &token), DecodeCancelled);
}

// ─── Batch ─────────────────────────────────────────────────────

TEST_F(TranslatorTest, BatchRecordsFailuresPerItem) {
    Translator translator(encoder_, decoder_, config_);
    std::vector<std::vector<TokenId>> inputs = {
        {1, 1},
        {2, 2},
        std::vector<TokenId>(20, 1),    // too long
        {2, 1, 2},
    };

    std::vector<BatchItemResult> results = translator.translateBatch(inputs, 2);
    ASSERT_EQ(results.size(), 4u);

    EXPECT_TRUE(results[0].ok);
    EXPECT_EQ(results[0].tokens, (std::vector<TokenId>{0, 1, 3}));
    EXPECT_TRUE(results[1].ok);
    EXPECT_EQ(results[1].tokens, (std::vector<TokenId>{0, 2, 3}));
    EXPECT_FALSE(results[2].ok);
    EXPECT_TRUE(results[2].tokens.empty());
    EXPECT_NE(results[2].error.find("limit"), std::string::npos);
    EXPECT_TRUE(results[3].ok);
    EXPECT_EQ(results[3].tokens, (std::vector<TokenId>{0, 2, 3}));
}

TEST_F(TranslatorTest, BatchWorkersDoNotChangeResults) {
    config_.expansion_threads = 2;
    Translator translator(encoder_, decoder_, config_);

    std::vector<std::vector<TokenId>> inputs;
    for (int i = 0; i < 12; i++) {
        inputs.push_back({static_cast<TokenId>(1 + i % 2), static_cast<TokenId>(1 + (i / 2) % 2)});
    }

    std::vector<BatchItemResult> sequential = translator.translateBatch(inputs, 1);
    std::vector<BatchItemResult> parallel = translator.translateBatch(inputs, 4);

    ASSERT_EQ(sequential.size(), parallel.size());
    for (size_t i = 0; i < inputs.size(); i++) {
        EXPECT_TRUE(parallel[i].ok);
        EXPECT_EQ(sequential[i].tokens, parallel[i].tokens);
        EXPECT_DOUBLE_EQ(sequential[i].score, parallel[i].score);
    }

    EXPECT_THROW(translator.translateBatch(inputs, 0), InvalidArgument);
    EXPECT_TRUE(translator.translateBatch({}, 3).empty());
}
