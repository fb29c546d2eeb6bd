#pragma once

#include "decoding/oracle.hpp"
#include "decoding/vocabulary.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace beamdec {

// ─── Markov Decoder Oracle ─────────────────────────────────────
// Deterministic table-driven decoder. The next-token distribution is
// looked up by (step, previous token), then by previous token alone,
// then a fallback row. An optional encoder context is mixed in:
//   p = (1 - w) * row + w * context
// Used as a reference model and for exercising the search engines.

struct MarkovState {
    int step = 0;
    std::vector<double> context;    // Normalized, empty = no context
};

class MarkovDecoderOracle : public DecoderOracle {
public:
    explicit MarkovDecoderOracle(size_t vocab_size, double context_weight = 0.0);

    /// Row used whenever `previous` is the previous token.
    void setTransition(TokenId previous, std::vector<double> probs);

    /// Row used at decoding step `step` (0-based) after `previous`.
    /// Takes precedence over setTransition().
    void setStepTransition(int step, TokenId previous, std::vector<double> probs);

    /// Row used when no transition matches.
    void setFallback(std::vector<double> probs);

    StepOutput step(TokenId previous_token, const StatePtr& state) const override;
    size_t vocabularySize() const override { return vocab_size_; }

    /// State for a decode without encoder context.
    static StatePtr initialState();

private:
    size_t vocab_size_;
    double context_weight_;
    std::map<TokenId, std::vector<double>> transitions_;
    std::map<std::pair<int, TokenId>, std::vector<double>> step_transitions_;
    std::vector<double> fallback_;

    void checkRow(const std::vector<double>& probs) const;
    const std::vector<double>& lookup(int step, TokenId previous) const;
};

// ─── Bag-of-Tokens Encoder ─────────────────────────────────────
// Reference encoder: the context is the normalized histogram of input
// tokens mapped through `source_to_target` (identity when empty).

class BagOfTokensEncoder : public EncoderOracle {
public:
    explicit BagOfTokensEncoder(size_t target_vocab_size,
                                std::map<TokenId, TokenId> source_to_target = {});

    StatePtr encode(const std::vector<TokenId>& input_tokens) const override;

private:
    size_t target_vocab_size_;
    std::map<TokenId, TokenId> source_to_target_;
};

} // namespace beamdec
