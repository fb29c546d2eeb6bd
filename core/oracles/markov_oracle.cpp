#include "oracles/markov_oracle.hpp"
#include "decoding/errors.hpp"

#include <string>
#include <utility>

namespace beamdec {

MarkovDecoderOracle::MarkovDecoderOracle(size_t vocab_size, double context_weight)
    : vocab_size_(vocab_size), context_weight_(context_weight) {
    if (vocab_size_ == 0) {
        throw InvalidArgument("Markov oracle needs a non-empty vocabulary");
    }
    if (!(context_weight_ >= 0.0 && context_weight_ <= 1.0)) {
        throw InvalidArgument("context_weight must be in [0, 1]");
    }
}

void MarkovDecoderOracle::checkRow(const std::vector<double>& probs) const {
    if (probs.size() != vocab_size_) {
        throw InvalidArgument("transition row has " + std::to_string(probs.size()) +
                              " entries, vocabulary has " + std::to_string(vocab_size_));
    }
}

void MarkovDecoderOracle::setTransition(TokenId previous, std::vector<double> probs) {
    checkRow(probs);
    transitions_[previous] = std::move(probs);
}

void MarkovDecoderOracle::setStepTransition(int step, TokenId previous, std::vector<double> probs) {
    checkRow(probs);
    step_transitions_[{step, previous}] = std::move(probs);
}

void MarkovDecoderOracle::setFallback(std::vector<double> probs) {
    checkRow(probs);
    fallback_ = std::move(probs);
}

const std::vector<double>& MarkovDecoderOracle::lookup(int step, TokenId previous) const {
    auto st = step_transitions_.find({step, previous});
    if (st != step_transitions_.end()) return st->second;

    auto it = transitions_.find(previous);
    if (it != transitions_.end()) return it->second;

    if (!fallback_.empty()) return fallback_;

    throw OracleFailure("no transition after token " + std::to_string(previous) +
                        " at step " + std::to_string(step));
}

StepOutput MarkovDecoderOracle::step(TokenId previous_token, const StatePtr& state) const {
    const MarkovState& current = stateValue<MarkovState>(state);
    const std::vector<double>& row = lookup(current.step, previous_token);

    StepOutput out;
    out.probs = row;
    if (context_weight_ > 0.0 && current.context.size() == vocab_size_) {
        for (size_t i = 0; i < vocab_size_; i++) {
            out.probs[i] = (1.0 - context_weight_) * row[i] +
                           context_weight_ * current.context[i];
        }
    }

    MarkovState next;
    next.step = current.step + 1;
    next.context = current.context;
    out.state = makeValueState(std::move(next));
    return out;
}

StatePtr MarkovDecoderOracle::initialState() {
    return makeValueState(MarkovState{});
}

BagOfTokensEncoder::BagOfTokensEncoder(size_t target_vocab_size,
                                       std::map<TokenId, TokenId> source_to_target)
    : target_vocab_size_(target_vocab_size),
      source_to_target_(std::move(source_to_target)) {
    if (target_vocab_size_ == 0) {
        throw InvalidArgument("encoder needs a non-empty target vocabulary");
    }
}

StatePtr BagOfTokensEncoder::encode(const std::vector<TokenId>& input_tokens) const {
    MarkovState state;
    state.context.assign(target_vocab_size_, 0.0);

    size_t counted = 0;
    for (TokenId source : input_tokens) {
        TokenId target = source;
        if (!source_to_target_.empty()) {
            auto it = source_to_target_.find(source);
            if (it == source_to_target_.end()) continue;  // unmapped source token
            target = it->second;
        }
        if (target < 0 || static_cast<size_t>(target) >= target_vocab_size_) {
            throw OracleFailure("input token " + std::to_string(source) +
                                " maps outside the target vocabulary");
        }
        state.context[static_cast<size_t>(target)] += 1.0;
        counted++;
    }

    if (counted == 0) {
        state.context.clear();
    } else {
        for (double& c : state.context) c /= static_cast<double>(counted);
    }
    return makeValueState(std::move(state));
}

} // namespace beamdec
