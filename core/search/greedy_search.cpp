#include "search/greedy_search.hpp"
#include "decoding/distribution.hpp"
#include "decoding/errors.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace beamdec {

GreedySearch::GreedySearch(const DecoderOracle& decoder, VocabularyConfig vocabulary)
    : decoder_(decoder), vocabulary_(vocabulary) {
    if (vocabulary_.size == 0) {
        vocabulary_.size = decoder_.vocabularySize();
    }
    vocabulary_.validate();
}

std::vector<TokenId> GreedySearch::decode(const StatePtr& initial_state, int max_steps) const {
    return decodeDetailed(initial_state, max_steps).best.token_sequence;
}

DecodeResult GreedySearch::decodeDetailed(const StatePtr& initial_state, int max_steps) const {
    if (max_steps < 1) {
        throw InvalidArgument("max_steps must be >= 1, got " + std::to_string(max_steps));
    }
    if (!initial_state) {
        throw InvalidArgument("initial decoder state is null");
    }

    auto start_time = std::chrono::steady_clock::now();
    DecodeResult result;

    Hypothesis& hyp = result.best;
    hyp.token_sequence.push_back(vocabulary_.start_token_id);
    hyp.state = initial_state;

    for (int step = 0; step < max_steps && hyp.is_live; step++) {
        StepOutput out = checkedStep(decoder_, hyp.lastToken(), hyp.state, vocabulary_.size);

        TokenId next = argmax(out.probs);
        hyp.token_sequence.push_back(next);
        hyp.score += negativeLogProb(out.probs[static_cast<size_t>(next)]);
        hyp.state = std::move(out.state);
        hyp.is_live = !vocabulary_.isStop(next);
        hyp.id = static_cast<uint64_t>(step + 1);

        result.oracle_calls++;
        result.rounds++;
    }

    result.all_finished = !hyp.is_live;
    result.final_beam.push_back(hyp);
    result.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();
    return result;
}

} // namespace beamdec
