#include "search/beam_search.hpp"
#include "search/bounded_beam.hpp"
#include "decoding/distribution.hpp"
#include "decoding/errors.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <string>
#include <utility>

namespace beamdec {

BeamSearch::BeamSearch(const DecoderOracle& decoder, VocabularyConfig vocabulary)
    : decoder_(decoder), vocabulary_(vocabulary) {
    if (vocabulary_.size == 0) {
        vocabulary_.size = decoder_.vocabularySize();
    }
    vocabulary_.validate();
}

void BeamSearch::setExpansionThreads(int threads) {
    if (threads < 1) {
        throw InvalidArgument("expansion_threads must be >= 1, got " + std::to_string(threads));
    }
    expansion_threads_ = threads;
}

std::vector<TokenId> BeamSearch::decode(const StatePtr& initial_state,
                                        int beam_width,
                                        int max_steps,
                                        const CancellationToken* cancel) const {
    return decodeDetailed(initial_state, beam_width, max_steps, cancel).best.token_sequence;
}

DecodeResult BeamSearch::decodeDetailed(const StatePtr& initial_state,
                                        int beam_width,
                                        int max_steps,
                                        const CancellationToken* cancel) const {
    if (beam_width < 1) {
        throw InvalidArgument("beam_width must be >= 1, got " + std::to_string(beam_width));
    }
    if (max_steps < 1) {
        throw InvalidArgument("max_steps must be >= 1, got " + std::to_string(max_steps));
    }
    if (!initial_state) {
        throw InvalidArgument("initial decoder state is null");
    }

    auto start_time = std::chrono::steady_clock::now();
    BEAMDEC_LOG_DEBUG("beam decode: width=%d max_steps=%d", beam_width, max_steps);

    DecodeResult result;
    uint64_t next_id = 0;

    Hypothesis initial;
    initial.id = next_id++;
    initial.token_sequence.push_back(vocabulary_.start_token_id);
    initial.score = 0.0;
    initial.state = initial_state;
    initial.is_live = true;

    std::vector<Hypothesis> beam;
    beam.push_back(std::move(initial));

    auto any_live = [](const std::vector<Hypothesis>& hyps) {
        return std::any_of(hyps.begin(), hyps.end(),
                           [](const Hypothesis& h) { return h.is_live; });
    };

    for (int round = 0; round < max_steps; round++) {
        if (!any_live(beam)) break;

        if (cancel && cancel->isCancelled()) {
            BEAMDEC_LOG_WARN("beam decode cancelled before round %d", round + 1);
            throw DecodeCancelled("stopped before round " + std::to_string(round + 1));
        }

        std::vector<const Hypothesis*> live;
        for (const Hypothesis& h : beam) {
            if (h.is_live) live.push_back(&h);
        }

        // All oracle calls of the round complete here, before any merging.
        std::vector<Expansion> expansions = expandAll(live, beam_width);
        result.oracle_calls += static_cast<int>(live.size());

        BoundedBeam next(static_cast<size_t>(beam_width));

        // Finished hypotheses keep their ids, so they win score ties
        // against the children created this round.
        for (Hypothesis& h : beam) {
            if (!h.is_live) next.offer(std::move(h));
        }

        for (size_t i = 0; i < live.size(); i++) {
            const Hypothesis& parent = *live[i];
            const Expansion& exp = expansions[i];

            for (size_t j = 0; j < exp.tokens.size(); j++) {
                uint64_t id = next_id++;
                double score = parent.score + exp.token_costs[j];
                if (!next.accepts(score, id)) continue;

                Hypothesis child;
                child.id = id;
                child.token_sequence = parent.token_sequence;
                child.token_sequence.push_back(exp.tokens[j]);
                child.score = score;
                child.state = exp.state;
                child.is_live = !vocabulary_.isStop(exp.tokens[j]);
                next.offer(std::move(child));
            }
        }

        beam = next.takeSorted();
        result.rounds = round + 1;

        if (observer_) observer_(result.rounds, beam);
    }

    result.all_finished = !any_live(beam);
    result.best = beam.front();
    result.final_beam = std::move(beam);
    result.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();

    BEAMDEC_LOG_DEBUG("beam decode done: rounds=%d oracle_calls=%d best_score=%.6f length=%zu",
                      result.rounds, result.oracle_calls, result.best.score,
                      result.best.length());
    return result;
}

BeamSearch::Expansion BeamSearch::expand(const Hypothesis& parent, int beam_width) const {
    StepOutput out = checkedStep(decoder_, parent.lastToken(), parent.state, vocabulary_.size);

    Expansion exp;
    exp.state = std::move(out.state);
    exp.tokens = selectTopK(out.probs, beam_width);
    exp.token_costs.reserve(exp.tokens.size());
    for (TokenId t : exp.tokens) {
        exp.token_costs.push_back(negativeLogProb(out.probs[static_cast<size_t>(t)]));
    }
    return exp;
}

std::vector<BeamSearch::Expansion> BeamSearch::expandAll(
    const std::vector<const Hypothesis*>& live, int beam_width) const {
    std::vector<Expansion> expansions(live.size());

    int workers = std::min(expansion_threads_, static_cast<int>(live.size()));
    if (workers <= 1) {
        for (size_t i = 0; i < live.size(); i++) {
            expansions[i] = expand(*live[i], beam_width);
        }
        return expansions;
    }

    // Worker w fills slots w, w + workers, ...; no two workers share a slot.
    std::vector<std::future<void>> futures;
    futures.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; w++) {
        futures.push_back(std::async(std::launch::async, [&, w]() {
            for (size_t i = static_cast<size_t>(w); i < live.size();
                 i += static_cast<size_t>(workers)) {
                expansions[i] = expand(*live[i], beam_width);
            }
        }));
    }

    // Wait for every worker before surfacing the first failure.
    for (auto& f : futures) f.wait();
    for (auto& f : futures) f.get();
    return expansions;
}

} // namespace beamdec
