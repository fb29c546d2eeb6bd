#pragma once

#include "search/search_state.hpp"
#include "search/cancellation.hpp"
#include "decoding/hypothesis.hpp"
#include "decoding/oracle.hpp"
#include "decoding/vocabulary.hpp"

#include <utility>
#include <vector>

namespace beamdec {

/// Beam Search: deterministic autoregressive decoding.
/// Each round expands every live hypothesis with its top `beam_width`
/// next tokens, carries finished hypotheses forward unchanged, and prunes
/// the merged set to `beam_width` by accumulated negative log-probability.
///
/// Scores are not length-normalized, so at equal per-token confidence a
/// shorter completion always wins.
///
/// decode() does not modify the engine; concurrent calls are safe as long
/// as the decoder oracle's step() is.
class BeamSearch {
public:
    BeamSearch(const DecoderOracle& decoder, VocabularyConfig vocabulary);

    /// Dispatch per-hypothesis oracle calls of a round across this many
    /// threads. Output is identical to sequential expansion.
    void setExpansionThreads(int threads);
    int expansionThreads() const { return expansion_threads_; }

    void setRoundObserver(RoundObserver observer) { observer_ = std::move(observer); }

    /// Token sequence of the best hypothesis, start token included.
    std::vector<TokenId> decode(const StatePtr& initial_state,
                                int beam_width,
                                int max_steps,
                                const CancellationToken* cancel = nullptr) const;

    /// Full result: best hypothesis, final beam and counters.
    DecodeResult decodeDetailed(const StatePtr& initial_state,
                                int beam_width,
                                int max_steps,
                                const CancellationToken* cancel = nullptr) const;

private:
    /// Oracle output for one live hypothesis, reduced to what the merge
    /// step needs.
    struct Expansion {
        StatePtr state;
        std::vector<TokenId> tokens;      // Best first
        std::vector<double> token_costs;  // -log p per token
    };

    const DecoderOracle& decoder_;
    VocabularyConfig vocabulary_;
    int expansion_threads_ = 1;
    RoundObserver observer_;

    Expansion expand(const Hypothesis& parent, int beam_width) const;

    std::vector<Expansion> expandAll(const std::vector<const Hypothesis*>& live,
                                     int beam_width) const;
};

} // namespace beamdec
