#pragma once

#include "decoding/hypothesis.hpp"
#include "decoding/vocabulary.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace beamdec {

/// Decoding configuration parameters.
struct DecodeConfig {
    int beam_width = 4;             // Hypotheses kept after each round
    int max_steps = 50;             // Maximum decoding rounds (output tokens)
    int expansion_threads = 1;      // Concurrent oracle calls within a round
    size_t max_input_length = 256;  // Encoder input bound, 0 = unbounded
    VocabularyConfig vocabulary;

    /// Throws InvalidArgument on non-positive widths, steps or threads,
    /// or an invalid vocabulary.
    void validate() const;
};

/// Result of a decode run.
struct DecodeResult {
    Hypothesis best;
    std::vector<Hypothesis> final_beam;   // Best first
    int rounds = 0;
    int oracle_calls = 0;
    double elapsed_seconds = 0.0;
    bool all_finished = false;            // Every kept hypothesis emitted stop

    const std::vector<TokenId>& tokens() const { return best.token_sequence; }
};

/// Called after each completed round with the 1-based round number and
/// the pruned working set, best first.
using RoundObserver = std::function<void(int, const std::vector<Hypothesis>&)>;

} // namespace beamdec
