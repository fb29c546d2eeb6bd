#pragma once

#include "search/beam_search.hpp"
#include "search/cancellation.hpp"
#include "search/search_state.hpp"
#include "decoding/oracle.hpp"

#include <string>
#include <vector>

namespace beamdec {

/// Outcome of one input in a batch. On failure `tokens` is empty and
/// `error` carries the DecodeError message.
struct BatchItemResult {
    std::vector<TokenId> tokens;
    double score = 0.0;
    bool ok = false;
    std::string error;
};

// ─── Translator ────────────────────────────────────────────────
// Encoder + beam search pipeline for one target vocabulary.
// Holds no per-call state; translate() may be called from several
// threads if both oracles allow it.

class Translator {
public:
    Translator(const EncoderOracle& encoder,
               const DecoderOracle& decoder,
               DecodeConfig config);

    /// Encode `input_tokens` and return the best output sequence,
    /// start token included.
    std::vector<TokenId> translate(const std::vector<TokenId>& input_tokens,
                                   const CancellationToken* cancel = nullptr) const;

    DecodeResult translateDetailed(const std::vector<TokenId>& input_tokens,
                                   const CancellationToken* cancel = nullptr) const;

    /// Translate every input independently across `num_workers` threads.
    /// A failing input is recorded in its slot; the others still run.
    std::vector<BatchItemResult> translateBatch(
        const std::vector<std::vector<TokenId>>& inputs,
        int num_workers = 1,
        const CancellationToken* cancel = nullptr) const;

    const DecodeConfig& config() const { return config_; }

private:
    const EncoderOracle& encoder_;
    DecodeConfig config_;
    BeamSearch search_;

    StatePtr encode(const std::vector<TokenId>& input_tokens) const;
};

} // namespace beamdec
