#pragma once

#include "search/search_state.hpp"
#include "decoding/oracle.hpp"
#include "decoding/vocabulary.hpp"

#include <vector>

namespace beamdec {

/// Greedy decoding: always take the single most probable next token
/// (lowest id among ties) until the stop token or `max_steps`.
/// Produces the same sequence as BeamSearch with beam_width = 1.
class GreedySearch {
public:
    GreedySearch(const DecoderOracle& decoder, VocabularyConfig vocabulary);

    std::vector<TokenId> decode(const StatePtr& initial_state, int max_steps) const;

    DecodeResult decodeDetailed(const StatePtr& initial_state, int max_steps) const;

private:
    const DecoderOracle& decoder_;
    VocabularyConfig vocabulary_;
};

} // namespace beamdec
