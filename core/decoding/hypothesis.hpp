#pragma once

#include "decoding/oracle.hpp"
#include "decoding/vocabulary.hpp"

#include <cstdint>
#include <vector>

namespace beamdec {

/// One candidate output sequence in the beam.
/// `score` is the accumulated negative log-probability (lower = better).
/// `id` is the creation ordinal within one decode call and breaks score
/// ties in favour of the earlier hypothesis.
struct Hypothesis {
    uint64_t id = 0;
    std::vector<TokenId> token_sequence;
    double score = 0.0;
    StatePtr state;
    bool is_live = true;

    TokenId lastToken() const { return token_sequence.back(); }

    /// Number of tokens generated after the start token.
    size_t length() const { return token_sequence.empty() ? 0 : token_sequence.size() - 1; }
};

/// Strict total order: lower score first, then earlier creation.
inline bool ranksBefore(double score_a, uint64_t id_a, double score_b, uint64_t id_b) {
    if (score_a != score_b) return score_a < score_b;
    return id_a < id_b;
}

inline bool ranksBefore(const Hypothesis& a, const Hypothesis& b) {
    return ranksBefore(a.score, a.id, b.score, b.id);
}

} // namespace beamdec
