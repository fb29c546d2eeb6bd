#pragma once

#include "decoding/vocabulary.hpp"

#include <cstddef>
#include <vector>

namespace beamdec {

/// Rounding slack allowed above 1.0 for a single probability.
constexpr double kProbabilityTolerance = 1e-6;

/// Check a next-token distribution returned by the decoder.
/// Throws EmptyVocabularyDistribution if it is empty, has a negative or
/// non-finite entry, or does not sum to a positive value.
/// Throws OracleFailure if an entry exceeds 1 (beyond kProbabilityTolerance)
/// or if `expected_size` > 0 and the length differs.
void validateDistribution(const std::vector<double>& probs, size_t expected_size = 0);

/// Up to `k` token ids with positive probability, ordered by descending
/// probability; equal probabilities are ordered by ascending token id.
std::vector<TokenId> selectTopK(const std::vector<double>& probs, int k);

/// Index of the most probable token (lowest id among ties).
TokenId argmax(const std::vector<double>& probs);

/// -log(p). `p` must be in (0, 1 + kProbabilityTolerance]; values just
/// above 1 from rounding cost 0, so the result is never negative.
double negativeLogProb(double p);

} // namespace beamdec
