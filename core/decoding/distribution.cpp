#include "decoding/distribution.hpp"
#include "decoding/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace beamdec {

void validateDistribution(const std::vector<double>& probs, size_t expected_size) {
    if (expected_size > 0 && probs.size() != expected_size) {
        throw OracleFailure("distribution has " + std::to_string(probs.size()) +
                            " entries, vocabulary has " + std::to_string(expected_size));
    }
    if (probs.empty()) {
        throw EmptyVocabularyDistribution("no entries");
    }

    double total = 0.0;
    for (size_t i = 0; i < probs.size(); i++) {
        double p = probs[i];
        if (!std::isfinite(p) || p < 0.0) {
            throw EmptyVocabularyDistribution("entry " + std::to_string(i) +
                                              " is not a valid probability");
        }
        if (p > 1.0 + kProbabilityTolerance) {
            throw OracleFailure("entry " + std::to_string(i) + " is " + std::to_string(p) +
                                ", above 1");
        }
        total += p;
    }
    if (!(total > 0.0)) {
        throw EmptyVocabularyDistribution("total mass is not positive");
    }
}

std::vector<TokenId> selectTopK(const std::vector<double>& probs, int k) {
    std::vector<TokenId> ids;
    if (k <= 0) return ids;

    ids.reserve(probs.size());
    for (size_t i = 0; i < probs.size(); i++) {
        if (probs[i] > 0.0) ids.push_back(static_cast<TokenId>(i));
    }

    auto ranks_before = [&probs](TokenId a, TokenId b) {
        if (probs[a] != probs[b]) return probs[a] > probs[b];
        return a < b;
    };

    size_t keep = std::min(static_cast<size_t>(k), ids.size());
    std::partial_sort(ids.begin(), ids.begin() + keep, ids.end(), ranks_before);
    ids.resize(keep);
    return ids;
}

TokenId argmax(const std::vector<double>& probs) {
    std::vector<TokenId> top = selectTopK(probs, 1);
    if (top.empty()) {
        throw EmptyVocabularyDistribution("no token with positive probability");
    }
    return top.front();
}

double negativeLogProb(double p) {
    if (p >= 1.0) return 0.0;
    return -std::log(p);
}

} // namespace beamdec
