#pragma once

#include "decoding/hypothesis.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace beamdec {

// ─── Bounded Beam ──────────────────────────────────────────────
// Fixed-capacity collection that keeps the `capacity` best hypotheses
// offered to it, ordered by (score, id). Backed by a heap whose top is
// the worst kept entry, so each offer is O(log capacity) and a round
// never sorts its full candidate list.

class BoundedBeam {
public:
    explicit BoundedBeam(size_t capacity);

    /// True if a hypothesis with this key would be kept.
    /// Lets callers skip building children that would be discarded.
    bool accepts(double score, uint64_t id) const;

    /// Offer a hypothesis. Returns false if it was rejected.
    bool offer(Hypothesis hypothesis);

    /// Remove and return all kept hypotheses, best first.
    std::vector<Hypothesis> takeSorted();

    size_t size() const { return heap_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return heap_.empty(); }

private:
    size_t capacity_;
    std::vector<Hypothesis> heap_;
};

} // namespace beamdec
