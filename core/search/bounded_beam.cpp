#include "search/bounded_beam.hpp"
#include "decoding/errors.hpp"

#include <algorithm>
#include <utility>

namespace beamdec {

namespace {

// Heap order: the worst hypothesis sits at the front.
bool heapLess(const Hypothesis& a, const Hypothesis& b) {
    return ranksBefore(a, b);
}

} // namespace

BoundedBeam::BoundedBeam(size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw InvalidArgument("beam capacity must be positive");
    }
    heap_.reserve(capacity_);
}

bool BoundedBeam::accepts(double score, uint64_t id) const {
    if (heap_.size() < capacity_) return true;
    const Hypothesis& worst = heap_.front();
    return ranksBefore(score, id, worst.score, worst.id);
}

bool BoundedBeam::offer(Hypothesis hypothesis) {
    if (!accepts(hypothesis.score, hypothesis.id)) return false;

    if (heap_.size() == capacity_) {
        std::pop_heap(heap_.begin(), heap_.end(), heapLess);
        heap_.back() = std::move(hypothesis);
    } else {
        heap_.push_back(std::move(hypothesis));
    }
    std::push_heap(heap_.begin(), heap_.end(), heapLess);
    return true;
}

std::vector<Hypothesis> BoundedBeam::takeSorted() {
    std::sort_heap(heap_.begin(), heap_.end(), heapLess);
    std::vector<Hypothesis> out = std::move(heap_);
    heap_.clear();
    heap_.reserve(capacity_);
    return out;
}

} // namespace beamdec
