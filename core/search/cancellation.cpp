#include "search/cancellation.hpp"

#include <cmath>
#include <limits>

namespace beamdec {

void CancellationToken::setDeadline(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::isnan(seconds) || seconds > kMaxDeadlineSeconds) {
        has_deadline_ = false;
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (seconds <= 0.0) {
        deadline_ = now;
    } else {
        deadline_ = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(seconds));
    }
    has_deadline_ = true;
}

void CancellationToken::clearDeadline() {
    std::lock_guard<std::mutex> lock(mutex_);
    has_deadline_ = false;
}

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) return true;
    return remainingSeconds() <= 0.0;
}

double CancellationToken::remainingSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_deadline_) return std::numeric_limits<double>::max();
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(deadline_ - now).count();
}

} // namespace beamdec
