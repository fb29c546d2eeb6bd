#pragma once

#include <atomic>
#include <chrono>
#include <mutex>

namespace beamdec {

/// Cooperative cancellation for decode calls.
/// Checked once per round, before any oracle call of that round.
/// Either cancelled explicitly or by an optional wall-clock deadline.
class CancellationToken {
public:
    CancellationToken() = default;

    void cancel() { cancelled_.store(true); }

    /// Longest representable deadline (about 31 years).
    static constexpr double kMaxDeadlineSeconds = 1e9;

    /// Cancel automatically once `seconds` have elapsed from now.
    /// Zero or negative expires immediately. NaN, +inf or anything above
    /// kMaxDeadlineSeconds clears the deadline instead.
    void setDeadline(double seconds);
    void clearDeadline();

    bool isCancelled() const;

    /// Seconds left before the deadline, negative once it passed.
    /// Returns a very large value when no deadline is set.
    double remainingSeconds() const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    bool has_deadline_ = false;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace beamdec
