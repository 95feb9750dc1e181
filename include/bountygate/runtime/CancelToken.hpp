#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bountygate {

// ---------------------------------------------------------------------------
// Run-level cancellation. Cancelled either explicitly (signal handler path,
// operator abort) or implicitly once the optional deadline passes.
// Blocking waits in the pipeline go through wait_until() so a cancel wakes
// them immediately.
// ---------------------------------------------------------------------------
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    // A child token also reports cancelled once `parent` is.
    explicit CancelToken(const CancelToken* parent = nullptr) : parent_(parent) {}
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel();
    bool cancelled() const;

    // Zero or negative seconds clears the deadline.
    void set_timeout(std::chrono::seconds timeout);

    // Sleeps until `tp`, the deadline or cancel(), whichever comes first.
    // Returns true when `tp` was reached without cancellation.
    bool wait_until(Clock::time_point tp) const;

private:
    bool expired_locked() const;

    const CancelToken* parent_;
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    bool has_deadline_{false};
    Clock::time_point deadline_{};
};

} // namespace bountygate
