#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>

namespace bountygate {

class CancelToken;

struct RateBudget {
    int requests_per_minute = 5;
    int max_concurrency = 4;
};

// ---------------------------------------------------------------------------
// Interval limiter bounding both burst concurrency and sustained rate.
//
//   permits   : max_concurrency concurrent holders (counting semaphore)
//   interval  : 60 / requests_per_minute seconds between successive grants
//
// acquire() takes a permit, then reserves the next grant slot
// max(now, latest + interval), where latest is the newest pending
// reservation or else the last real grant, and sleeps outside the lock
// until it. A caller cancelled before its slot gives the reservation back,
// so later callers wait only for grants that actually happened.
// The internal mutex only guards bookkeeping; nothing sleeps while holding it.
//
// Every successful acquire() must be paired with exactly one release().
// Use ScopedPermit.
// ---------------------------------------------------------------------------
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // Throws ConfigError when either budget field is < 1.
    explicit RateLimiter(const RateBudget& budget);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks for a permit and the spacing interval. Returns false, holding
    // nothing, when `cancel` fires during either wait.
    bool acquire(const CancelToken* cancel = nullptr);
    void release();

    // Grants inside the trailing 60 seconds. Informational only.
    size_t current_rate() const;

    int in_flight() const;
    Clock::duration interval() const { return interval_; }
    const RateBudget& budget() const { return budget_; }

private:
    bool take_permit(const CancelToken* cancel);
    Clock::time_point next_slot_locked(Clock::time_point now) const;

    RateBudget budget_;
    Clock::duration interval_;

    mutable std::mutex mtx_;
    std::condition_variable permit_cv_;
    int available_;
    bool has_granted_{false};
    Clock::time_point last_grant_{};          // last slot a caller actually reached
    std::multiset<Clock::time_point> pending_;  // reserved, not yet reached
    std::deque<Clock::time_point> window_;
};

// RAII permit. Check held() before doing the guarded work.
class ScopedPermit {
public:
    ScopedPermit(RateLimiter& limiter, const CancelToken* cancel = nullptr);
    ~ScopedPermit();

    ScopedPermit(const ScopedPermit&) = delete;
    ScopedPermit& operator=(const ScopedPermit&) = delete;

    bool held() const { return held_; }

private:
    RateLimiter& limiter_;
    bool held_;
};

} // namespace bountygate
