#include "bountygate/throttle/RateLimiter.hpp"

#include <algorithm>
#include <thread>

#include "bountygate/infra/Config.hpp"
#include "bountygate/runtime/CancelToken.hpp"

namespace bountygate {

namespace {
constexpr auto kRateWindow = std::chrono::seconds(60);
// Permit waits re-check cancellation at this granularity.
constexpr auto kPermitPoll = std::chrono::milliseconds(50);
}

RateLimiter::RateLimiter(const RateBudget& budget)
    : budget_(budget),
      interval_(),
      available_(budget.max_concurrency)
{
    if (budget.requests_per_minute < 1) {
        throw ConfigError("requests_per_minute must be >= 1");
    }
    if (budget.max_concurrency < 1) {
        throw ConfigError("max_concurrency must be >= 1");
    }
    interval_ = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(60.0 / budget.requests_per_minute));
}

bool RateLimiter::take_permit(const CancelToken* cancel) {
    std::unique_lock<std::mutex> lock(mtx_);
    while (available_ == 0) {
        if (cancel && cancel->cancelled()) return false;
        permit_cv_.wait_for(lock, kPermitPoll);
    }
    if (cancel && cancel->cancelled()) return false;
    --available_;
    return true;
}

RateLimiter::Clock::time_point RateLimiter::next_slot_locked(Clock::time_point now) const {
    if (!pending_.empty()) return std::max(now, *pending_.rbegin() + interval_);
    if (has_granted_) return std::max(now, last_grant_ + interval_);
    return now;
}

bool RateLimiter::acquire(const CancelToken* cancel) {
    if (!take_permit(cancel)) return false;

    // Reserve the grant slot under the lock so concurrent callers queue up
    // at successive intervals instead of all firing at once.
    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        slot = next_slot_locked(Clock::now());
        pending_.insert(slot);
    }

    bool reached = true;
    if (cancel) {
        reached = cancel->wait_until(slot);
    } else {
        std::this_thread::sleep_until(slot);
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.erase(pending_.find(slot));
        if (reached) {
            if (!has_granted_ || slot > last_grant_) last_grant_ = slot;
            has_granted_ = true;
            window_.push_back(slot);
            const auto horizon = Clock::now() - kRateWindow;
            while (!window_.empty() && window_.front() < horizon) window_.pop_front();
            // Only the trailing minute is ever reported, so rpm entries suffice.
            while (window_.size() > static_cast<size_t>(budget_.requests_per_minute)) window_.pop_front();
        }
    }

    if (!reached) {
        release();
        return false;
    }
    return true;
}

void RateLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (available_ < budget_.max_concurrency) ++available_;
    }
    permit_cv_.notify_one();
}

size_t RateLimiter::current_rate() const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto horizon = Clock::now() - kRateWindow;
    return static_cast<size_t>(std::count_if(window_.begin(), window_.end(),
        [&](const Clock::time_point& t) { return t >= horizon; }));
}

int RateLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return budget_.max_concurrency - available_;
}

// ---------------------------------------------------------------------------

ScopedPermit::ScopedPermit(RateLimiter& limiter, const CancelToken* cancel)
    : limiter_(limiter),
      held_(limiter.acquire(cancel)) {}

ScopedPermit::~ScopedPermit() {
    if (held_) limiter_.release();
}

} // namespace bountygate
