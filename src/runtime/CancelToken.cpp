#include "bountygate/runtime/CancelToken.hpp"

#include <algorithm>

namespace bountygate {

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

namespace {
// Parent cancellation has no way to notify a child's condition variable.
constexpr auto kParentPoll = std::chrono::milliseconds(100);
}

bool CancelToken::cancelled() const {
    if (cancelled_.load()) return true;
    if (parent_ && parent_->cancelled()) return true;
    std::lock_guard<std::mutex> lock(mtx_);
    return expired_locked();
}

void CancelToken::set_timeout(std::chrono::seconds timeout) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (timeout.count() <= 0) {
            has_deadline_ = false;
        } else {
            has_deadline_ = true;
            deadline_ = Clock::now() + timeout;
        }
    }
    cv_.notify_all();
}

bool CancelToken::expired_locked() const {
    return has_deadline_ && Clock::now() >= deadline_;
}

bool CancelToken::wait_until(Clock::time_point tp) const {
    std::unique_lock<std::mutex> lock(mtx_);
    while (true) {
        if (cancelled_.load() || expired_locked()) return false;
        if (parent_ && parent_->cancelled()) return false;

        Clock::time_point wake = tp;
        if (has_deadline_ && deadline_ < wake) wake = deadline_;
        if (parent_) wake = std::min<Clock::time_point>(wake, Clock::now() + kParentPoll);

        if (Clock::now() >= tp) return true;
        cv_.wait_until(lock, wake);
    }
}

} // namespace bountygate
