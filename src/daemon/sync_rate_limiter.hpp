#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>

namespace blastd {

// Sliding-window admission control for client-triggered syncs: at most
// `limit` admissions within any trailing `window`.
class SyncRateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    SyncRateLimiter(int limit, Clock::duration window, TimeSource now = &Clock::now);

    // Throws RateLimited when the window is already full.
    void check();

    // Records an attempt at the current time.
    void record();

    // check() and record() under one lock, so concurrent callers cannot
    // both pass the check before either records.
    void admit();

    int recentCount();

private:
    // Caller holds m_mutex.
    void prune(Clock::time_point now);
    void checkLocked(Clock::time_point now);

    const int m_limit;
    const Clock::duration m_window;
    TimeSource m_now;

    std::mutex m_mutex;
    std::deque<Clock::time_point> m_requests;
};

} // namespace blastd
