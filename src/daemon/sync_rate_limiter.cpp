#include "daemon/sync_rate_limiter.hpp"

#include <string>

#include "common/errors.hpp"

namespace blastd {

namespace {

// "9m59s" / "42s", the way remaining waits are shown to clients.
std::string formatWait(std::chrono::seconds wait)
{
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(wait);
    const auto seconds = wait - minutes;
    if (minutes.count() > 0) {
        return std::to_string(minutes.count()) + "m" + std::to_string(seconds.count()) + "s";
    }
    return std::to_string(seconds.count()) + "s";
}

} // namespace

SyncRateLimiter::SyncRateLimiter(int limit, Clock::duration window, TimeSource now)
    : m_limit(limit)
    , m_window(window)
    , m_now(std::move(now))
{
}

void SyncRateLimiter::check()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    checkLocked(m_now());
}

void SyncRateLimiter::record()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_now();
    prune(now);
    m_requests.push_back(now);
}

void SyncRateLimiter::admit()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_now();
    checkLocked(now);
    m_requests.push_back(now);
}

int SyncRateLimiter::recentCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    prune(m_now());
    return static_cast<int>(m_requests.size());
}

void SyncRateLimiter::prune(Clock::time_point now)
{
    const auto cutoff = now - m_window;
    while (!m_requests.empty() && m_requests.front() <= cutoff) {
        m_requests.pop_front();
    }
}

void SyncRateLimiter::checkLocked(Clock::time_point now)
{
    prune(now);
    if (static_cast<int>(m_requests.size()) < m_limit) {
        return;
    }

    const auto waitUntil = m_requests.front() + m_window;
    // Round to the nearest second, never below one.
    auto retryAfter = std::chrono::duration_cast<std::chrono::seconds>(
        waitUntil - now + std::chrono::milliseconds(500));
    if (retryAfter < std::chrono::seconds(1)) {
        retryAfter = std::chrono::seconds(1);
    }
    throw RateLimited("rate limited: try again in " + formatWait(retryAfter), retryAfter);
}

} // namespace blastd
