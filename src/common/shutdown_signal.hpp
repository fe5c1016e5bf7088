#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace blastd {

// Broadcast-once cancellation flag. Any number of threads may wait on it;
// once triggered it stays triggered.
class ShutdownSignal {
public:
    void trigger()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_triggered = true;
        }
        m_cond.notify_all();
    }

    bool isTriggered() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_triggered;
    }

    // Returns true when the signal fired before the timeout elapsed.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cond.wait_for(lock, timeout, [this] { return m_triggered; });
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return m_triggered; });
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_triggered = false;
};

} // namespace blastd
