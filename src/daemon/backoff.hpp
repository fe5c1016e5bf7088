#pragma once

#include <chrono>

namespace blastd {

// Exponential retry delay: the first failure waits `min`, each further
// consecutive failure doubles the wait up to `max`; reset() starts over.
class Backoff {
public:
    Backoff(std::chrono::milliseconds min, std::chrono::milliseconds max)
        : m_min(min)
        , m_max(max < min ? min : max)
    {
    }

    std::chrono::milliseconds next()
    {
        if (m_current == std::chrono::milliseconds::zero()) {
            m_current = m_min;
        } else {
            m_current = m_current * 2;
            if (m_current > m_max) {
                m_current = m_max;
            }
        }
        return m_current;
    }

    void reset()
    {
        m_current = std::chrono::milliseconds::zero();
    }

    std::chrono::milliseconds current() const
    {
        return m_current;
    }

private:
    std::chrono::milliseconds m_min;
    std::chrono::milliseconds m_max;
    std::chrono::milliseconds m_current{0};
};

} // namespace blastd
