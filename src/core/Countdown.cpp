#include "Countdown.hpp"
#include <algorithm>

CCountdownTimer::CCountdownTimer(Clock::duration duration, TimePoint start) : m_duration(duration), m_start(start) {
    ;
}

SCountdownUpdate CCountdownTimer::onTick(TimePoint now) {
    if (m_completed)
        return {};

    SCountdownUpdate update{.remaining = remaining(now)};

    if (!m_warningIssued && update.remaining <= WARNING_THRESHOLD) {
        m_warningIssued = true;
        update.warning  = true;
    }

    if (update.remaining.count() <= 0) {
        m_completed      = true;
        update.completed = true;
    }

    return update;
}

std::chrono::milliseconds CCountdownTimer::remaining(TimePoint now) const {
    if (m_completed)
        return std::chrono::milliseconds(0);

    const auto LEFT = std::chrono::ceil<std::chrono::milliseconds>(m_duration - (now - m_start));
    return std::max(LEFT, std::chrono::milliseconds(0));
}

bool CCountdownTimer::warningIssued() const {
    return m_warningIssued;
}

bool CCountdownTimer::completed() const {
    return m_completed;
}
