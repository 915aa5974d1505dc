#include "HoldGesture.hpp"
#include <algorithm>

CHoldGestureTracker::CHoldGestureTracker(Clock::duration required) : m_required(required) {
    ;
}

void CHoldGestureTracker::onPressStart(TimePoint now) {
    if (m_state != HOLD_IDLE)
        return;

    m_state = HOLD_HOLDING;
    m_start = now;
}

SHoldUpdate CHoldGestureTracker::onTick(TimePoint now) {
    if (m_state != HOLD_HOLDING)
        return {};

    if (now - m_start >= m_required) {
        m_state = HOLD_COMPLETED;
        return {.signal = SHoldUpdate::HOLD_SIGNAL_COMPLETED, .progress = 1.F};
    }

    return {.signal = SHoldUpdate::HOLD_SIGNAL_PROGRESS, .progress = progress(now)};
}

SHoldUpdate CHoldGestureTracker::onRelease(TimePoint now) {
    if (m_state != HOLD_HOLDING)
        return {};

    // held long enough, the tick just did not get to it yet
    if (now - m_start >= m_required) {
        m_state = HOLD_COMPLETED;
        return {.signal = SHoldUpdate::HOLD_SIGNAL_COMPLETED, .progress = 1.F};
    }

    m_state = HOLD_IDLE;
    return {.signal = SHoldUpdate::HOLD_SIGNAL_PROGRESS, .progress = 0.F};
}

eHoldState CHoldGestureTracker::state() const {
    return m_state;
}

float CHoldGestureTracker::progress(TimePoint now) const {
    switch (m_state) {
        case HOLD_IDLE: return 0.F;
        case HOLD_COMPLETED: return 1.F;
        default: break;
    }

    const auto ELAPSED = std::chrono::duration<float>(now - m_start).count();
    const auto TOTAL   = std::chrono::duration<float>(m_required).count();

    return std::clamp(ELAPSED / TOTAL, 0.F, 1.F);
}

Clock::duration CHoldGestureTracker::required() const {
    return m_required;
}
