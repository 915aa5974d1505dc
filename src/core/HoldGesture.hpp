#pragma once

#include "../defines.hpp"

enum eHoldState : uint8_t {
    HOLD_IDLE = 0,
    HOLD_HOLDING,
    HOLD_COMPLETED,
};

struct SHoldUpdate {
    enum eSignal : uint8_t {
        HOLD_SIGNAL_NONE = 0,
        HOLD_SIGNAL_PROGRESS,
        HOLD_SIGNAL_COMPLETED,
    } signal = HOLD_SIGNAL_NONE;

    // elapsed / required, clamped to [0, 1]
    float progress = 0.F;
};

// Press-and-hold confirmation on the close control.
// Idle -> Holding -> Completed, Holding -> Idle on an early release. Completed is terminal.
class CHoldGestureTracker {
  public:
    static constexpr auto DEFAULT_HOLD_DURATION = std::chrono::seconds(3);

    CHoldGestureTracker(Clock::duration required = DEFAULT_HOLD_DURATION);

    void            onPressStart(TimePoint now);
    SHoldUpdate     onTick(TimePoint now);
    SHoldUpdate     onRelease(TimePoint now);

    eHoldState      state() const;
    float           progress(TimePoint now) const;
    Clock::duration required() const;

  private:
    Clock::duration m_required;
    eHoldState      m_state = HOLD_IDLE;
    TimePoint       m_start;
};
