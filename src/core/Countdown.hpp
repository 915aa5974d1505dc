#pragma once

#include "../defines.hpp"

struct SCountdownUpdate {
    std::chrono::milliseconds remaining = std::chrono::milliseconds(0);

    // one-shot signals, set on the tick that crossed the threshold
    bool warning   = false;
    bool completed = false;
};

// Counts a fixed duration down on the monotonic clock.
// Bounds of the duration are enforced by the protection config, not here.
class CCountdownTimer {
  public:
    static constexpr auto WARNING_THRESHOLD = std::chrono::seconds(60);

    CCountdownTimer(Clock::duration duration, TimePoint start);

    // No-op (empty update) once completed
    SCountdownUpdate          onTick(TimePoint now);

    std::chrono::milliseconds remaining(TimePoint now) const;
    bool                      warningIssued() const;
    bool                      completed() const;

  private:
    Clock::duration m_duration;
    TimePoint       m_start;

    bool            m_warningIssued = false;
    bool            m_completed     = false;
};
