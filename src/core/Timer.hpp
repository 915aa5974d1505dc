#pragma once

#include <chrono>
#include <functional>
#include "../defines.hpp"

// Runs on the event loop thread, expiry is measured on the monotonic clock
class CTimer {
  public:
    CTimer(Clock::duration timeout, std::function<void(SP<CTimer> self, void* data)> cb_, void* data_);

    void      cancel();
    bool      passed();
    bool      cancelled();

    float     leftMs();
    TimePoint expiry() const;

    void      call(SP<CTimer> self);

  private:
    std::function<void(SP<CTimer> self, void* data)> cb;
    void*                                            data = nullptr;
    TimePoint                                        expires;
    bool                                             wasCancelled = false;
};
