#include "Timer.hpp"

CTimer::CTimer(Clock::duration timeout, std::function<void(SP<CTimer> self, void* data)> cb_, void* data_) : cb(cb_), data(data_) {
    expires = Clock::now() + timeout;
}

bool CTimer::passed() {
    return Clock::now() >= expires;
}

void CTimer::cancel() {
    wasCancelled = true;
}

bool CTimer::cancelled() {
    return wasCancelled;
}

void CTimer::call(SP<CTimer> self) {
    cb(self, data);
}

float CTimer::leftMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(expires - Clock::now()).count();
}

TimePoint CTimer::expiry() const {
    return expires;
}
