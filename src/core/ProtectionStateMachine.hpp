#pragma once

#include "../defines.hpp"
#include "../config/ProtectionConfig.hpp"
#include "InputInterceptor.hpp"
#include "SleepGuard.hpp"
#include "Overlay.hpp"
#include "HoldGesture.hpp"
#include "Countdown.hpp"
#include <functional>
#include <optional>
#include <vector>

enum eProtectionState : uint8_t {
    PROTECTION_IDLE = 0,
    PROTECTION_STARTING,
    PROTECTION_ACTIVE,
    PROTECTION_EXITING,
};

enum eExitReason : uint8_t {
    EXIT_UNLOCK_KEY = 0,
    EXIT_HOLD_COMPLETE,
    EXIT_TIMER_EXPIRED,
    EXIT_FORCED_STOP,
    EXIT_CAPTURE_LOST,
};

struct SStartError {
    enum eStatus : uint8_t {
        START_OK = 0,
        START_PERMISSION_DENIED,
        START_ALREADY_ACTIVE,
        START_INVALID_CONFIG,
        START_SLEEP_GUARD_UNAVAILABLE,
    } status = START_OK;

    std::string message = "";
};

enum eProtectionEventType : uint8_t {
    PROTECTION_EVENT_STATE_CHANGED = 0,
    PROTECTION_EVENT_START_FAILED,
    PROTECTION_EVENT_HOLD_PROGRESS,
    PROTECTION_EVENT_COUNTDOWN,
    PROTECTION_EVENT_COUNTDOWN_WARNING,
    PROTECTION_EVENT_SESSION_ENDED,
};

struct SProtectionEvent {
    eProtectionEventType      type = PROTECTION_EVENT_STATE_CHANGED;

    eProtectionState          state        = PROTECTION_IDLE;
    float                     holdProgress = 0.F;
    std::chrono::milliseconds remaining    = std::chrono::milliseconds(0);
    eExitReason               reason       = EXIT_FORCED_STOP;
    SStartError               error;
};

using ProtectionListener = std::function<void(const SProtectionEvent&)>;

struct SProtectionBackends {
    SP<IInputInterceptor>      interceptor;
    SP<ISleepGuard>            sleepGuard;
    SP<IOverlay>               overlay;
    // monotonic, injectable for tests
    std::function<TimePoint()> clock = [] { return Clock::now(); };
};

// Owns a protection session from start to teardown. All calls happen on one thread, the event loop's.
// Nothing else may suppress input or hold the sleep lease.
class CProtectionStateMachine : public IInputSink {
  public:
    CProtectionStateMachine(SProtectionBackends backends);
    virtual ~CProtectionStateMachine();

    SStartError            start(const SProtectionConfig& config);
    // Always succeeds, returns once input is no longer captured and the lease is gone.
    // Called from within start() (a listener, a signal) it is carried out as soon as start() is done.
    void                   stop();

    eProtectionState       currentState() const;
    bool                   sessionExists() const;

    size_t                 subscribe(ProtectionListener listener);
    void                   unsubscribe(size_t id);

    // periodic, drives the hold gesture and the countdown
    void                   tick();

    virtual eInputDecision onInputEvent(const SInputEvent& event);
    virtual void           onCaptureLost();

  private:
    struct SProtectionSession {
        SProtectionConfig              config;

        bool                           overlayShown = false;

        CHoldGestureTracker            hold;
        std::optional<CCountdownTimer> countdown;
        int64_t                        lastCountdownSecond = -1;
    };

    void                            endSession(eExitReason reason);
    void                            teardown();
    void                            setState(eProtectionState state);
    void                            handleCloseControl(const SInputEvent& event, TimePoint now);
    void                            applyHoldUpdate(const SHoldUpdate& update, TimePoint now);
    void                            pushOverlayState(TimePoint now);
    SOverlayState                   overlayState(TimePoint now) const;
    SStartError                     failStart(SStartError error);
    void                            emit(const SProtectionEvent& event);

    SProtectionBackends             m_backends;
    eProtectionState                m_state = PROTECTION_IDLE;
    UP<SProtectionSession>          m_session;

    // stop() arrived while start() was still running
    bool                            m_stopRequested = false;

    std::vector<std::pair<size_t, ProtectionListener>> m_vListeners;
    size_t                                             m_nextListenerID = 1;
};

const char* protectionStateString(eProtectionState state);
const char* exitReasonString(eExitReason reason);
const char* startErrorString(SStartError::eStatus status);
