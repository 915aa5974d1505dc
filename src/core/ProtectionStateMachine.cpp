#include "ProtectionStateMachine.hpp"
#include "../helpers/Log.hpp"
#include "../helpers/MiscFunctions.hpp"
#include <exception>
#include <format>

CProtectionStateMachine::CProtectionStateMachine(SProtectionBackends backends) : m_backends(std::move(backends)) {
    RASSERT(m_backends.interceptor && m_backends.sleepGuard && m_backends.overlay, "Protection state machine needs all of its backends");

    if (!m_backends.clock)
        m_backends.clock = [] { return Clock::now(); };
}

CProtectionStateMachine::~CProtectionStateMachine() {
    if (m_state != PROTECTION_IDLE)
        teardown();
}

SStartError CProtectionStateMachine::start(const SProtectionConfig& config) {
    if (m_state != PROTECTION_IDLE) {
        Debug::log(WARN, "[protection] start() while {}, rejecting", protectionStateString(m_state));
        return {.status = SStartError::START_ALREADY_ACTIVE, .message = "a protection session is already running"};
    }

    if (const auto ERROR = config.validate(); ERROR.has_value())
        return failStart({.status = SStartError::START_INVALID_CONFIG, .message = *ERROR});

    m_stopRequested = false;
    setState(PROTECTION_STARTING);

    m_session         = makeUnique<SProtectionSession>();
    m_session->config = config;

    if (const auto ERROR = m_backends.sleepGuard->acquire(); ERROR.has_value())
        return failStart({.status = SStartError::START_SLEEP_GUARD_UNAVAILABLE, .message = *ERROR});

    // the overlay must not appear unless input is actually captured
    if (const auto RESULT = m_backends.interceptor->install(this); RESULT.status != SInterceptorError::INTERCEPTOR_OK)
        return failStart({.status = SStartError::START_PERMISSION_DENIED, .message = RESULT.message});

    const auto NOW = m_backends.clock();

    if (config.timer.has_value())
        m_session->countdown.emplace(*config.timer, NOW);

    m_backends.overlay->show(overlayState(NOW));
    m_session->overlayShown = true;

    setState(PROTECTION_ACTIVE);

    Debug::log(LOG, "[protection] Protection active, unlock with {}{}", config.exitKey.render(),
               config.timer.has_value() ? std::format(", auto exit in {}", formatDuration(std::chrono::duration_cast<std::chrono::minutes>(*config.timer))) : "");

    if (m_stopRequested) {
        Debug::log(LOG, "[protection] Stop was requested while starting");
        endSession(EXIT_FORCED_STOP);
    }

    return {};
}

void CProtectionStateMachine::stop() {
    switch (m_state) {
        case PROTECTION_IDLE:
        case PROTECTION_EXITING: return;
        case PROTECTION_STARTING: m_stopRequested = true; return;
        case PROTECTION_ACTIVE: endSession(EXIT_FORCED_STOP); return;
    }
}

eProtectionState CProtectionStateMachine::currentState() const {
    return m_state;
}

bool CProtectionStateMachine::sessionExists() const {
    return !!m_session;
}

size_t CProtectionStateMachine::subscribe(ProtectionListener listener) {
    const auto ID = m_nextListenerID++;
    m_vListeners.emplace_back(ID, std::move(listener));
    return ID;
}

void CProtectionStateMachine::unsubscribe(size_t id) {
    std::erase_if(m_vListeners, [id](const auto& l) { return l.first == id; });
}

void CProtectionStateMachine::tick() {
    if (m_state != PROTECTION_ACTIVE)
        return;

    const auto NOW = m_backends.clock();

    applyHoldUpdate(m_session->hold.onTick(NOW), NOW);

    if (m_state != PROTECTION_ACTIVE || !m_session->countdown)
        return;

    const auto UPDATE = m_session->countdown->onTick(NOW);

    if (UPDATE.warning) {
        Debug::log(LOG, "[protection] Less than a minute of protection left");
        emit({.type = PROTECTION_EVENT_COUNTDOWN_WARNING, .state = m_state, .remaining = UPDATE.remaining});

        // a listener may have stopped us
        if (m_state != PROTECTION_ACTIVE)
            return;
    }

    if (UPDATE.completed) {
        endSession(EXIT_TIMER_EXPIRED);
        return;
    }

    // one update per displayed second
    const auto SECOND = (UPDATE.remaining.count() + 999) / 1000;
    if (SECOND != m_session->lastCountdownSecond) {
        m_session->lastCountdownSecond = SECOND;
        emit({.type = PROTECTION_EVENT_COUNTDOWN, .state = m_state, .remaining = UPDATE.remaining});
        pushOverlayState(NOW);
    }
}

eInputDecision CProtectionStateMachine::onInputEvent(const SInputEvent& event) {
    // nothing to decide outside of Active, but nothing goes through either
    if (m_state != PROTECTION_ACTIVE)
        return INPUT_SUPPRESS;

    const auto DECISION = classifyInput(event, m_session->config.exitKey);
    const auto NOW      = m_backends.clock();

    switch (DECISION) {
        case INPUT_UNLOCK:
            Debug::log(LOG, "[protection] Unlock chord matched");
            endSession(EXIT_UNLOCK_KEY);
            break;
        case INPUT_CLOSE_CONTROL: handleCloseControl(event, NOW); break;
        case INPUT_SUPPRESS:
            // pointer or touch activity off the close control interrupts a hold, keys never do
            if (event.type != INPUT_EVENT_KEY && m_session->hold.state() == HOLD_HOLDING) {
                Debug::log(TRACE, "[protection] Hold interrupted");
                applyHoldUpdate(m_session->hold.onRelease(NOW), NOW);
            }
            break;
    }

    return DECISION;
}

void CProtectionStateMachine::onCaptureLost() {
    if (m_state != PROTECTION_ACTIVE)
        return;

    Debug::log(WARN, "[protection] The capture point was revoked, ending the session");
    endSession(EXIT_CAPTURE_LOST);
}

void CProtectionStateMachine::handleCloseControl(const SInputEvent& event, TimePoint now) {
    auto& hold = m_session->hold;

    switch (event.type) {
        case INPUT_EVENT_POINTER_BUTTON:
        case INPUT_EVENT_TOUCH_DOWN:
        case INPUT_EVENT_TOUCH_UP:
            if (event.pressed && hold.state() == HOLD_IDLE) {
                Debug::log(TRACE, "[protection] Hold started");
                hold.onPressStart(now);
                applyHoldUpdate({.signal = SHoldUpdate::HOLD_SIGNAL_PROGRESS, .progress = 0.F}, now);
            } else if (!event.pressed)
                applyHoldUpdate(hold.onRelease(now), now);
            break;
        case INPUT_EVENT_POINTER_MOTION:
        case INPUT_EVENT_TOUCH_MOTION:
            // came back onto the button with it still held, start over
            if (event.primaryHeld && hold.state() == HOLD_IDLE) {
                hold.onPressStart(now);
                applyHoldUpdate({.signal = SHoldUpdate::HOLD_SIGNAL_PROGRESS, .progress = 0.F}, now);
            }
            break;
        default: break;
    }
}

void CProtectionStateMachine::applyHoldUpdate(const SHoldUpdate& update, TimePoint now) {
    switch (update.signal) {
        case SHoldUpdate::HOLD_SIGNAL_NONE: return;
        case SHoldUpdate::HOLD_SIGNAL_PROGRESS:
            emit({.type = PROTECTION_EVENT_HOLD_PROGRESS, .state = m_state, .holdProgress = update.progress});
            pushOverlayState(now);
            return;
        case SHoldUpdate::HOLD_SIGNAL_COMPLETED:
            emit({.type = PROTECTION_EVENT_HOLD_PROGRESS, .state = m_state, .holdProgress = 1.F});
            Debug::log(LOG, "[protection] Close button held long enough");
            endSession(EXIT_HOLD_COMPLETE);
            return;
    }
}

void CProtectionStateMachine::endSession(eExitReason reason) {
    if (m_state != PROTECTION_ACTIVE)
        return;

    setState(PROTECTION_EXITING);
    teardown();
    setState(PROTECTION_IDLE);

    Debug::log(LOG, "[protection] Session ended: {}", exitReasonString(reason));
    emit({.type = PROTECTION_EVENT_SESSION_ENDED, .state = m_state, .reason = reason});
}

// Fixed order, every step is safe if its resource was never acquired. A failing step never keeps the
// following ones from running.
void CProtectionStateMachine::teardown() {
    try {
        m_backends.sleepGuard->release();
    } catch (std::exception& e) { Debug::log(ERR, "[protection] Releasing the sleep lease failed: {}", e.what()); }

    try {
        m_backends.interceptor->uninstall();
    } catch (std::exception& e) { Debug::log(ERR, "[protection] Removing the capture point failed: {}", e.what()); }

    try {
        m_backends.overlay->hide();
    } catch (std::exception& e) { Debug::log(ERR, "[protection] Hiding the overlay failed: {}", e.what()); }

    m_session.reset();
}

SStartError CProtectionStateMachine::failStart(SStartError error) {
    Debug::log(ERR, "[protection] Could not start protection: {}: {}", startErrorString(error.status), error.message);

    if (m_state != PROTECTION_IDLE) {
        teardown();
        setState(PROTECTION_IDLE);
    }

    m_stopRequested = false;
    emit({.type = PROTECTION_EVENT_START_FAILED, .state = m_state, .error = error});

    return error;
}

void CProtectionStateMachine::setState(eProtectionState state) {
    if (m_state == state)
        return;

    Debug::log(TRACE, "[protection] {} -> {}", protectionStateString(m_state), protectionStateString(state));

    m_state = state;
    emit({.type = PROTECTION_EVENT_STATE_CHANGED, .state = state});
}

void CProtectionStateMachine::pushOverlayState(TimePoint now) {
    if (!m_session || !m_session->overlayShown)
        return;

    m_backends.overlay->update(overlayState(now));
}

SOverlayState CProtectionStateMachine::overlayState(TimePoint now) const {
    const auto& CONFIG = m_session->config;

    SOverlayState state{
        .opacity      = CONFIG.opacity,
        .holdProgress = m_session->hold.progress(now),
        .unlockHint   = std::format("Press {} or hold the close button for {} seconds to exit", CONFIG.exitKey.render(),
                                    std::chrono::duration_cast<std::chrono::seconds>(m_session->hold.required()).count()),
    };

    if (m_session->countdown) {
        state.showCountdown    = !CONFIG.hideTimer;
        state.remaining        = m_session->countdown->remaining(now);
        state.countdownWarning = m_session->countdown->warningIssued();
    }

    return state;
}

void CProtectionStateMachine::emit(const SProtectionEvent& event) {
    // listeners may subscribe or unsubscribe from within the callback
    const auto LISTENERS = m_vListeners;
    for (const auto& l : LISTENERS) {
        l.second(event);
    }
}

const char* protectionStateString(eProtectionState state) {
    switch (state) {
        case PROTECTION_IDLE: return "idle";
        case PROTECTION_STARTING: return "starting";
        case PROTECTION_ACTIVE: return "active";
        case PROTECTION_EXITING: return "exiting";
    }
    return "??";
}

const char* exitReasonString(eExitReason reason) {
    switch (reason) {
        case EXIT_UNLOCK_KEY: return "unlock key";
        case EXIT_HOLD_COMPLETE: return "hold complete";
        case EXIT_TIMER_EXPIRED: return "timer expired";
        case EXIT_FORCED_STOP: return "forced stop";
        case EXIT_CAPTURE_LOST: return "capture lost";
    }
    return "??";
}

const char* startErrorString(SStartError::eStatus status) {
    switch (status) {
        case SStartError::START_OK: return "ok";
        case SStartError::START_PERMISSION_DENIED: return "permission denied";
        case SStartError::START_ALREADY_ACTIVE: return "already active";
        case SStartError::START_INVALID_CONFIG: return "invalid config";
        case SStartError::START_SLEEP_GUARD_UNAVAILABLE: return "sleep guard unavailable";
    }
    return "??";
}
