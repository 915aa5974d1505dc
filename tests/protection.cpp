#include <algorithm>
#include <functional>
#include <stdexcept>
#include <vector>
#include "shared.hpp"
#include "../src/core/ProtectionStateMachine.hpp"

using namespace std::chrono_literals;

class CFakeInterceptor : public IInputInterceptor {
  public:
    virtual SInterceptorError install(IInputSink* sink) {
        installs++;
        if (onInstall)
            onInstall();

        if (deny)
            return {.status = SInterceptorError::INTERCEPTOR_PERMISSION_DENIED, .message = "no session lock manager"};

        m_sink = sink;
        return {};
    }

    virtual void uninstall() {
        if (m_sink)
            uninstalls++;
        m_sink = nullptr;
    }

    virtual bool installed() const {
        return m_sink;
    }

    // what the compositor would deliver
    eInputDecision feed(const SInputEvent& event) {
        return m_sink ? m_sink->onInputEvent(event) : INPUT_SUPPRESS;
    }

    void revoke() {
        if (m_sink)
            m_sink->onCaptureLost();
    }

    bool                  deny       = false;
    int                   installs   = 0;
    int                   uninstalls = 0;
    std::function<void()> onInstall;

  private:
    IInputSink* m_sink = nullptr;
};

class CFakeSleepGuard : public ISleepGuard {
  public:
    virtual std::optional<std::string> acquire() {
        if (unavailable)
            return "logind is not running";
        if (!m_held)
            leases++;
        m_held = true;
        return std::nullopt;
    }

    virtual void release() {
        const bool WASHELD = m_held;
        m_held             = false;
        if (WASHELD && throwOnRelease)
            throw std::runtime_error("bus went away");
    }

    virtual bool held() const {
        return m_held;
    }

    bool unavailable    = false;
    bool throwOnRelease = false;
    int  leases         = 0;

  private:
    bool m_held = false;
};

class CFakeOverlay : public IOverlay {
  public:
    virtual void show(const SOverlayState& state) {
        shows++;
        last      = state;
        m_visible = true;
    }

    virtual void update(const SOverlayState& state) {
        updates++;
        last = state;
    }

    virtual void hide() {
        m_visible = false;
    }

    virtual bool visible() const {
        return m_visible;
    }

    int           shows   = 0;
    int           updates = 0;
    SOverlayState last;

  private:
    bool m_visible = false;
};

struct SHarness {
    SHarness() {
        interceptor = makeShared<CFakeInterceptor>();
        sleepGuard  = makeShared<CFakeSleepGuard>();
        overlay     = makeShared<CFakeOverlay>();
        machine     = makeUnique<CProtectionStateMachine>(SProtectionBackends{
                .interceptor = interceptor,
                .sleepGuard  = sleepGuard,
                .overlay     = overlay,
                .clock       = [this] { return now; },
        });

        machine->subscribe([this](const SProtectionEvent& e) { events.push_back(e); });
    }

    size_t count(eProtectionEventType type) const {
        return std::ranges::count_if(events, [type](const auto& e) { return e.type == type; });
    }

    std::optional<SProtectionEvent> lastOf(eProtectionEventType type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type)
                return *it;
        }
        return std::nullopt;
    }

    // lease, capture point and overlay are all gone
    bool released() const {
        return !sleepGuard->held() && !interceptor->installed() && !overlay->visible() && !machine->sessionExists();
    }

    TimePoint                     now = TimePoint{} + 1h;
    SP<CFakeInterceptor>          interceptor;
    SP<CFakeSleepGuard>           sleepGuard;
    SP<CFakeOverlay>              overlay;
    UP<CProtectionStateMachine>   machine;
    std::vector<SProtectionEvent> events;
};

static SInputEvent key(uint8_t modifiers, xkb_keysym_t sym, bool pressed = true) {
    return {.type = INPUT_EVENT_KEY, .pressed = pressed, .modifiers = modifiers, .keysym = sym};
}

static SInputEvent button(bool pressed, bool onCloseControl) {
    return {.type = INPUT_EVENT_POINTER_BUTTON, .pressed = pressed, .onCloseControl = onCloseControl, .primaryHeld = pressed};
}

static SInputEvent motion(bool onCloseControl, bool primaryHeld) {
    return {.type = INPUT_EVENT_POINTER_MOTION, .onCloseControl = onCloseControl, .primaryHeld = primaryHeld};
}

int main() {
    int ret = 0;

    {
        // start, suppress, unlock
        SHarness h;
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);

        const auto RESULT = h.machine->start({});
        EXPECT(RESULT.status, SStartError::START_OK);
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);
        EXPECT(h.sleepGuard->held(), true);
        EXPECT(h.interceptor->installed(), true);
        EXPECT(h.overlay->visible(), true);
        EXPECT(h.overlay->last.showCountdown, false);
        EXPECT(h.overlay->last.unlockHint.contains("Super+Alt+U"), true);

        // Idle -> Starting -> Active
        EXPECT(h.count(PROTECTION_EVENT_STATE_CHANGED), 2);
        EXPECT(h.events[0].state, PROTECTION_STARTING);
        EXPECT(h.events[1].state, PROTECTION_ACTIVE);

        EXPECT(h.interceptor->feed(key(MODIFIER_NONE, XKB_KEY_a)), INPUT_SUPPRESS);
        EXPECT(h.interceptor->feed(key(MODIFIER_SUPER, XKB_KEY_u)), INPUT_SUPPRESS);
        EXPECT(h.interceptor->feed(button(true, false)), INPUT_SUPPRESS);
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);

        EXPECT(h.interceptor->feed(key(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u)), INPUT_UNLOCK);
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.released(), true);
        EXPECT(h.interceptor->uninstalls, 1);

        const auto ENDED = h.lastOf(PROTECTION_EVENT_SESSION_ENDED);
        EXPECT(ENDED.has_value(), true);
        EXPECT(ENDED->reason, EXIT_UNLOCK_KEY);
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 1);

        // ... -> Exiting -> Idle
        EXPECT(h.events[h.events.size() - 3].state, PROTECTION_EXITING);
        EXPECT(h.events[h.events.size() - 2].state, PROTECTION_IDLE);

        // sessions can be started again afterwards
        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        EXPECT(h.sleepGuard->leases, 2);
        h.machine->stop();
        EXPECT(h.released(), true);
    }

    {
        // a second start is rejected and leaves the running session alone
        SHarness h;
        EXPECT(h.machine->start({}).status, SStartError::START_OK);

        const auto EVENTS = h.events.size();
        EXPECT(h.machine->start({}).status, SStartError::START_ALREADY_ACTIVE);
        EXPECT(h.events.size(), EVENTS);
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);
        EXPECT(h.interceptor->installs, 1);
        EXPECT(h.sleepGuard->leases, 1);
        EXPECT(h.overlay->shows, 1);
    }

    {
        // a start issued while the first one is still starting is turned away
        SHarness h;
        h.interceptor->onInstall = [&h, &ret] {
            EXPECT(h.machine->currentState(), PROTECTION_STARTING);
            EXPECT(h.machine->start({}).status, SStartError::START_ALREADY_ACTIVE);
        };

        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);
        EXPECT(h.interceptor->installs, 1);
        EXPECT(h.sleepGuard->leases, 1);
        EXPECT(h.overlay->shows, 1);
        EXPECT(h.machine->sessionExists(), true);
        EXPECT(h.count(PROTECTION_EVENT_START_FAILED), 0);

        h.machine->stop();
        EXPECT(h.released(), true);
    }

    {
        // timed session with a configured chord still ends on the chord
        SHarness          h;
        SProtectionConfig config;
        const auto [combo, comboError] = CKeyCombo::parse("Cmd+Option+U");
        EXPECT(comboError.status, SKeyComboError::KEY_COMBO_OK);
        config.exitKey = combo;
        config.timer   = 90s;

        EXPECT(h.machine->start(config).status, SStartError::START_OK);
        EXPECT(h.sleepGuard->held(), true);

        h.now += 10s;
        h.machine->tick();
        EXPECT(h.interceptor->feed(key(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u)), INPUT_UNLOCK);
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_UNLOCK_KEY);
        EXPECT(h.sleepGuard->held(), false);
        EXPECT(h.released(), true);

        // the timer is gone with the session
        h.now += 2min;
        h.machine->tick();
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 1);
    }

    {
        // denied capture point, nothing is shown and the lease goes back
        SHarness h;
        h.interceptor->deny = true;

        const auto RESULT = h.machine->start({});
        EXPECT(RESULT.status, SStartError::START_PERMISSION_DENIED);
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.overlay->shows, 0);
        EXPECT(h.sleepGuard->leases, 1);
        EXPECT(h.released(), true);
        EXPECT(h.count(PROTECTION_EVENT_START_FAILED), 1);
        EXPECT(h.lastOf(PROTECTION_EVENT_START_FAILED)->error.status, SStartError::START_PERMISSION_DENIED);
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 0);

        // a later attempt works once permission is there
        h.interceptor->deny = false;
        EXPECT(h.machine->start({}).status, SStartError::START_OK);
    }

    {
        SHarness h;
        h.sleepGuard->unavailable = true;

        EXPECT(h.machine->start({}).status, SStartError::START_SLEEP_GUARD_UNAVAILABLE);
        EXPECT(h.interceptor->installs, 0);
        EXPECT(h.overlay->shows, 0);
        EXPECT(h.released(), true);
    }

    {
        // invalid config never leaves Idle
        SHarness          h;
        SProtectionConfig config;
        config.opacity = 2.F;

        EXPECT(h.machine->start(config).status, SStartError::START_INVALID_CONFIG);
        EXPECT(h.count(PROTECTION_EVENT_STATE_CHANGED), 0);
        EXPECT(h.count(PROTECTION_EVENT_START_FAILED), 1);
        EXPECT(h.sleepGuard->leases, 0);
        EXPECT(h.interceptor->installs, 0);

        config.opacity = 0.5F;
        config.timer   = 30s;
        EXPECT(h.machine->start(config).status, SStartError::START_INVALID_CONFIG);
    }

    {
        // hold the close control for the full duration
        SHarness h;
        EXPECT(h.machine->start({}).status, SStartError::START_OK);

        EXPECT(h.interceptor->feed(button(true, true)), INPUT_CLOSE_CONTROL);

        h.now += 1500ms;
        h.machine->tick();
        const auto PROGRESS = h.lastOf(PROTECTION_EVENT_HOLD_PROGRESS);
        EXPECT(PROGRESS.has_value(), true);
        EXPECT(PROGRESS->holdProgress > 0.49F && PROGRESS->holdProgress < 0.51F, true);
        EXPECT(h.overlay->last.holdProgress > 0.49F, true);
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);

        // keys do not interrupt a hold
        EXPECT(h.interceptor->feed(key(MODIFIER_NONE, XKB_KEY_space)), INPUT_SUPPRESS);

        h.now += 1500ms;
        h.machine->tick();
        EXPECT(h.lastOf(PROTECTION_EVENT_HOLD_PROGRESS)->holdProgress, 1.F);
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_HOLD_COMPLETE);
        EXPECT(h.released(), true);
    }

    {
        // early release, then leaving the button, both reset the hold
        SHarness h;
        EXPECT(h.machine->start({}).status, SStartError::START_OK);

        h.interceptor->feed(button(true, true));
        h.now += 2s;
        EXPECT(h.interceptor->feed(button(false, true)), INPUT_CLOSE_CONTROL);
        EXPECT(h.lastOf(PROTECTION_EVENT_HOLD_PROGRESS)->holdProgress, 0.F);

        h.now += 2s;
        h.machine->tick();
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);

        h.interceptor->feed(button(true, true));
        h.now += 2s;
        EXPECT(h.interceptor->feed(motion(false, true)), INPUT_SUPPRESS);
        EXPECT(h.lastOf(PROTECTION_EVENT_HOLD_PROGRESS)->holdProgress, 0.F);

        h.now += 2s;
        h.machine->tick();
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);

        // coming back with the button still down starts over
        EXPECT(h.interceptor->feed(motion(true, true)), INPUT_CLOSE_CONTROL);
        h.now += 2900ms;
        h.machine->tick();
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);
        h.now += 100ms;
        h.machine->tick();
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_HOLD_COMPLETE);
    }

    {
        // auto exit, one warning, countdown shown
        SHarness          h;
        SProtectionConfig config;
        config.timer = 2min;

        EXPECT(h.machine->start(config).status, SStartError::START_OK);
        EXPECT(h.overlay->last.showCountdown, true);
        EXPECT(h.overlay->last.remaining == std::optional<std::chrono::milliseconds>{2min}, true);

        h.now += 30s;
        h.machine->tick();
        EXPECT(h.lastOf(PROTECTION_EVENT_COUNTDOWN)->remaining == 90s, true);
        EXPECT(h.count(PROTECTION_EVENT_COUNTDOWN_WARNING), 0);

        // ticks within the same second do not repeat the update
        const auto COUNTDOWNS = h.count(PROTECTION_EVENT_COUNTDOWN);
        h.now += 100ms;
        h.machine->tick();
        EXPECT(h.count(PROTECTION_EVENT_COUNTDOWN), COUNTDOWNS);

        h.now += 30s;
        h.machine->tick();
        EXPECT(h.count(PROTECTION_EVENT_COUNTDOWN_WARNING), 1);
        EXPECT(h.overlay->last.countdownWarning, true);

        h.now += 10s;
        h.machine->tick();
        EXPECT(h.count(PROTECTION_EVENT_COUNTDOWN_WARNING), 1);

        h.now += 49s;
        h.machine->tick();
        EXPECT(h.machine->currentState(), PROTECTION_ACTIVE);

        h.now += 1s;
        h.machine->tick();
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_TIMER_EXPIRED);
        EXPECT(h.released(), true);

        // nothing happens on ticks once idle
        const auto EVENTS = h.events.size();
        h.now += 1min;
        h.machine->tick();
        EXPECT(h.events.size(), EVENTS);
    }

    {
        // stopping from the warning callback ends the session on that tick
        SHarness          h;
        SProtectionConfig config;
        config.timer = 2min;

        h.machine->subscribe([&h](const SProtectionEvent& e) {
            if (e.type == PROTECTION_EVENT_COUNTDOWN_WARNING)
                h.machine->stop();
        });

        EXPECT(h.machine->start(config).status, SStartError::START_OK);

        h.now += 61s;
        h.machine->tick();
        EXPECT(h.count(PROTECTION_EVENT_COUNTDOWN_WARNING), 1);
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_FORCED_STOP);
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 1);
        EXPECT(h.released(), true);
    }

    {
        SProtectionConfig config;
        config.timer     = 5min;
        config.hideTimer = true;

        SHarness h;
        EXPECT(h.machine->start(config).status, SStartError::START_OK);
        EXPECT(h.overlay->last.showCountdown, false);
        // hidden, but still counting
        h.now += 5min;
        h.machine->tick();
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_TIMER_EXPIRED);
    }

    {
        // forced stop, idempotent
        SHarness h;
        h.machine->stop();
        EXPECT(h.events.size(), 0);

        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        h.machine->stop();
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_FORCED_STOP);
        EXPECT(h.released(), true);

        h.machine->stop();
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 1);

        // input after the end goes nowhere
        EXPECT(h.machine->onInputEvent(key(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u)), INPUT_SUPPRESS);
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 1);
    }

    {
        // stop while starting is carried out once start() is through
        SHarness h;
        h.interceptor->onInstall = [&h] { h.machine->stop(); };

        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_FORCED_STOP);
        EXPECT(h.released(), true);
    }

    {
        SHarness h;
        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        h.interceptor->revoke();
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.lastOf(PROTECTION_EVENT_SESSION_ENDED)->reason, EXIT_CAPTURE_LOST);
        EXPECT(h.released(), true);
    }

    {
        // a failing teardown step does not keep the others from running
        SHarness h;
        h.sleepGuard->throwOnRelease = true;

        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        h.machine->stop();
        EXPECT(h.machine->currentState(), PROTECTION_IDLE);
        EXPECT(h.interceptor->installed(), false);
        EXPECT(h.overlay->visible(), false);
        EXPECT(h.count(PROTECTION_EVENT_SESSION_ENDED), 1);
    }

    {
        // listeners can go away from within a callback
        SHarness h;
        int      calls = 0;
        size_t   id    = 0;
        id             = h.machine->subscribe([&](const SProtectionEvent& e) {
            calls++;
            h.machine->unsubscribe(id);
        });

        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        EXPECT(calls, 1);
        h.machine->stop();
        EXPECT(calls, 1);
    }

    {
        // destroying a running machine still tears down
        SHarness h;
        EXPECT(h.machine->start({}).status, SStartError::START_OK);
        h.machine.reset();
        EXPECT(h.sleepGuard->held(), false);
        EXPECT(h.interceptor->installed(), false);
        EXPECT(h.overlay->visible(), false);
    }

    return ret;
}
