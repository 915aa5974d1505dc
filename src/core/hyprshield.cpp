#include "hyprshield.hpp"
#include "SessionLock.hpp"
#include "SleepGuard.hpp"
#include "KeyCombo.hpp"
#include "../helpers/Log.hpp"
#include "../config/ConfigManager.hpp"
#include "../renderer/Renderer.hpp"
#include "../renderer/Screencopy.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/poll.h>
#include <linux/input-event-codes.h>

constexpr auto TICK_INTERVAL   = std::chrono::milliseconds(100);
constexpr auto LOCK_TIMEOUT    = std::chrono::seconds(5);
constexpr auto GATHER_TIMEOUT  = std::chrono::seconds(2);
constexpr int  IDLE_TIMEOUT_MS = 5000;

static volatile sig_atomic_t g_pendingSignal = 0;

CHyprshield::CHyprshield(const std::string& wlDisplay, const bool screencopy) : m_bScreencopy(screencopy) {
    m_sWaylandState.display = wl_display_connect(wlDisplay.empty() ? nullptr : wlDisplay.c_str());
    RASSERT(m_sWaylandState.display, "Couldn't connect to a wayland compositor");
}

CHyprshield::~CHyprshield() {
    m_pProtection.reset();
    m_vTimers.clear();

    const auto DPY = m_sWaylandState.display;

    // every proxy has to go before the display does
    m_sLockState    = {};
    m_sWaylandState = {};

    m_vOutputs.clear();
    g_pRenderer.reset();
    g_pSeatManager.reset();

    if (DPY)
        wl_display_disconnect(DPY);
}

// no SA_RESTART, poll has to wake up for us
static void registerSignalAction(int sig, void (*handler)(int), int sa_flags = 0) {
    struct sigaction sa;
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = sa_flags;
    sigaction(sig, &sa, nullptr);
}

static void handleStopSignal(int sig) {
    g_pendingSignal = sig;
}

void CHyprshield::handlePendingSignal() {
    const int SIG = g_pendingSignal;
    if (SIG == 0)
        return;

    g_pendingSignal = 0;

    Debug::log(LOG, "Got signal {} ({}), stopping", SIG, strsignal(SIG));

    // nothing running yet, just don't start
    if (!m_pProtection || m_pProtection->currentState() == PROTECTION_IDLE) {
        m_bTerminate = true;
        return;
    }

    m_pProtection->stop();
}

int CHyprshield::run(const SProtectionConfig& config) {
    m_sWaylandState.registry = makeShared<CCWlRegistry>((wl_proxy*)wl_display_get_registry(m_sWaylandState.display));
    m_sWaylandState.registry->setGlobal([this](CCWlRegistry* r, uint32_t name, const char* interface, uint32_t version) {
        const std::string IFACE = interface;
        Debug::log(LOG, "  | got iface: {} v{}", IFACE, version);

        if (IFACE == wl_seat_interface.name) {
            if (g_pSeatManager->registered()) {
                Debug::log(WARN, "hyprshield does not support multi-seat configurations. Only binding to the first seat.");
                return;
            }

            g_pSeatManager->registerSeat(makeShared<CCWlSeat>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &wl_seat_interface, 7)));
        } else if (IFACE == ext_session_lock_manager_v1_interface.name)
            m_sWaylandState.sessionLock =
                makeShared<CCExtSessionLockManagerV1>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &ext_session_lock_manager_v1_interface, 1));
        else if (IFACE == wl_output_interface.name) {
            const auto POUTPUT = makeShared<COutput>();
            POUTPUT->create(POUTPUT, makeShared<CCWlOutput>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &wl_output_interface, 4)), name);
            m_vOutputs.emplace_back(POUTPUT);
        } else if (IFACE == wp_cursor_shape_manager_v1_interface.name)
            g_pSeatManager->registerCursorShape(
                makeShared<CCWpCursorShapeManagerV1>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &wp_cursor_shape_manager_v1_interface, 1)));
        else if (IFACE == wl_compositor_interface.name)
            m_sWaylandState.compositor = makeShared<CCWlCompositor>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &wl_compositor_interface, 4));
        else if (IFACE == zwlr_screencopy_manager_v1_interface.name)
            m_sWaylandState.screencopy =
                makeShared<CCZwlrScreencopyManagerV1>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &zwlr_screencopy_manager_v1_interface, 3));
        else if (IFACE == wl_shm_interface.name)
            m_sWaylandState.shm = makeShared<CCWlShm>((wl_proxy*)wl_registry_bind((wl_registry*)r->resource(), name, &wl_shm_interface, 1));
        else
            return;

        Debug::log(LOG, "   > Bound to {} v{}", IFACE, version);
    });
    m_sWaylandState.registry->setGlobalRemove([this](CCWlRegistry* r, uint32_t name) {
        Debug::log(LOG, "  | removed iface {}", name);
        auto outputIt = std::ranges::find_if(m_vOutputs, [id = name](const auto& other) { return other->m_ID == id; });
        if (outputIt != m_vOutputs.end()) {
            if (g_pRenderer)
                g_pRenderer->removeScreenshot((*outputIt)->m_ID);
            m_vOutputs.erase(outputIt);
        }
    });

    wl_display_roundtrip(m_sWaylandState.display);

    if (!m_sWaylandState.compositor || !m_sWaylandState.shm) {
        Debug::log(CRIT, "The compositor is missing wl_compositor or wl_shm");
        return 1;
    }

    // gather info about monitors
    wl_display_roundtrip(m_sWaylandState.display);

    registerSignalAction(SIGUSR1, handleStopSignal);
    registerSignalAction(SIGINT, handleStopSignal);
    registerSignalAction(SIGTERM, handleStopSignal);
    registerSignalAction(SIGHUP, handleStopSignal);

    g_pRenderer = makeShared<CRenderer>();

    // Capture the outputs before locking, once locked there is nothing left to capture
    if (m_bScreencopy)
        gatherScreenshots();

    if (m_bTerminate) {
        Debug::log(LOG, "Stopped before protection started");
        return 0;
    }

    m_pProtection = makeUnique<CProtectionStateMachine>(SProtectionBackends{
        .interceptor = makeShared<CSessionLockInterceptor>(),
        .sleepGuard  = makeShared<CLogindSleepGuard>(),
        .overlay     = g_pRenderer,
    });

    m_pProtection->subscribe([this](const SProtectionEvent& event) { onProtectionEvent(event); });

    if (const auto RESULT = m_pProtection->start(config); RESULT.status != SStartError::START_OK) {
        Debug::log(CRIT, "Protection failed to start: {}", RESULT.message);
        m_pProtection.reset();
        return 1;
    }

    while (!m_bTerminate) {
        handlePendingSignal();

        if (m_bTerminate)
            break;

        if (!pollOnce(nextTimerTimeoutMs())) {
            Debug::log(CRIT, "Lost the connection to the compositor");
            m_bConnectionLost = true;
            // the lock dies with the connection, the lease must not outlive it
            m_pProtection->stop();
            break;
        }

        runTimers();
    }

    m_pProtection.reset();
    m_vTimers.clear();

    if (m_exitReason.has_value())
        Debug::log(LOG, "Protection ended ({}), exiting", exitReasonString(*m_exitReason));

    return m_bConnectionLost ? 1 : 0;
}

void CHyprshield::onProtectionEvent(const SProtectionEvent& event) {
    switch (event.type) {
        case PROTECTION_EVENT_STATE_CHANGED:
            if (event.state == PROTECTION_ACTIVE)
                scheduleTick();
            else if (event.state == PROTECTION_IDLE && m_pTickTimer) {
                m_pTickTimer->cancel();
                m_pTickTimer.reset();
            }
            break;
        case PROTECTION_EVENT_SESSION_ENDED:
            m_exitReason = event.reason;
            m_bTerminate = true;
            break;
        case PROTECTION_EVENT_START_FAILED: Debug::log(ERR, "Start failed: {}", event.error.message); break;
        default: break;
    }
}

void CHyprshield::scheduleTick() {
    if (m_pTickTimer)
        m_pTickTimer->cancel();

    m_pTickTimer = addTimer(
        TICK_INTERVAL,
        [this](SP<CTimer> self, void* data) {
            m_pTickTimer.reset();

            if (!m_pProtection || m_pProtection->currentState() != PROTECTION_ACTIVE)
                return;

            // rearm first, a tick that ends the session cancels it again
            scheduleTick();
            m_pProtection->tick();
        },
        nullptr);
}

void CHyprshield::gatherScreenshots() {
    if (!m_sWaylandState.screencopy) {
        Debug::log(WARN, "[sc] No wlr-screencopy support, the overlay will be opaque");
        return;
    }

    std::vector<UP<CScreencopyFrame>> frames;
    for (const auto& o : m_vOutputs) {
        if (!o->done)
            continue;

        frames.emplace_back(makeUnique<CScreencopyFrame>());
        frames.back()->capture(o);
    }

    const auto STARTGATHERTP = Clock::now();

    const bool GATHERED = dispatchUntil(
        [&frames, this]() { return m_bTerminate || std::ranges::all_of(frames, [](const auto& f) { return f->done(); }); }, GATHER_TIMEOUT);

    if (!GATHERED)
        Debug::log(WARN, "[sc] Capturing the outputs timed out, some will be opaque");

    for (const auto& f : frames) {
        if (f->m_result)
            g_pRenderer->setScreenshot(f->m_outputID, f->m_result);
    }

    Debug::log(LOG, "[sc] Screenshots gathered after {} milliseconds", std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - STARTGATHERTP).count());
}

bool CHyprshield::pollOnce(int timeoutMs) {
    const auto DPY = m_sWaylandState.display;

    while (wl_display_prepare_read(DPY) != 0) {
        if (wl_display_dispatch_pending(DPY) < 0)
            return false;
    }

    if (wl_display_flush(DPY) < 0 && errno != EAGAIN) {
        wl_display_cancel_read(DPY);
        return false;
    }

    pollfd pfd = {
        .fd     = wl_display_get_fd(DPY),
        .events = POLLIN,
    };

    const int EVENTS = poll(&pfd, 1, timeoutMs);

    if (EVENTS < 0) {
        wl_display_cancel_read(DPY);
        // a signal, handled on the next iteration
        return errno == EINTR;
    }

    if (pfd.revents & (POLLHUP | POLLERR)) {
        wl_display_cancel_read(DPY);
        return false;
    }

    if (EVENTS > 0 && (pfd.revents & POLLIN)) {
        if (wl_display_read_events(DPY) < 0)
            return false;
    } else
        wl_display_cancel_read(DPY);

    if (wl_display_dispatch_pending(DPY) < 0)
        return false;

    wl_display_flush(DPY);

    return true;
}

bool CHyprshield::dispatchUntil(const std::function<bool()>& done, const Clock::duration& timeout) {
    const auto DEADLINE = Clock::now() + timeout;

    while (!done()) {
        const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - Clock::now()).count();
        if (LEFT <= 0)
            return false;

        if (!pollOnce(LEFT))
            return false;

        handlePendingSignal();
    }

    return true;
}

int CHyprshield::nextTimerTimeoutMs() {
    if (m_vTimers.empty())
        return IDLE_TIMEOUT_MS;

    float least = IDLE_TIMEOUT_MS;
    for (auto& t : m_vTimers) {
        if (t->cancelled())
            continue;

        least = std::min(std::clamp(t->leftMs(), 0.f, (float)IDLE_TIMEOUT_MS), least);
    }

    return (int)least;
}

void CHyprshield::runTimers() {
    auto                    timerscpy = m_vTimers;

    std::vector<SP<CTimer>> passed;

    for (auto& t : timerscpy) {
        if (t->passed() && !t->cancelled()) {
            t->call(t);
            passed.push_back(t);
        }

        if (t->cancelled())
            passed.push_back(t);
    }

    std::erase_if(m_vTimers, [&passed](const auto& timer) { return std::ranges::find(passed, timer) != passed.end(); });
}

SP<CTimer> CHyprshield::addTimer(const Clock::duration& timeout, std::function<void(SP<CTimer> self, void* data)> cb_, void* data) {
    const auto T = makeShared<CTimer>(timeout, cb_, data);
    m_vTimers.emplace_back(T);
    return T;
}

std::optional<std::string> CHyprshield::acquireSessionLock() {
    if (!m_sWaylandState.sessionLock) {
        Debug::log(CRIT, "[lock] Couldn't bind to ext-session-lock-v1, does your compositor support it?");
        return "the compositor does not support ext-session-lock-v1";
    }

    Debug::log(LOG, "[lock] Locking session");
    m_sLockState.lock = makeShared<CCExtSessionLockV1>(m_sWaylandState.sessionLock->sendLock());
    if (!m_sLockState.lock) {
        Debug::log(ERR, "[lock] Failed to create a lock object!");
        return "failed to create a lock object";
    }

    m_sLockState.lock->setLocked([this](CCExtSessionLockV1* r) { onLockLocked(); });

    m_sLockState.lock->setFinished([this](CCExtSessionLockV1* r) { onLockFinished(); });

    m_lockAquired = true;

    // the compositor only confirms the lock once every output shows a lock surface
    for (auto& o : m_vOutputs) {
        if (!o->done)
            continue;

        o->createSessionLockSurface();
    }

    const bool LOCKED = dispatchUntil([this]() { return m_bLocked || !m_sLockState.lock; }, LOCK_TIMEOUT);

    if (LOCKED && m_bLocked)
        return std::nullopt;

    const bool  REFUSED = !m_sLockState.lock;
    std::string error   = REFUSED ? "the compositor refused the session lock (is another locker running?)" : "timed out waiting for the session lock";

    Debug::log(ERR, "[lock] {}", error);

    // never locked, so plain destruction is fine
    m_sLockState.lock.reset();
    m_lockAquired = false;

    for (auto& o : m_vOutputs) {
        o->m_sessionLockSurface.reset();
    }

    wl_display_flush(m_sWaylandState.display);

    return error;
}

void CHyprshield::releaseSessionLock() {
    Debug::log(LOG, "[lock] Unlocking session");

    if (m_sLockState.lock) {
        if (m_bLocked)
            m_sLockState.lock->sendUnlockAndDestroy();

        m_sLockState.lock = nullptr;
    }

    m_bLocked     = false;
    m_lockAquired = false;

    for (auto& o : m_vOutputs) {
        o->m_sessionLockSurface.reset();
    }

    m_focusedOutput.reset();
    m_sTouchState = {};
    m_vPressedKeys.clear();

    wl_display_flush(m_sWaylandState.display);

    Debug::log(LOG, "[lock] Unlocked");
}

void CHyprshield::onLockLocked() {
    Debug::log(LOG, "[lock] onLockLocked called");

    m_bLocked = true;
}

void CHyprshield::onLockFinished() {
    Debug::log(LOG, "[lock] onLockFinished called. Seems we got yeeten. Is another lockscreen running?");

    if (!m_sLockState.lock) {
        Debug::log(ERR, "[lock] onLockFinished without a lock object!");
        return;
    }

    const bool WASLOCKED = m_bLocked;

    if (m_bLocked)
        // The `finished` event specifies that whenever the `locked` event has been recieved and the compositor sends `finished`,
        // `unlock_and_destroy` should be called by the client.
        // This does not mean the session gets unlocked! That is ultimately the responsiblity of the compositor.
        m_sLockState.lock->sendUnlockAndDestroy();
    else
        m_sLockState.lock.reset();

    m_sLockState.lock = nullptr;
    m_bLocked         = false;

    // before `locked` this is a refused lock, acquireSessionLock reports it
    if (WASLOCKED && m_pInputSink)
        m_pInputSink->onCaptureLost();
}

void CHyprshield::setInputSink(IInputSink* sink) {
    m_pInputSink = sink;
}

void CHyprshield::deliverInput(const SInputEvent& event) {
    if (!m_pInputSink)
        return;

    const auto DECISION = m_pInputSink->onInputEvent(event);
    Debug::log(TRACE, "[seat] event {} -> {}", (int)event.type, inputDecisionString(DECISION));
}

bool CHyprshield::onCloseControl(const SP<COutput>& output, const Vector2D& pos) {
    if (!output || !output->m_sessionLockSurface)
        return false;

    return CRenderer::closeControlBox(output->m_sessionLockSurface->getLogicalSize()).containsPoint(pos);
}

SP<COutput> CHyprshield::outputForSurface(wl_proxy* surface) {
    for (const auto& o : m_vOutputs) {
        if (o->m_sessionLockSurface && o->m_sessionLockSurface->getWlSurface()->resource() == surface)
            return o;
    }

    return nullptr;
}

void CHyprshield::onKey(uint32_t key, bool down) {
    if (down && std::ranges::find(m_vPressedKeys, key) != m_vPressedKeys.end()) {
        Debug::log(TRACE, "[seat] Invalid key down event (key already pressed?)");
        return;
    } else if (!down && std::ranges::find(m_vPressedKeys, key) == m_vPressedKeys.end()) {
        // pressed before we got keyboard focus
        return;
    }

    if (down)
        m_vPressedKeys.push_back(key);
    else
        std::erase(m_vPressedKeys, key);

    deliverInput({
        .type      = INPUT_EVENT_KEY,
        .pressed   = down,
        .modifiers = g_pSeatManager->activeModifiers(),
        .keysym    = g_pSeatManager->baseKeysym(key),
    });
}

void CHyprshield::onPointerButton(uint32_t button, bool down) {
    const bool PRIMARY = button == BTN_LEFT;

    if (PRIMARY)
        m_bPrimaryHeld = down;

    deliverInput({
        .type           = INPUT_EVENT_POINTER_BUTTON,
        .pressed        = down,
        .onCloseControl = PRIMARY && onCloseControl(m_focusedOutput.lock(), m_vMouseLocation),
        .primaryHeld    = m_bPrimaryHeld,
    });
}

void CHyprshield::onPointerMotion(const Vector2D& pos) {
    m_vMouseLocation = pos;

    const bool ONCONTROL = onCloseControl(m_focusedOutput.lock(), pos);

    if (g_pRenderer)
        g_pRenderer->setCloseControlHovered(ONCONTROL);

    static const auto HIDECURSOR = g_pConfigManager->getValue<Hyprlang::INT>("general:hide_cursor");
    if (g_pSeatManager->m_pCursorShape && !*HIDECURSOR)
        g_pSeatManager->m_pCursorShape->setShape(ONCONTROL ? WP_CURSOR_SHAPE_DEVICE_V1_SHAPE_POINTER : WP_CURSOR_SHAPE_DEVICE_V1_SHAPE_DEFAULT);

    deliverInput({
        .type           = INPUT_EVENT_POINTER_MOTION,
        .onCloseControl = ONCONTROL,
        .primaryHeld    = m_bPrimaryHeld,
    });
}

void CHyprshield::onPointerAxis() {
    deliverInput({
        .type           = INPUT_EVENT_POINTER_AXIS,
        .onCloseControl = onCloseControl(m_focusedOutput.lock(), m_vMouseLocation),
        .primaryHeld    = m_bPrimaryHeld,
    });
}

void CHyprshield::onTouchDown(wl_proxy* surface, int32_t id, const Vector2D& pos) {
    // only the first finger can operate the close control
    if (m_sTouchState.id != -1) {
        deliverInput({.type = INPUT_EVENT_TOUCH_DOWN, .pressed = true});
        return;
    }

    m_sTouchState.id       = id;
    m_sTouchState.output   = outputForSurface(surface);
    m_sTouchState.position = pos;

    deliverInput({
        .type           = INPUT_EVENT_TOUCH_DOWN,
        .pressed        = true,
        .onCloseControl = onCloseControl(m_sTouchState.output.lock(), pos),
        .primaryHeld    = true,
    });
}

void CHyprshield::onTouchUp(int32_t id) {
    if (id != m_sTouchState.id) {
        deliverInput({.type = INPUT_EVENT_TOUCH_UP});
        return;
    }

    const bool ONCONTROL = onCloseControl(m_sTouchState.output.lock(), m_sTouchState.position);
    m_sTouchState        = {};

    deliverInput({
        .type           = INPUT_EVENT_TOUCH_UP,
        .onCloseControl = ONCONTROL,
    });
}

void CHyprshield::onTouchMotion(int32_t id, const Vector2D& pos) {
    if (id != m_sTouchState.id) {
        deliverInput({.type = INPUT_EVENT_TOUCH_MOTION});
        return;
    }

    m_sTouchState.position = pos;

    deliverInput({
        .type           = INPUT_EVENT_TOUCH_MOTION,
        .onCloseControl = onCloseControl(m_sTouchState.output.lock(), pos),
        .primaryHeld    = true,
    });
}

void CHyprshield::renderAllOutputs() {
    for (auto& o : m_vOutputs) {
        if (!o->m_sessionLockSurface)
            continue;

        o->m_sessionLockSurface->render();
    }
}

SP<CCExtSessionLockV1> CHyprshield::getSessionLock() {
    return m_sLockState.lock;
}

SP<CCWlCompositor> CHyprshield::getCompositor() {
    return m_sWaylandState.compositor;
}

SP<CCZwlrScreencopyManagerV1> CHyprshield::getScreencopy() {
    return m_sWaylandState.screencopy;
}

SP<CCWlShm> CHyprshield::getShm() {
    return m_sWaylandState.shm;
}
