#pragma once

#include "../defines.hpp"
#include "wayland.hpp"
#include "ext-session-lock-v1.hpp"
#include "wlr-screencopy-unstable-v1.hpp"
#include "Output.hpp"
#include "Seat.hpp"
#include "Timer.hpp"
#include "InputInterceptor.hpp"
#include "ProtectionStateMachine.hpp"
#include <functional>
#include <optional>
#include <vector>

#include <xkbcommon/xkbcommon.h>

class CHyprshield {
  public:
    CHyprshield(const std::string& wlDisplay, const bool screencopy);
    ~CHyprshield();

    // Protects the session with config until it ends, returns the process exit code
    int                           run(const SProtectionConfig& config);

    SP<CTimer>                    addTimer(const Clock::duration& timeout, std::function<void(SP<CTimer> self, void* data)> cb_, void* data);

    // Dispatches wayland events until done() or the timeout, false on timeout or a dead connection
    bool                          dispatchUntil(const std::function<bool()>& done, const Clock::duration& timeout);

    std::optional<std::string>    acquireSessionLock();
    void                          releaseSessionLock();

    void                          onLockLocked();
    void                          onLockFinished();

    void                          setInputSink(IInputSink* sink);

    void                          onKey(uint32_t key, bool down);
    void                          onPointerButton(uint32_t button, bool down);
    void                          onPointerMotion(const Vector2D& pos);
    void                          onPointerAxis();
    void                          onTouchDown(wl_proxy* surface, int32_t id, const Vector2D& pos);
    void                          onTouchUp(int32_t id);
    void                          onTouchMotion(int32_t id, const Vector2D& pos);

    void                          renderAllOutputs();

    SP<CCExtSessionLockV1>        getSessionLock();
    SP<CCWlCompositor>            getCompositor();
    SP<CCZwlrScreencopyManagerV1> getScreencopy();
    SP<CCWlShm>                   getShm();

    bool                          m_bTerminate = false;

    // lock surfaces get created for new outputs while this is set
    bool                          m_lockAquired = false;
    bool                          m_bLocked     = false;

    WP<COutput>                   m_focusedOutput;
    Vector2D                      m_vMouseLocation = {};
    bool                          m_bPrimaryHeld   = false;

    std::vector<SP<COutput>>      m_vOutputs;

  private:
    void                     handlePendingSignal();
    void                     onProtectionEvent(const SProtectionEvent& event);
    void                     scheduleTick();
    void                     gatherScreenshots();
    void                     deliverInput(const SInputEvent& event);
    bool                     onCloseControl(const SP<COutput>& output, const Vector2D& pos);
    SP<COutput>              outputForSurface(wl_proxy* surface);
    bool                     pollOnce(int timeoutMs);
    void                     runTimers();
    int                      nextTimerTimeoutMs();

    bool                     m_bScreencopy = true;

    UP<CProtectionStateMachine> m_pProtection;
    IInputSink*                 m_pInputSink = nullptr;
    SP<CTimer>                  m_pTickTimer;

    std::optional<eExitReason>  m_exitReason;
    bool                        m_bConnectionLost = false;

    struct {
        wl_display*                   display     = nullptr;
        SP<CCWlRegistry>              registry    = nullptr;
        SP<CCExtSessionLockManagerV1> sessionLock = nullptr;
        SP<CCWlCompositor>            compositor  = nullptr;
        SP<CCZwlrScreencopyManagerV1> screencopy  = nullptr;
        SP<CCWlShm>                   shm         = nullptr;
    } m_sWaylandState;

    struct {
        SP<CCExtSessionLockV1> lock = nullptr;
    } m_sLockState;

    struct {
        WP<COutput> output;
        int32_t     id       = -1;
        Vector2D    position = {};
    } m_sTouchState;

    std::vector<SP<CTimer>> m_vTimers;
    std::vector<uint32_t>   m_vPressedKeys;
};

inline UP<CHyprshield> g_pHyprshield;
