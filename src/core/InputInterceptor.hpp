#pragma once

#include <cstdint>
#include <string>
#include <xkbcommon/xkbcommon.h>

class CKeyCombo;

enum eInputEventType : uint8_t {
    INPUT_EVENT_KEY = 0,
    INPUT_EVENT_POINTER_MOTION,
    INPUT_EVENT_POINTER_BUTTON,
    INPUT_EVENT_POINTER_AXIS,
    INPUT_EVENT_TOUCH_DOWN,
    INPUT_EVENT_TOUCH_UP,
    INPUT_EVENT_TOUCH_MOTION,
};

// One raw event as seen by the capture point, already decoded
struct SInputEvent {
    eInputEventType type = INPUT_EVENT_KEY;

    // key / button / touch went down
    bool         pressed = false;

    // keyboard only, eModifier mask and the level 0 keysym
    uint8_t      modifiers = 0;
    xkb_keysym_t keysym    = XKB_KEY_NoSymbol;

    // pointer and touch only
    bool onCloseControl = false;
    bool primaryHeld    = false;
};

enum eInputDecision : uint8_t {
    INPUT_SUPPRESS = 0,
    INPUT_UNLOCK,
    INPUT_CLOSE_CONTROL,
};

// Per event decision while protecting. There are exactly two exceptions to plain suppression,
// the unlock chord and the close control, and neither forwards the event to other clients.
eInputDecision classifyInput(const SInputEvent& event, const CKeyCombo& combo);
const char*    inputDecisionString(eInputDecision decision);

// Receives everything the capture point observes while installed
class IInputSink {
  public:
    virtual ~IInputSink() = default;

    virtual eInputDecision onInputEvent(const SInputEvent& event) = 0;
    // the capture point was taken away from us (e.g. by the compositor)
    virtual void onCaptureLost() = 0;
};

struct SInterceptorError {
    enum eStatus : uint8_t {
        INTERCEPTOR_OK,
        INTERCEPTOR_PERMISSION_DENIED,
    } status = INTERCEPTOR_OK;

    std::string message = "";
};

// The single system wide capture point. Owned by the protection state machine only.
class IInputInterceptor {
  public:
    virtual ~IInputInterceptor() = default;

    // Blocks until every event is routed to sink, or fails with nothing left installed
    virtual SInterceptorError install(IInputSink* sink) = 0;
    // Synchronous, the capture point is fully gone once this returns. No-op if not installed.
    virtual void uninstall()       = 0;
    virtual bool installed() const = 0;
};
