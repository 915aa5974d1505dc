#pragma once

#include <chrono>
#include <optional>
#include <string>

// What the overlay shows, pushed by the protection state machine
struct SOverlayState {
    float                                    opacity = 0.3F;

    bool                                     showCountdown    = false;
    std::optional<std::chrono::milliseconds> remaining        = std::nullopt;
    bool                                     countdownWarning = false;

    float                                    holdProgress = 0.F;
    std::string                              unlockHint   = "";
};

// Visual side of a protection session. Drawing only, it never decides anything.
class IOverlay {
  public:
    virtual ~IOverlay() = default;

    virtual void show(const SOverlayState& state)   = 0;
    virtual void update(const SOverlayState& state) = 0;
    // No-op when hidden
    virtual void hide()          = 0;
    virtual bool visible() const = 0;
};
