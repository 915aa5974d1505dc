#pragma once

#include "../defines.hpp"
#include "wayland.hpp"
#include "ext-session-lock-v1.hpp"
#include "../renderer/ShmBuffer.hpp"
#include <array>

class COutput;
class CRenderer;

class CSessionLockSurface {
  public:
    CSessionLockSurface(const SP<COutput>& pOutput);
    ~CSessionLockSurface();

    void            configure(const Vector2D& size, uint32_t serial);

    bool            readyForFrame = false;

    void            render();
    void            onCallback();
    void            onScaleUpdate();

    SP<CCWlSurface> getWlSurface();
    // in surface local coordinates, what input events are reported in
    Vector2D        getLogicalSize() const;

  private:
    CShmBuffer*                   nextBuffer();

    WP<COutput>                   m_outputRef;

    SP<CCWlSurface>               surface     = nullptr;
    SP<CCExtSessionLockSurfaceV1> lockSurface = nullptr;
    uint32_t                      serial      = 0;
    Vector2D                      size;
    Vector2D                      logicalSize;
    int                           appliedScale = 1;

    // double buffered, the compositor holds on to one until it releases it
    std::array<UP<CShmBuffer>, 2> buffers;

    bool                          needsFrame = false;

    uint32_t                      m_lastFrameTime = 0;
    uint32_t                      m_frames        = 0;

    // wayland callbacks
    SP<CCWlCallback> frameCallback = nullptr;

    friend class CRenderer;
    friend class COutput;
};
