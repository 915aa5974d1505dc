#pragma once

#include "../defines.hpp"
#include "../core/Output.hpp"
#include "wlr-screencopy-unstable-v1.hpp"
#include <hyprgraphics/cairo/CairoSurface.hpp>
#include <cstdint>

// Captures one output into a cairo surface through a wl_shm buffer
class CScreencopyFrame {
  public:
    CScreencopyFrame() = default;
    ~CScreencopyFrame();

    void                            capture(SP<COutput> pOutput);

    // finished one way or another
    bool                            done() const;

    OUTPUTID                        m_outputID = OUTPUT_INVALID;
    SP<Hyprgraphics::CCairoSurface> m_result;

  private:
    bool                        onBuffer(uint32_t format, uint32_t width, uint32_t height, uint32_t stride);
    bool                        convertBuffer();
    void                        fail();

    SP<CCZwlrScreencopyFrameV1> m_sc       = nullptr;
    SP<CCWlBuffer>              m_wlBuffer = nullptr;

    bool                        m_done   = false;
    bool                        m_yInvert = false;

    uint32_t                    m_w = 0, m_h = 0;
    uint32_t                    m_stride = 0;
    uint32_t                    m_shmFmt = 0;
    void*                       m_shmData = nullptr;
};
