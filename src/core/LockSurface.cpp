#include "LockSurface.hpp"
#include "hyprshield.hpp"
#include "../helpers/Log.hpp"
#include "../renderer/Renderer.hpp"
#include <algorithm>

CSessionLockSurface::~CSessionLockSurface() {
    frameCallback.reset();
    lockSurface.reset();
    surface.reset();
}

CSessionLockSurface::CSessionLockSurface(const SP<COutput>& pOutput) : m_outputRef(pOutput) {
    surface = makeShared<CCWlSurface>(g_pHyprshield->getCompositor()->sendCreateSurface());
    RASSERT(surface, "Couldn't create wl_surface");

    lockSurface = makeShared<CCExtSessionLockSurfaceV1>(g_pHyprshield->getSessionLock()->sendGetLockSurface(surface->resource(), pOutput->m_wlOutput->resource()));
    RASSERT(lockSurface, "Couldn't create ext_session_lock_surface_v1");

    lockSurface->setConfigure([this](CCExtSessionLockSurfaceV1* r, uint32_t serial, uint32_t width, uint32_t height) { configure({(double)width, (double)height}, serial); });
}

void CSessionLockSurface::configure(const Vector2D& size_, uint32_t serial_) {
    Debug::log(LOG, "[lock] configure with serial {}", serial_);

    const bool SAMESERIAL = serial == serial_;

    const auto POUTPUT = m_outputRef.lock();
    const int  SCALE   = POUTPUT ? std::max(POUTPUT->scale, 1) : 1;

    serial       = serial_;
    logicalSize  = size_;
    appliedScale = SCALE;

    size = size_ * SCALE;
    surface->sendSetBufferScale(SCALE);

    if (!SAMESERIAL)
        lockSurface->sendAckConfigure(serial);

    Debug::log(LOG, "[lock] Configuring surface for logical {} and pixel {}", logicalSize, size);

    for (auto& b : buffers) {
        if (b && b->m_vSize != size)
            b.reset();
    }

    readyForFrame = true;

    render();
}

void CSessionLockSurface::onScaleUpdate() {
    if (!readyForFrame)
        return;

    configure(logicalSize, serial);
}

CShmBuffer* CSessionLockSurface::nextBuffer() {
    for (auto& b : buffers) {
        if (!b) {
            b = makeUnique<CShmBuffer>(size);
            if (!b->good()) {
                b.reset();
                return nullptr;
            }
        }

        if (!b->m_bBusy)
            return b.get();
    }

    return nullptr;
}

void CSessionLockSurface::render() {
    if (frameCallback || !readyForFrame) {
        needsFrame = true;
        return;
    }

    const auto PBUFFER = nextBuffer();
    if (!PBUFFER) {
        // both are still with the compositor, try again on the next frame
        needsFrame = true;
        return;
    }

    const auto POUTPUT = m_outputRef.lock();
    g_pRenderer->renderSurface(*this, PBUFFER->m_pCairoSurface, POUTPUT ? POUTPUT->m_ID : OUTPUT_INVALID);

    frameCallback = makeShared<CCWlCallback>(surface->sendFrame());
    frameCallback->setDone([this](CCWlCallback* r, uint32_t frameTime) {
        if (Debug::verbose && m_lastFrameTime) {
            const auto POUTPUT = m_outputRef.lock();
            Debug::log(TRACE, "[lock] [{}] frame {}, {} ms since the last one", POUTPUT ? POUTPUT->stringPort : "?", m_frames, frameTime - m_lastFrameTime);
        }

        m_lastFrameTime = frameTime;

        m_frames++;

        onCallback();
    });

    surface->sendAttach(PBUFFER->m_wlBuffer->resource(), 0, 0);
    surface->sendDamageBuffer(0, 0, 0xFFFF, 0xFFFF);
    surface->sendCommit();

    PBUFFER->m_bBusy = true;
    needsFrame       = false;
}

void CSessionLockSurface::onCallback() {
    frameCallback.reset();

    if (needsFrame && !g_pHyprshield->m_bTerminate)
        render();
}

SP<CCWlSurface> CSessionLockSurface::getWlSurface() {
    return surface;
}

Vector2D CSessionLockSurface::getLogicalSize() const {
    return logicalSize;
}
