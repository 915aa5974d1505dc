#include "Screencopy.hpp"
#include "../helpers/Log.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../core/hyprshield.hpp"
#include <cairo/cairo.h>
#include <cstring>
#include <unistd.h>
#include <sys/mman.h>

using namespace Hyprgraphics;

CScreencopyFrame::~CScreencopyFrame() {
    m_sc.reset();
    m_wlBuffer.reset();

    if (m_shmData)
        munmap(m_shmData, m_stride * m_h);
}

void CScreencopyFrame::capture(SP<COutput> pOutput) {
    RASSERT(pOutput, "Screencopy, but no valid output");

    m_outputID = pOutput->m_ID;

    m_sc = makeShared<CCZwlrScreencopyFrameV1>(g_pHyprshield->getScreencopy()->sendCaptureOutput(false, pOutput->m_wlOutput->resource()));

    m_sc->setBuffer([this](CCZwlrScreencopyFrameV1* r, uint32_t format, uint32_t width, uint32_t height, uint32_t stride) {
        Debug::log(TRACE, "[sc] wlrOnBuffer for {}", (void*)this);

        // the first usable shm format wins
        if (m_wlBuffer)
            return;

        if (!onBuffer(format, width, height, stride))
            Debug::log(WARN, "[sc] Can't use shm format {} for output {}", format, m_outputID);
    });

    m_sc->setLinuxDmabuf([](CCZwlrScreencopyFrameV1* r, uint32_t, uint32_t, uint32_t) {
        ; // shm only
    });

    m_sc->setFlags([this](CCZwlrScreencopyFrameV1* r, uint32_t flags) { m_yInvert = flags & ZWLR_SCREENCOPY_FRAME_V1_FLAGS_Y_INVERT; });

    m_sc->setBufferDone([this](CCZwlrScreencopyFrameV1* r) {
        Debug::log(TRACE, "[sc] wlrOnBufferDone for {}", (void*)this);

        if (!m_wlBuffer) {
            Debug::log(ERR, "[sc] No usable buffer for the screencopy frame of output {}", m_outputID);
            fail();
            return;
        }

        m_sc->sendCopy(m_wlBuffer->resource());

        Debug::log(TRACE, "[sc] wlr frame copied");
    });

    m_sc->setFailed([this](CCZwlrScreencopyFrameV1* r) {
        Debug::log(ERR, "[sc] wlrOnFailed for {}", (void*)r);

        fail();
    });

    m_sc->setReady([this](CCZwlrScreencopyFrameV1* r, uint32_t, uint32_t, uint32_t) {
        Debug::log(TRACE, "[sc] wlrOnReady for {}", (void*)this);

        if (!convertBuffer()) {
            Debug::log(ERR, "[sc] Failed to turn the screencopy buffer into a cairo surface");
            fail();
            return;
        }

        m_sc.reset();
        m_done = true;
    });
}

bool CScreencopyFrame::done() const {
    return m_done;
}

void CScreencopyFrame::fail() {
    m_sc.reset();
    m_result.reset();
    m_done = true;
}

bool CScreencopyFrame::onBuffer(uint32_t format, uint32_t width, uint32_t height, uint32_t stride) {
    switch (format) {
        case WL_SHM_FORMAT_ARGB8888:
        case WL_SHM_FORMAT_XRGB8888:
        case WL_SHM_FORMAT_ABGR8888:
        case WL_SHM_FORMAT_XBGR8888: break;
        default: return false;
    }

    if (width == 0 || height == 0 || stride < width * 4)
        return false;

    const auto SIZE = stride * height;
    m_shmFmt        = format;
    m_w             = width;
    m_h             = height;
    m_stride        = stride;

    // Create a shm pool with format and size
    std::string shmPoolFile;
    const auto  FD = createPoolFile(SIZE, shmPoolFile);

    if (FD < 0) {
        Debug::log(ERR, "[sc] failed to create a pool file");
        return false;
    }

    m_shmData = mmap(nullptr, SIZE, PROT_READ | PROT_WRITE, MAP_SHARED, FD, 0);
    if (m_shmData == MAP_FAILED) {
        Debug::log(ERR, "[sc] mmap failed: {}", strerror(errno));
        m_shmData = nullptr;
        close(FD);
        return false;
    }

    auto pShmPool = makeShared<CCWlShmPool>(g_pHyprshield->getShm()->sendCreatePool(FD, SIZE));
    m_wlBuffer    = makeShared<CCWlBuffer>(pShmPool->sendCreateBuffer(0, width, height, stride, m_shmFmt));

    pShmPool.reset();

    close(FD);

    return true;
}

bool CScreencopyFrame::convertBuffer() {
    if (!m_shmData)
        return false;

    const bool HASALPHA = m_shmFmt == WL_SHM_FORMAT_ARGB8888 || m_shmFmt == WL_SHM_FORMAT_ABGR8888;
    const bool SWAPRB   = m_shmFmt == WL_SHM_FORMAT_ABGR8888 || m_shmFmt == WL_SHM_FORMAT_XBGR8888;

    const auto CAIROSURFACE = makeShared<CCairoSurface>(cairo_image_surface_create(HASALPHA ? CAIRO_FORMAT_ARGB32 : CAIRO_FORMAT_RGB24, m_w, m_h));
    if (CAIROSURFACE->status() != CAIRO_STATUS_SUCCESS)
        return false;

    const auto PCAIRO = CAIROSURFACE->cairo();
    cairo_surface_flush(PCAIRO);

    uint8_t*   dst       = cairo_image_surface_get_data(PCAIRO);
    const auto DSTSTRIDE = cairo_image_surface_get_stride(PCAIRO);

    for (uint32_t y = 0; y < m_h; ++y) {
        const auto  SRCROW = m_yInvert ? m_h - 1 - y : y;
        const auto* src    = (const uint8_t*)m_shmData + (size_t)SRCROW * m_stride;
        auto*       row    = dst + (size_t)y * DSTSTRIDE;

        if (!SWAPRB) {
            // wl_shm ARGB8888 / XRGB8888 are the cairo memory layout already
            memcpy(row, src, (size_t)m_w * 4);
            continue;
        }

        for (uint32_t x = 0; x < m_w; ++x) {
            // little-endian RGBA to BGRA
            row[x * 4 + 0] = src[x * 4 + 2];
            row[x * 4 + 1] = src[x * 4 + 1];
            row[x * 4 + 2] = src[x * 4 + 0];
            row[x * 4 + 3] = src[x * 4 + 3];
        }
    }

    cairo_surface_mark_dirty(PCAIRO);

    m_result = CAIROSURFACE;

    Debug::log(LOG, "[sc] Got screenshot of output {} with size {}x{}", m_outputID, m_w, m_h);

    return true;
}
