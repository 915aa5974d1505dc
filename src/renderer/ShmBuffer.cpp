#include "ShmBuffer.hpp"
#include "../core/hyprshield.hpp"
#include "../helpers/Log.hpp"
#include "../helpers/MiscFunctions.hpp"
#include <cstring>
#include <sys/mman.h>
#include <unistd.h>

CShmBuffer::CShmBuffer(const Vector2D& size) : m_vSize(size) {
    const int W      = size.x;
    const int H      = size.y;
    const int STRIDE = cairo_format_stride_for_width(CAIRO_FORMAT_ARGB32, W);

    if (W <= 0 || H <= 0 || STRIDE <= 0) {
        Debug::log(ERR, "[shm] Refusing to create a buffer of size {}", size);
        return;
    }

    m_iBytes = (size_t)STRIDE * H;

    std::string poolFile;
    const auto  FD = createPoolFile(m_iBytes, poolFile);
    if (FD < 0) {
        Debug::log(ERR, "[shm] failed to create a pool file");
        return;
    }

    m_pData = mmap(nullptr, m_iBytes, PROT_READ | PROT_WRITE, MAP_SHARED, FD, 0);
    if (m_pData == MAP_FAILED) {
        Debug::log(ERR, "[shm] mmap failed: {}", strerror(errno));
        m_pData = nullptr;
        close(FD);
        return;
    }

    auto pShmPool = makeShared<CCWlShmPool>(g_pHyprshield->getShm()->sendCreatePool(FD, m_iBytes));
    m_wlBuffer    = makeShared<CCWlBuffer>(pShmPool->sendCreateBuffer(0, W, H, STRIDE, WL_SHM_FORMAT_ARGB8888));

    pShmPool.reset();
    close(FD);

    m_wlBuffer->setRelease([this](CCWlBuffer* r) { m_bBusy = false; });

    m_pCairoSurface = cairo_image_surface_create_for_data((unsigned char*)m_pData, CAIRO_FORMAT_ARGB32, W, H, STRIDE);
}

CShmBuffer::~CShmBuffer() {
    if (m_pCairoSurface)
        cairo_surface_destroy(m_pCairoSurface);

    m_wlBuffer.reset();

    if (m_pData)
        munmap(m_pData, m_iBytes);
}

bool CShmBuffer::good() const {
    return m_wlBuffer && m_pCairoSurface && cairo_surface_status(m_pCairoSurface) == CAIRO_STATUS_SUCCESS;
}
