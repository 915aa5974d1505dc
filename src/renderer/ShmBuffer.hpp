#pragma once

#include "../defines.hpp"
#include "wayland.hpp"
#include <cairo/cairo.h>

// One ARGB8888 wl_shm buffer with a cairo surface on top of its memory
class CShmBuffer {
  public:
    CShmBuffer(const Vector2D& size);
    ~CShmBuffer();

    bool             good() const;

    Vector2D         m_vSize;
    // the compositor still reads from it
    bool             m_bBusy = false;

    SP<CCWlBuffer>   m_wlBuffer = nullptr;
    cairo_surface_t* m_pCairoSurface = nullptr;

  private:
    void*  m_pData  = nullptr;
    size_t m_iBytes = 0;
};
