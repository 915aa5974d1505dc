#pragma once

#include "../defines.hpp"
#include "wayland.hpp"
#include "LockSurface.hpp"

class COutput {
  public:
    COutput()  = default;
    ~COutput() = default;

    void                    create(WP<COutput> pSelf, SP<CCWlOutput> pWlOutput, uint32_t name);

    OUTPUTID                m_ID       = 0;
    bool                    done       = false;
    int                     scale      = 1;
    std::string             stringPort = "";
    std::string             stringDesc = "";

    UP<CSessionLockSurface> m_sessionLockSurface;

    SP<CCWlOutput>          m_wlOutput = nullptr;

    WP<COutput>             m_self;

    void                    createSessionLockSurface();
};
