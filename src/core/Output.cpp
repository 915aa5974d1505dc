#include "Output.hpp"
#include "../helpers/Log.hpp"
#include "hyprshield.hpp"

void COutput::create(WP<COutput> pSelf, SP<CCWlOutput> pWlOutput, uint32_t _name) {
    m_ID       = _name;
    m_wlOutput = pWlOutput;
    m_self     = pSelf;

    m_wlOutput->setDescription([this](CCWlOutput* r, const char* description) {
        stringDesc = description ? std::string{description} : "";
        Debug::log(LOG, "output {} description {}", m_ID, stringDesc);
    });

    m_wlOutput->setName([this](CCWlOutput* r, const char* name) {
        stringPort = name ? std::string{name} : "";
        Debug::log(LOG, "output {} name {}", m_ID, stringPort);
    });

    m_wlOutput->setScale([this](CCWlOutput* r, int32_t sc) {
        const bool CHANGED = done && scale != sc;
        scale              = sc;

        if (CHANGED && m_sessionLockSurface)
            m_sessionLockSurface->onScaleUpdate();
    });

    m_wlOutput->setDone([this](CCWlOutput* r) {
        done = true;
        Debug::log(LOG, "output {} done", m_ID);
        if (g_pHyprshield->m_lockAquired && !m_sessionLockSurface) {
            Debug::log(LOG, "output {} creating a new lock surface", m_ID);
            createSessionLockSurface();
        }
    });
}

void COutput::createSessionLockSurface() {
    m_sessionLockSurface = makeUnique<CSessionLockSurface>(m_self.lock());
}
