#include "SessionLock.hpp"
#include "hyprshield.hpp"
#include "../helpers/Log.hpp"

CSessionLockInterceptor::~CSessionLockInterceptor() {
    uninstall();
}

SInterceptorError CSessionLockInterceptor::install(IInputSink* sink) {
    if (m_bInstalled)
        return {};

    // events may already arrive while we wait for `locked`
    g_pHyprshield->setInputSink(sink);

    if (const auto ERROR = g_pHyprshield->acquireSessionLock(); ERROR.has_value()) {
        g_pHyprshield->setInputSink(nullptr);
        return {.status = SInterceptorError::INTERCEPTOR_PERMISSION_DENIED, .message = *ERROR};
    }

    m_bInstalled = true;
    return {};
}

void CSessionLockInterceptor::uninstall() {
    if (!m_bInstalled)
        return;

    g_pHyprshield->setInputSink(nullptr);
    g_pHyprshield->releaseSessionLock();

    m_bInstalled = false;
}

bool CSessionLockInterceptor::installed() const {
    return m_bInstalled;
}
