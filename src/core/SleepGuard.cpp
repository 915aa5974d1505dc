#include "SleepGuard.hpp"
#include "DBusManager.hpp"
#include "../helpers/Log.hpp"

CLogindSleepGuard::~CLogindSleepGuard() {
    release();
}

std::optional<std::string> CLogindSleepGuard::acquire() {
    if (held())
        return std::nullopt;

    std::string error;
    auto        fd = DBusManager::getInstance().inhibit("idle:sleep", "Protection overlay is active", error);

    if (!fd || !fd->isValid())
        return error.empty() ? "logind did not hand out an inhibitor fd" : error;

    m_lease = std::move(fd);
    Debug::log(LOG, "[sleep] Sleep prevention enabled");

    return std::nullopt;
}

void CLogindSleepGuard::release() {
    if (!m_lease)
        return;

    m_lease.reset();
    Debug::log(LOG, "[sleep] Sleep prevention disabled");
}

bool CLogindSleepGuard::held() const {
    return m_lease.has_value();
}
