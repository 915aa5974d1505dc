#include "DBusManager.hpp"
#include "../helpers/Log.hpp"

DBusManager& DBusManager::getInstance() {
    static DBusManager instance;
    return instance;
}

DBusManager::DBusManager() {
    initializeConnection();
}

void DBusManager::initializeConnection() {
    try {
        m_pConnection = sdbus::createSystemBusConnection();

        const sdbus::ServiceName destination{"org.freedesktop.login1"};
        const sdbus::ObjectPath  loginPath{"/org/freedesktop/login1"};

        m_pLoginProxy = sdbus::createProxy(*m_pConnection, destination, loginPath);

        Debug::log(LOG, "[DBusManager] Initialized D-Bus connection. Service: {}. Login path: {}", std::string(destination), std::string(loginPath));
    } catch (const sdbus::Error& e) {
        Debug::log(ERR, "[DBusManager] D-Bus connection initialization failed: {}", e.what());
        m_pLoginProxy.reset();
        m_pConnection.reset();
    }
}

std::shared_ptr<sdbus::IProxy> DBusManager::getLoginProxy() {
    if (!m_pLoginProxy)
        initializeConnection();

    return m_pLoginProxy;
}

std::optional<sdbus::UnixFd> DBusManager::inhibit(const std::string& what, const std::string& why, std::string& error) {
    const auto PROXY = getLoginProxy();
    if (!PROXY) {
        error = "no connection to the system bus";
        return std::nullopt;
    }

    try {
        const sdbus::InterfaceName interface{"org.freedesktop.login1.Manager"};
        sdbus::UnixFd              fd;
        PROXY->callMethod("Inhibit").onInterface(interface).withArguments(what, std::string{"hyprshield"}, why, std::string{"block"}).storeResultsTo(fd);

        Debug::log(LOG, "[DBusManager] Took inhibitor lock '{}' on {} (fd {})", what, std::string(interface), fd.get());
        return fd;
    } catch (const sdbus::Error& e) {
        error = e.what();
        Debug::log(WARN, "[DBusManager] Inhibit('{}') failed: {}", what, e.what());
    }

    return std::nullopt;
}
