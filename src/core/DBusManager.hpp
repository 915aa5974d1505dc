#pragma once

#include <memory>
#include <optional>
#include <string>
#include <sdbus-c++/sdbus-c++.h>

class DBusManager {
  public:
    static DBusManager&                 getInstance();

    std::shared_ptr<sdbus::IProxy>      getLoginProxy();

    // org.freedesktop.login1.Manager.Inhibit, the returned fd is the inhibitor lock
    std::optional<sdbus::UnixFd> inhibit(const std::string& what, const std::string& why, std::string& error);

  private:
    DBusManager();
    ~DBusManager() = default;

    void                                initializeConnection();

    std::shared_ptr<sdbus::IConnection> m_pConnection;
    std::shared_ptr<sdbus::IProxy>      m_pLoginProxy;
};
