#pragma once

#include <optional>
#include <string>
#include <sdbus-c++/Types.h>

// The display / idle sleep prevention lease. A protection session holds at most one.
class ISleepGuard {
  public:
    virtual ~ISleepGuard() = default;

    // std::nullopt on success, an error otherwise. Idempotent while held.
    virtual std::optional<std::string> acquire() = 0;
    // No-op when nothing is held
    virtual void release()    = 0;
    virtual bool held() const = 0;
};

// logind "idle:sleep" inhibitor lock. The lease is the fd logind hands out, closing it releases the lock,
// and the kernel closes it for us if the process dies.
class CLogindSleepGuard : public ISleepGuard {
  public:
    CLogindSleepGuard() = default;
    virtual ~CLogindSleepGuard();

    virtual std::optional<std::string> acquire();
    virtual void                       release();
    virtual bool                       held() const;

  private:
    std::optional<sdbus::UnixFd> m_lease;
};
