#pragma once

#include "InputInterceptor.hpp"

// ext-session-lock-v1 as the capture point. While the lock is held the compositor sends every
// keyboard, pointer and touch event to our lock surfaces and to nobody else.
class CSessionLockInterceptor : public IInputInterceptor {
  public:
    CSessionLockInterceptor() = default;
    virtual ~CSessionLockInterceptor();

    virtual SInterceptorError install(IInputSink* sink);
    virtual void              uninstall();
    virtual bool              installed() const;

  private:
    bool m_bInstalled = false;
};
