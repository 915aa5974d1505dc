#pragma once

#include "../defines.hpp"
#include "CursorShape.hpp"
#include "wayland.hpp"
#include <xkbcommon/xkbcommon.h>

class CSeatManager {
  public:
    CSeatManager() = default;
    ~CSeatManager();

    void               registerSeat(SP<CCWlSeat> seat);
    void               registerCursorShape(SP<CCWpCursorShapeManagerV1> shape);
    bool               registered();

    // eModifier mask of the depressed and latched modifiers
    uint8_t            activeModifiers();
    // level 0 keysym of an evdev keycode in the active layout, ignores shift and friends
    xkb_keysym_t       baseKeysym(uint32_t key);

    SP<CCWlKeyboard>   m_pKeeb;
    SP<CCWlPointer>    m_pPointer;
    SP<CCWlTouch>      m_pTouch;

    UP<CCursorShape>   m_pCursorShape;

    xkb_context*       m_pXKBContext = nullptr;
    xkb_keymap*        m_pXKBKeymap  = nullptr;
    xkb_state*         m_pXKBState   = nullptr;

    xkb_layout_index_t m_uiActiveLayout = 0;

  private:
    SP<CCWlSeat> m_pSeat;
};

inline UP<CSeatManager> g_pSeatManager = makeUnique<CSeatManager>();
