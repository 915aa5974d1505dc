#include "Seat.hpp"
#include "hyprshield.hpp"
#include "KeyCombo.hpp"
#include "../helpers/Log.hpp"
#include "../config/ConfigManager.hpp"
#include <cstring>
#include <sys/mman.h>
#include <unistd.h>

CSeatManager::~CSeatManager() {
    if (m_pCursorShape && m_pCursorShape->shapeChanged)
        m_pCursorShape->setShape(WP_CURSOR_SHAPE_DEVICE_V1_SHAPE_DEFAULT);

    if (m_pXKBState)
        xkb_state_unref(m_pXKBState);
    if (m_pXKBKeymap)
        xkb_keymap_unref(m_pXKBKeymap);
    if (m_pXKBContext)
        xkb_context_unref(m_pXKBContext);
}

void CSeatManager::registerSeat(SP<CCWlSeat> seat) {
    m_pSeat = seat;

    m_pXKBContext = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!m_pXKBContext)
        Debug::log(ERR, "[seat] Failed to create xkb context");

    m_pSeat->setCapabilities([this](CCWlSeat* r, wl_seat_capability caps) {
        if (caps & WL_SEAT_CAPABILITY_POINTER && !m_pPointer) {
            m_pPointer = makeShared<CCWlPointer>(r->sendGetPointer());

            static const auto HIDECURSOR = g_pConfigManager->getValue<Hyprlang::INT>("general:hide_cursor");

            m_pPointer->setMotion([](CCWlPointer* r, uint32_t time, wl_fixed_t surface_x, wl_fixed_t surface_y) {
                g_pHyprshield->onPointerMotion({wl_fixed_to_double(surface_x), wl_fixed_to_double(surface_y)});
            });

            m_pPointer->setEnter([this](CCWlPointer* r, uint32_t serial, wl_proxy* surf, wl_fixed_t surface_x, wl_fixed_t surface_y) {
                if (m_pCursorShape) {
                    m_pCursorShape->lastCursorSerial = serial;

                    if (*HIDECURSOR)
                        m_pCursorShape->hideCursor();
                    else
                        m_pCursorShape->setShape(WP_CURSOR_SHAPE_DEVICE_V1_SHAPE_DEFAULT);
                }

                g_pHyprshield->m_focusedOutput.reset();
                for (const auto& POUTPUT : g_pHyprshield->m_vOutputs) {
                    if (!POUTPUT->m_sessionLockSurface)
                        continue;

                    if (POUTPUT->m_sessionLockSurface->getWlSurface()->resource() == surf)
                        g_pHyprshield->m_focusedOutput = POUTPUT;
                }

                g_pHyprshield->onPointerMotion({wl_fixed_to_double(surface_x), wl_fixed_to_double(surface_y)});
            });

            m_pPointer->setLeave([](CCWlPointer* r, uint32_t serial, wl_proxy* surf) {
                g_pHyprshield->m_focusedOutput.reset();
                g_pHyprshield->m_bPrimaryHeld = false;
            });

            m_pPointer->setButton([](CCWlPointer* r, uint32_t serial, uint32_t time, uint32_t button, wl_pointer_button_state state) {
                g_pHyprshield->onPointerButton(button, state == WL_POINTER_BUTTON_STATE_PRESSED);
            });

            m_pPointer->setAxis([](CCWlPointer* r, uint32_t time, wl_pointer_axis axis, wl_fixed_t value) { g_pHyprshield->onPointerAxis(); });
        }

        if (caps & WL_SEAT_CAPABILITY_TOUCH && !m_pTouch) {
            m_pTouch = makeShared<CCWlTouch>(r->sendGetTouch());
            m_pTouch->setDown([](CCWlTouch* r, uint32_t serial, uint32_t time, wl_proxy* surface, int32_t id, wl_fixed_t x, wl_fixed_t y) {
                g_pHyprshield->onTouchDown(surface, id, {wl_fixed_to_double(x), wl_fixed_to_double(y)});
            });
            m_pTouch->setUp([](CCWlTouch* r, uint32_t serial, uint32_t time, int32_t id) { g_pHyprshield->onTouchUp(id); });
            m_pTouch->setMotion([](CCWlTouch* r, uint32_t time, int32_t id, wl_fixed_t x, wl_fixed_t y) {
                g_pHyprshield->onTouchMotion(id, {wl_fixed_to_double(x), wl_fixed_to_double(y)});
            });
        }

        if (caps & WL_SEAT_CAPABILITY_KEYBOARD && !m_pKeeb) {
            m_pKeeb = makeShared<CCWlKeyboard>(r->sendGetKeyboard());

            m_pKeeb->setKeymap([this](CCWlKeyboard*, wl_keyboard_keymap_format format, int32_t fd, uint32_t size) {
                if (!m_pXKBContext) {
                    close(fd);
                    return;
                }

                if (format != WL_KEYBOARD_KEYMAP_FORMAT_XKB_V1) {
                    Debug::log(ERR, "[seat] Could not recognise keymap format");
                    close(fd);
                    return;
                }

                const char* buf = (const char*)mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
                if (buf == MAP_FAILED) {
                    Debug::log(ERR, "[seat] Failed to mmap xkb keymap: {}", strerror(errno));
                    close(fd);
                    return;
                }

                const auto PKEYMAP = xkb_keymap_new_from_buffer(m_pXKBContext, buf, size - 1, XKB_KEYMAP_FORMAT_TEXT_V1, XKB_KEYMAP_COMPILE_NO_FLAGS);

                munmap((void*)buf, size);
                close(fd);

                if (!PKEYMAP) {
                    Debug::log(ERR, "[seat] Failed to compile xkb keymap");
                    return;
                }

                const auto PSTATE = xkb_state_new(PKEYMAP);
                if (!PSTATE) {
                    Debug::log(ERR, "[seat] Failed to create xkb state");
                    xkb_keymap_unref(PKEYMAP);
                    return;
                }

                // the compositor may send a new keymap at any time
                if (m_pXKBState)
                    xkb_state_unref(m_pXKBState);
                if (m_pXKBKeymap)
                    xkb_keymap_unref(m_pXKBKeymap);

                m_pXKBKeymap = PKEYMAP;
                m_pXKBState  = PSTATE;

                Debug::log(TRACE, "[seat] Keymap loaded");
            });

            m_pKeeb->setKey([](CCWlKeyboard* r, uint32_t serial, uint32_t time, uint32_t key, wl_keyboard_key_state state) {
                g_pHyprshield->onKey(key, state == WL_KEYBOARD_KEY_STATE_PRESSED);
            });

            m_pKeeb->setModifiers([this](CCWlKeyboard* r, uint32_t serial, uint32_t mods_depressed, uint32_t mods_latched, uint32_t mods_locked, uint32_t group) {
                if (!m_pXKBState)
                    return;

                m_uiActiveLayout = group;
                xkb_state_update_mask(m_pXKBState, mods_depressed, mods_latched, mods_locked, 0, 0, group);
            });
        }
    });

    m_pSeat->setName([](CCWlSeat* r, const char* name) { Debug::log(LOG, "[seat] Exposed seat name: {}", name ? name : "nullptr"); });
}

void CSeatManager::registerCursorShape(SP<CCWpCursorShapeManagerV1> shape) {
    m_pCursorShape = makeUnique<CCursorShape>(shape);
}

bool CSeatManager::registered() {
    return m_pSeat;
}

uint8_t CSeatManager::activeModifiers() {
    if (!m_pXKBState)
        return MODIFIER_NONE;

    // locked modifiers (caps lock) never count, a latched one does
    const auto COMPONENTS = (xkb_state_component)(XKB_STATE_MODS_DEPRESSED | XKB_STATE_MODS_LATCHED);

    uint8_t    mods = MODIFIER_NONE;

    if (xkb_state_mod_name_is_active(m_pXKBState, XKB_MOD_NAME_LOGO, COMPONENTS) > 0)
        mods |= MODIFIER_SUPER;
    if (xkb_state_mod_name_is_active(m_pXKBState, XKB_MOD_NAME_CTRL, COMPONENTS) > 0)
        mods |= MODIFIER_CTRL;
    if (xkb_state_mod_name_is_active(m_pXKBState, XKB_MOD_NAME_ALT, COMPONENTS) > 0)
        mods |= MODIFIER_ALT;
    if (xkb_state_mod_name_is_active(m_pXKBState, XKB_MOD_NAME_SHIFT, COMPONENTS) > 0)
        mods |= MODIFIER_SHIFT;

    return mods;
}

xkb_keysym_t CSeatManager::baseKeysym(uint32_t key) {
    if (!m_pXKBKeymap)
        return XKB_KEY_NoSymbol;

    // evdev to xkb keycode
    const xkb_keycode_t KEYCODE = key + 8;

    const auto          LAYOUT = m_pXKBState ? xkb_state_key_get_layout(m_pXKBState, KEYCODE) : m_uiActiveLayout;

    const xkb_keysym_t* syms  = nullptr;
    const int           NSYMS = xkb_keymap_key_get_syms_by_level(m_pXKBKeymap, KEYCODE, LAYOUT == XKB_LAYOUT_INVALID ? 0 : LAYOUT, 0, &syms);

    if (NSYMS < 1 || !syms)
        return XKB_KEY_NoSymbol;

    return syms[0];
}
