#pragma once

#include <unordered_map>
#include "../defines.hpp"
#include "../core/LockSurface.hpp"
#include "../core/Overlay.hpp"
#include <hyprgraphics/cairo/CairoSurface.hpp>
#include <hyprutils/math/Box.hpp>
#include <cairo/cairo.h>

// Draws the protection overlay onto the lock surfaces with cairo
class CRenderer : public IOverlay {
  public:
    CRenderer() = default;

    static constexpr double CLOSE_BUTTON_SIZE   = 44.0;
    static constexpr double CLOSE_BUTTON_MARGIN = 20.0;

    // top right corner, in surface local coordinates
    static Hyprutils::Math::CBox closeControlBox(const Vector2D& logicalSize);

    virtual void                 show(const SOverlayState& state);
    virtual void                 update(const SOverlayState& state);
    virtual void                 hide();
    virtual bool                 visible() const;

    void                         renderSurface(const CSessionLockSurface& surf, cairo_surface_t* target, OUTPUTID output);

    void                         setScreenshot(OUTPUTID output, SP<Hyprgraphics::CCairoSurface> screenshot);
    void                         removeScreenshot(OUTPUTID output);
    bool                         hasScreenshot(OUTPUTID output) const;

    void                         setCloseControlHovered(bool hovered);

  private:
    void                         renderBackground(cairo_t* cr, const Vector2D& pixelSize, OUTPUTID output);
    void                         renderCloseButton(cairo_t* cr, const Hyprutils::Math::CBox& box);
    void                         renderText(cairo_t* cr, const std::string& text, const std::string& font, const Vector2D& anchor, double r, double g, double b, double a);

    SOverlayState                m_state;
    bool                         m_bVisible       = false;
    bool                         m_bCloseHovered  = false;

    std::unordered_map<OUTPUTID, SP<Hyprgraphics::CCairoSurface>> m_mScreenshots;
};

inline SP<CRenderer> g_pRenderer;
