#include "Renderer.hpp"
#include "../core/hyprshield.hpp"
#include "../helpers/Log.hpp"
#include "../helpers/MiscFunctions.hpp"
#include <pango/pangocairo.h>
#include <algorithm>
#include <cmath>

using namespace Hyprutils::Math;

// background and tint
constexpr double BG_R = 0.1, BG_G = 0.1, BG_B = 0.15;

CBox CRenderer::closeControlBox(const Vector2D& logicalSize) {
    return CBox{logicalSize.x - CLOSE_BUTTON_SIZE - CLOSE_BUTTON_MARGIN, CLOSE_BUTTON_MARGIN, CLOSE_BUTTON_SIZE, CLOSE_BUTTON_SIZE};
}

void CRenderer::show(const SOverlayState& state) {
    m_state         = state;
    m_bVisible      = true;
    m_bCloseHovered = false;

    Debug::log(LOG, "[render] Showing the overlay at opacity {:.2f}", state.opacity);

    g_pHyprshield->renderAllOutputs();
}

void CRenderer::update(const SOverlayState& state) {
    m_state = state;

    if (!m_bVisible)
        return;

    g_pHyprshield->renderAllOutputs();
}

void CRenderer::hide() {
    if (!m_bVisible)
        return;

    m_bVisible      = false;
    m_bCloseHovered = false;

    // the lock surfaces are usually gone by now, whatever is left goes back to the plain capture
    g_pHyprshield->renderAllOutputs();
}

bool CRenderer::visible() const {
    return m_bVisible;
}

void CRenderer::setScreenshot(OUTPUTID output, SP<Hyprgraphics::CCairoSurface> screenshot) {
    m_mScreenshots[output] = screenshot;
}

void CRenderer::removeScreenshot(OUTPUTID output) {
    m_mScreenshots.erase(output);
}

bool CRenderer::hasScreenshot(OUTPUTID output) const {
    return m_mScreenshots.contains(output);
}

void CRenderer::setCloseControlHovered(bool hovered) {
    if (m_bCloseHovered == hovered)
        return;

    m_bCloseHovered = hovered;

    if (m_bVisible)
        g_pHyprshield->renderAllOutputs();
}

void CRenderer::renderSurface(const CSessionLockSurface& surf, cairo_surface_t* target, OUTPUTID output) {
    const auto CAIRO = cairo_create(target);

    renderBackground(CAIRO, surf.size, output);

    // Until the overlay is shown the lock surface just mirrors what was on screen
    if (m_bVisible) {
        cairo_save(CAIRO);
        cairo_scale(CAIRO, surf.appliedScale, surf.appliedScale);

        // without a capture there is nothing worth seeing through
        const double TINTALPHA = hasScreenshot(output) ? std::clamp((double)m_state.opacity, 0.0, 1.0) : 1.0;
        cairo_set_operator(CAIRO, CAIRO_OPERATOR_OVER);
        cairo_set_source_rgba(CAIRO, BG_R, BG_G, BG_B, TINTALPHA);
        cairo_paint(CAIRO);

        const auto LOGICAL = surf.logicalSize;

        renderCloseButton(CAIRO, closeControlBox(LOGICAL));

        if (m_state.showCountdown && m_state.remaining.has_value()) {
            if (m_state.countdownWarning)
                renderText(CAIRO, formatCountdown(*m_state.remaining), "Sans Bold 28", {LOGICAL.x / 2.0, 24}, 1.0, 0.6, 0.2, 1.0);
            else
                renderText(CAIRO, formatCountdown(*m_state.remaining), "Sans Bold 28", {LOGICAL.x / 2.0, 24}, 1.0, 1.0, 1.0, 0.9);
        }

        if (!m_state.unlockHint.empty())
            renderText(CAIRO, m_state.unlockHint, "Sans 12", {LOGICAL.x / 2.0, LOGICAL.y - 48}, 0.8, 0.8, 0.8, 0.8);

        cairo_restore(CAIRO);
    }

    cairo_surface_flush(target);
    cairo_destroy(CAIRO);
}

void CRenderer::renderBackground(cairo_t* cr, const Vector2D& pixelSize, OUTPUTID output) {
    cairo_save(cr);
    cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);

    const auto IT = m_mScreenshots.find(output);
    if (IT == m_mScreenshots.end() || !IT->second) {
        cairo_set_source_rgba(cr, BG_R, BG_G, BG_B, 1.0);
        cairo_paint(cr);
        cairo_restore(cr);
        return;
    }

    const auto SSSIZE = IT->second->size();
    if (SSSIZE.x > 0 && SSSIZE.y > 0)
        cairo_scale(cr, pixelSize.x / SSSIZE.x, pixelSize.y / SSSIZE.y);

    cairo_set_source_surface(cr, IT->second->cairo(), 0, 0);
    cairo_pattern_set_filter(cairo_get_source(cr), CAIRO_FILTER_BILINEAR);
    cairo_paint(cr);
    cairo_restore(cr);
}

void CRenderer::renderCloseButton(cairo_t* cr, const CBox& box) {
    const auto   CENTER   = box.middle();
    const double RADIUS   = std::min(box.w, box.h) / 2.0 - 2.0;
    const float  PROGRESS = m_state.holdProgress;

    if (m_bCloseHovered && PROGRESS > 0.F)
        cairo_set_source_rgba(cr, 0.3, 0.3, 0.3, 0.9);
    else
        cairo_set_source_rgba(cr, 0.2, 0.2, 0.2, 0.7);

    cairo_new_path(cr);
    cairo_arc(cr, CENTER.x, CENTER.y, RADIUS, 0, 2 * M_PI);
    cairo_fill(cr);

    // clockwise from the top
    if (PROGRESS > 0.F) {
        cairo_set_source_rgba(cr, 0.4, 0.8, 0.4, 1.0);
        cairo_set_line_width(cr, 4.0);
        cairo_new_path(cr);
        cairo_arc(cr, CENTER.x, CENTER.y, RADIUS - 3.0, -M_PI / 2.0, -M_PI / 2.0 + PROGRESS * 2 * M_PI);
        cairo_stroke(cr);
    }

    if (m_bCloseHovered)
        cairo_set_source_rgba(cr, 1.0, 1.0, 1.0, 1.0);
    else
        cairo_set_source_rgba(cr, 0.8, 0.8, 0.8, 0.8);

    const double XSIZE = RADIUS * 0.5;
    cairo_set_line_width(cr, 3.0);
    cairo_set_line_cap(cr, CAIRO_LINE_CAP_ROUND);
    cairo_new_path(cr);
    cairo_move_to(cr, CENTER.x - XSIZE, CENTER.y - XSIZE);
    cairo_line_to(cr, CENTER.x + XSIZE, CENTER.y + XSIZE);
    cairo_move_to(cr, CENTER.x + XSIZE, CENTER.y - XSIZE);
    cairo_line_to(cr, CENTER.x - XSIZE, CENTER.y + XSIZE);
    cairo_stroke(cr);
}

// anchor is the top center of the text
void CRenderer::renderText(cairo_t* cr, const std::string& text, const std::string& font, const Vector2D& anchor, double r, double g, double b, double a) {
    PangoLayout*          layout = pango_cairo_create_layout(cr);

    PangoFontDescription* fontDesc = pango_font_description_from_string(font.c_str());
    pango_layout_set_font_description(layout, fontDesc);
    pango_font_description_free(fontDesc);

    pango_layout_set_alignment(layout, PANGO_ALIGN_CENTER);
    pango_layout_set_text(layout, text.c_str(), -1);

    int layoutWidth, layoutHeight;
    pango_layout_get_size(layout, &layoutWidth, &layoutHeight);

    cairo_set_source_rgba(cr, r, g, b, a);
    cairo_move_to(cr, anchor.x - (layoutWidth / PANGO_SCALE) / 2.0, anchor.y);
    pango_cairo_show_layout(cr, layout);

    g_object_unref(layout);
}
