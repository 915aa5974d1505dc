#include "CursorShape.hpp"
#include "Seat.hpp"

CCursorShape::CCursorShape(SP<CCWpCursorShapeManagerV1> mgr) : mgr(mgr) {
    ensureDevice();
}

bool CCursorShape::ensureDevice() {
    if (dev)
        return true;

    if (!g_pSeatManager->m_pPointer)
        return false;

    dev = makeShared<CCWpCursorShapeDeviceV1>(mgr->sendGetPointer(g_pSeatManager->m_pPointer->resource()));
    return true;
}

void CCursorShape::setShape(const wpCursorShapeDeviceV1Shape shape) {
    if (!ensureDevice())
        return;

    dev->sendSetShape(lastCursorSerial, shape);
    shapeChanged = shape != WP_CURSOR_SHAPE_DEVICE_V1_SHAPE_DEFAULT;
}

void CCursorShape::hideCursor() {
    if (!g_pSeatManager->m_pPointer)
        return;

    g_pSeatManager->m_pPointer->sendSetCursor(lastCursorSerial, nullptr, 0, 0);
    shapeChanged = false;
}
