#include "shared.hpp"
#include "../src/core/HoldGesture.hpp"

using namespace std::chrono_literals;

int main() {
    int        ret = 0;
    const auto T0  = TimePoint{} + 1h;

    {
        CHoldGestureTracker hold;
        EXPECT(hold.state(), HOLD_IDLE);
        EXPECT(hold.required() == 3s, true);

        // ticks and releases while idle do nothing
        EXPECT(hold.onTick(T0).signal, SHoldUpdate::HOLD_SIGNAL_NONE);
        EXPECT(hold.onRelease(T0).signal, SHoldUpdate::HOLD_SIGNAL_NONE);

        hold.onPressStart(T0);
        EXPECT(hold.state(), HOLD_HOLDING);

        const auto HALF = hold.onTick(T0 + 1500ms);
        EXPECT(HALF.signal, SHoldUpdate::HOLD_SIGNAL_PROGRESS);
        EXPECT(HALF.progress > 0.49F && HALF.progress < 0.51F, true);

        const auto DONE = hold.onTick(T0 + 3s);
        EXPECT(DONE.signal, SHoldUpdate::HOLD_SIGNAL_COMPLETED);
        EXPECT(DONE.progress, 1.F);
        EXPECT(hold.state(), HOLD_COMPLETED);

        // completed is terminal, and fires once
        EXPECT(hold.onTick(T0 + 4s).signal, SHoldUpdate::HOLD_SIGNAL_NONE);
        hold.onPressStart(T0 + 5s);
        EXPECT(hold.state(), HOLD_COMPLETED);
        EXPECT(hold.progress(T0 + 5s), 1.F);
    }

    {
        // early release resets
        CHoldGestureTracker hold;
        hold.onPressStart(T0);
        const auto RELEASED = hold.onRelease(T0 + 2999ms);
        EXPECT(RELEASED.signal, SHoldUpdate::HOLD_SIGNAL_PROGRESS);
        EXPECT(RELEASED.progress, 0.F);
        EXPECT(hold.state(), HOLD_IDLE);
        EXPECT(hold.progress(T0 + 2999ms), 0.F);

        // a new press starts over
        hold.onPressStart(T0 + 10s);
        EXPECT(hold.onTick(T0 + 12s).signal, SHoldUpdate::HOLD_SIGNAL_PROGRESS);
        EXPECT(hold.onTick(T0 + 13s).signal, SHoldUpdate::HOLD_SIGNAL_COMPLETED);
    }

    {
        // a release after the full duration counts, even if no tick saw it
        CHoldGestureTracker hold;
        hold.onPressStart(T0);
        EXPECT(hold.onRelease(T0 + 3200ms).signal, SHoldUpdate::HOLD_SIGNAL_COMPLETED);
        EXPECT(hold.state(), HOLD_COMPLETED);
    }

    {
        // a second press while holding keeps the original start
        CHoldGestureTracker hold(1s);
        hold.onPressStart(T0);
        hold.onPressStart(T0 + 900ms);
        EXPECT(hold.onTick(T0 + 1s).signal, SHoldUpdate::HOLD_SIGNAL_COMPLETED);
    }

    return ret;
}
