#include "shared.hpp"
#include "../src/core/Countdown.hpp"
#include "../src/helpers/MiscFunctions.hpp"

using namespace std::chrono_literals;

int main() {
    int        ret = 0;
    const auto T0  = TimePoint{} + 1h;

    {
        CCountdownTimer countdown(5min, T0);
        EXPECT(countdown.remaining(T0) == 5min, true);

        auto update = countdown.onTick(T0 + 1min);
        EXPECT(update.remaining == 4min, true);
        EXPECT(update.warning, false);
        EXPECT(update.completed, false);

        // warning at 60 s left, exactly once
        update = countdown.onTick(T0 + 4min);
        EXPECT(update.warning, true);
        EXPECT(countdown.warningIssued(), true);

        update = countdown.onTick(T0 + 4min + 30s);
        EXPECT(update.warning, false);
        EXPECT(update.remaining == 30s, true);

        update = countdown.onTick(T0 + 5min);
        EXPECT(update.completed, true);
        EXPECT(update.remaining.count(), 0);
        EXPECT(countdown.completed(), true);

        // completion fires once
        update = countdown.onTick(T0 + 6min);
        EXPECT(update.completed, false);
        EXPECT(countdown.remaining(T0 + 6min).count(), 0);
    }

    {
        // a late tick jumping over the warning still issues it together with completion
        CCountdownTimer countdown(2min, T0);
        const auto      UPDATE = countdown.onTick(T0 + 10min);
        EXPECT(UPDATE.warning, true);
        EXPECT(UPDATE.completed, true);
        EXPECT(UPDATE.remaining.count(), 0);
    }

    {
        // remaining is monotonically non-increasing and never negative
        CCountdownTimer countdown(90s, T0);
        auto            last = countdown.remaining(T0);
        bool            ok   = true;
        for (int i = 0; i < 200; ++i) {
            const auto NOW = countdown.remaining(T0 + i * 500ms);
            if (NOW > last || NOW.count() < 0)
                ok = false;
            last = NOW;
        }
        EXPECT(ok, true);
    }

    {
        // a fraction of a millisecond before the deadline is not the deadline
        CCountdownTimer countdown(1min, T0);
        auto            update = countdown.onTick(T0 + 1min - 500us);
        EXPECT(update.completed, false);
        EXPECT(update.remaining == 1ms, true);

        update = countdown.onTick(T0 + 1min);
        EXPECT(update.completed, true);
    }

    EXPECT(formatCountdown(0ms), std::string{"00:00"});
    EXPECT(formatCountdown(59001ms), std::string{"01:00"});
    EXPECT(formatCountdown(61s), std::string{"01:01"});
    EXPECT(formatCountdown(1h + 2min + 3s), std::string{"1:02:03"});
    EXPECT(formatCountdown(24h), std::string{"24:00:00"});

    return ret;
}
