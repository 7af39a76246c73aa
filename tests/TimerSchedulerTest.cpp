#include "match/TimerScheduler.h"

#include <iostream>
#include <string>
#include <vector>

namespace
{

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

bool testFiresInDueOrder()
{
    TimerScheduler timers;
    std::vector<std::string> fired;
    timers.schedule(300.0, [&] { fired.push_back("flash"); });
    timers.schedule(100.0, [&] { fired.push_back("cue"); });
    timers.schedule(2000.0, [&] { fired.push_back("lobby"); });

    bool success = true;
    success &= assertTrue(timers.advance(50.0) == 0, "Nothing should be due after 50ms");
    success &= assertTrue(timers.advance(300.0) == 2, "Two timers should fire by 350ms");
    success &= assertTrue(fired.size() == 2 && fired[0] == "cue" && fired[1] == "flash",
                          "Timers should fire earliest first");
    success &= assertTrue(timers.pendingCount() == 1, "Lobby timer should still be pending");
    success &= assertTrue(timers.nowMs() == 350.0, "Clock should accumulate deltas");
    return success;
}

bool testCancel()
{
    TimerScheduler timers;
    int fired = 0;
    const auto id = timers.schedule(10.0, [&] { ++fired; });
    timers.schedule(20.0, [&] { ++fired; });

    bool success = true;
    success &= assertTrue(timers.isPending(id), "Scheduled timer should be pending");
    success &= assertTrue(timers.cancel(id), "Cancel should report a pending timer");
    success &= assertTrue(!timers.cancel(id), "Second cancel should be a no-op");
    timers.cancelAll();
    timers.advance(100.0);
    success &= assertTrue(fired == 0, "Cancelled timers must never fire");
    return success;
}

bool testCallbacksMayReschedule()
{
    TimerScheduler timers;
    std::vector<double> firedAt;
    timers.schedule(100.0, [&] {
        firedAt.push_back(timers.nowMs());
        timers.schedule(0.0, [&] { firedAt.push_back(-1.0); });
        timers.schedule(500.0, [&] { firedAt.push_back(timers.nowMs()); });
    });

    timers.advance(150.0);
    bool success = true;
    success &= assertTrue(firedAt.size() == 2, "Zero-delay timer scheduled from a callback should fire in the same advance");
    timers.advance(-20.0);
    success &= assertTrue(timers.nowMs() == 150.0, "Negative deltas must not rewind the clock");
    timers.advance(500.0);
    success &= assertTrue(firedAt.size() == 3, "Rescheduled timer should fire once due");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testFiresInDueOrder();
    success &= testCancel();
    success &= testCallbacksMayReschedule();
    return success ? 0 : 1;
}
