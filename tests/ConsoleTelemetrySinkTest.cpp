#include "telemetry/ConsoleTelemetrySink.h"

#include <iostream>
#include <sstream>
#include <string>

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

bool testSortedFieldsAndQuoting()
{
    std::ostringstream out;
    ConsoleTelemetrySink sink(out);
    sink.setTimestamps(false);
    sink.recordEvent("session.route_to_lobby", {{"reason", "room_closed"}, {"detail", "Room \"A\" closed"}});

    bool success = true;
    success &= assertTrue(out.str() == "[qbit] session.route_to_lobby detail=\"Room \\\"A\\\" closed\" reason=room_closed\n",
                          "Fields should be sorted and values with spaces quoted");
    return success;
}

bool testEmptyValueIsQuoted()
{
    std::ostringstream out;
    ConsoleTelemetrySink sink(out);
    sink.setTimestamps(false);
    sink.recordEvent("session.join", {{"room", ""}});
    return assertTrue(out.str() == "[qbit] session.join room=\"\"\n", "An empty value should print as empty quotes");
}

bool testMutedPrefixesAreCounted()
{
    std::ostringstream out;
    ConsoleTelemetrySink sink(out);
    sink.setTimestamps(false);
    sink.setMutedPrefixes({"net.inbound", ""});
    sink.recordEvent("net.inbound", {{"event", "position_update"}});
    sink.recordEvent("net.inbound", {{"event", "hunt_start"}});
    sink.recordEvent("net.outbound", {{"event", "join_room"}});

    bool success = true;
    success &= assertTrue(sink.mutedCount() == 2, "Muted events should be counted");
    success &= assertTrue(out.str() == "[qbit] net.outbound event=join_room\n",
                          "Only unmuted events should print and an empty prefix should mute nothing");
    return success;
}

bool testTimestampPrefix()
{
    std::ostringstream out;
    ConsoleTelemetrySink sink(out);
    sink.recordEvent("app.hud_font_missing", {});
    const std::string line = out.str();
    // "[qbit HH:MM:SS] app.hud_font_missing\n"
    bool success = true;
    success &= assertTrue(line.size() == 6 + 8 + 2 + 20 + 1, "Timestamped line should carry a clock");
    success &= assertTrue(line.rfind("[qbit ", 0) == 0 && line[14] == ']', "Clock should sit inside the tag");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testSortedFieldsAndQuoting();
    success &= testEmptyValueIsQuoted();
    success &= testMutedPrefixesAreCounted();
    success &= testTimestampPrefix();
    return success ? 0 : 1;
}
