#include "net/ReplayChannel.h"

#include <filesystem>
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

bool testParseScript()
{
    const std::string script = "# comment\n"
                               "{\"at_ms\":100,\"event\":\"game_started\",\"payload\":{\"room\":{}}}\r\n"
                               "\n"
                               "{\"at_ms\":50,\"event\":\"room_joined\",\"reply_to\":\"join_room\"}\n"
                               "{\"event\":\"hunt_start\"}\n"
                               "{\"at_ms\":-1,\"event\":\"hunt_end\"}\n"
                               "not json\n";
    const net::ReplayLoadResult result = net::parseReplayScript(script);

    bool success = true;
    success &= assertTrue(!result.success, "Malformed lines should fail the load");
    success &= assertTrue(result.records.size() == 2, "Valid lines should still be kept");
    success &= assertTrue(result.errors.size() == 3, "Each malformed line should report once");
    success &= assertTrue(!result.errors.empty() && result.errors[0] == "line 5: missing at_ms",
                          "Errors should name the line");
    success &= assertTrue(result.records.size() == 2 && result.records[1].replyTo == "join_room",
                          "Reply records should keep their trigger");
    success &= assertTrue(result.records.size() == 2 &&
                              result.records[1].payload.type == json::JsonValue::Type::Object,
                          "Missing payload should default to an empty object");
    return success;
}

bool testTimedAndReplyDelivery()
{
    std::vector<net::ReplayRecord> records(3);
    records[0].atMs = 200.0;
    records[0].event = "game_started";
    records[1].atMs = 80.0;
    records[1].event = "room_joined";
    records[1].replyTo = "join_room";
    records[2].atMs = 200.0;
    records[2].event = "phase_change";

    net::ReplayChannel channel(records);
    std::vector<std::string> delivered;
    channel.setMessageHandler([&](const std::string &event, const json::JsonValue &) { delivered.push_back(event); });

    bool success = true;
    channel.poll(100.0);
    success &= assertTrue(delivered.empty(), "Nothing is due at 100ms");
    success &= assertTrue(!channel.isComplete(), "Timed records are still queued");

    channel.send("join_room", json::makeObject());
    channel.poll(179.0);
    success &= assertTrue(delivered.empty(), "Reply is due 80ms after the send");
    channel.poll(180.0);
    success &= assertTrue(delivered.size() == 1 && delivered[0] == "room_joined", "Reply should arrive after its send");

    channel.poll(250.0);
    success &= assertTrue(delivered.size() == 3 && delivered[1] == "game_started" && delivered[2] == "phase_change",
                          "Records due together keep script order");
    success &= assertTrue(channel.isComplete(), "All timed records should be delivered");
    success &= assertTrue(channel.sent().size() == 1 && channel.sent()[0].atMs == 100.0,
                          "Outbound messages are stamped with the channel clock");

    channel.send("join_room", json::makeObject());
    channel.poll(1000.0);
    success &= assertTrue(delivered.size() == 3, "A reply record answers only one send");
    return success;
}

bool testDisconnectHoldsMessages()
{
    std::vector<net::ReplayRecord> records(3);
    records[0].atMs = 100.0;
    records[0].event = net::ReplayDisconnect;
    records[1].atMs = 150.0;
    records[1].event = "player_position_update";
    records[2].atMs = 300.0;
    records[2].event = net::ReplayConnect;

    net::ReplayChannel channel(records);
    std::vector<bool> transitions;
    std::vector<std::string> delivered;
    channel.setConnectionHandler([&](bool connected) { transitions.push_back(connected); });
    channel.setMessageHandler([&](const std::string &event, const json::JsonValue &) { delivered.push_back(event); });

    bool success = true;
    channel.poll(200.0);
    success &= assertTrue(!channel.isConnected(), "Disconnect record should drop the link");
    success &= assertTrue(delivered.empty(), "Messages must wait while disconnected");

    channel.send("update_position", json::makeObject());
    success &= assertTrue(channel.sent().empty(), "Sends while disconnected are dropped");

    channel.poll(300.0);
    success &= assertTrue(channel.isConnected(), "Connect record should restore the link");
    success &= assertTrue(delivered.size() == 1, "Held message should arrive after reconnecting");
    success &= assertTrue(transitions == std::vector<bool>{false, true}, "Both transitions should be reported");
    return success;
}

bool testLoadShippedScript()
{
    const std::filesystem::path path = std::filesystem::path(PROJECT_SOURCE_DIR) / "config" / "replay" / "demo.jsonl";
    const net::ReplayLoadResult result = net::loadReplayScript(path);
    bool success = true;
    success &= assertTrue(result.success, "Shipped replay script should load cleanly");
    success &= assertTrue(!result.records.empty(), "Shipped replay script should not be empty");

    const net::ReplayLoadResult missing = net::loadReplayScript(path.parent_path() / "missing.jsonl");
    success &= assertTrue(!missing.success && missing.errors.size() == 1, "Missing file should report one error");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testParseScript();
    success &= testTimedAndReplyDelivery();
    success &= testDisconnectHoldsMessages();
    success &= testLoadShippedScript();
    return success ? 0 : 1;
}
