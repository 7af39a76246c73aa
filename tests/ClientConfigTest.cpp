#include "config/ClientConfigLoader.h"

#include <filesystem>
#include <fstream>
#include <iostream>
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

void printErrors(const ClientConfigLoadResult &result)
{
    for (const auto &error : result.errors)
    {
        std::cerr << "  " << error.file << ": " << error.message << '\n';
    }
}

void writeFile(const std::filesystem::path &path, const std::string &text)
{
    std::ofstream stream(path, std::ios::trunc);
    stream << text;
}

std::filesystem::path scratchConfig(const std::string &clientJson, const std::string &inputJson)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "qbit_city_config_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    writeFile(dir / "client.json", clientJson);
    writeFile(dir / "input.json", inputJson);
    return dir;
}

bool testShippedConfig()
{
    ClientConfigLoader loader(std::filesystem::path(PROJECT_SOURCE_DIR) / "config");
    const ClientConfigLoadResult result = loader.load();
    if (!result.success)
    {
        std::cerr << "Shipped config failed validation:\n";
        printErrors(result);
        return false;
    }

    const ClientConfig &config = result.config;
    bool success = true;
    success &= assertTrue(config.world.width == 50 && config.world.blockSize == 4 && config.world.tileSize == 64,
                          "World dimensions should match the shipped map");
    success &= assertTrue(config.network.positionIntervalMs == 20.0, "Position interval should be 20ms");
    success &= assertTrue(config.capabilities.hazardMode == HazardMode::Lethal, "Hazards should be lethal");
    success &= assertTrue(config.collectibles.trapInventoryMax == 3, "Trap inventory should cap at 3");
    success &= assertTrue(config.store.path == "build/client_store.json", "Store path should be read");
    success &= assertTrue(config.input.deployTrap == "Space" && config.input.moveUp.size() == 2,
                          "Input bindings should be read");
    success &= assertTrue(config.telemetry.rotationBytes == 4ull * 1024ull * 1024ull, "Rotation should be in MiB");
    success &= assertTrue(config.telemetry.consoleMuted.size() == 2 && config.telemetry.consoleMuted[0] == "net.inbound",
                          "Console mute list should be read");
    return success;
}

bool testSchemaMismatch()
{
    const auto dir = scratchConfig(R"({"schema_version": 2})", R"({"schema_version": 1})");
    const ClientConfigLoadResult result = ClientConfigLoader(dir).load();
    bool success = true;
    success &= assertTrue(!result.success, "Wrong schema version should fail");
    success &= assertTrue(result.errors.size() == 1 && result.errors[0].message == "schema_version mismatch",
                          "Schema error should be reported once");
    return success;
}

bool testValuesValidated()
{
    const auto dir = scratchConfig(
        R"({"schema_version": 1, "world": {"width": 2, "height": 50}, "movement": {"base_speed": 0},)"
        R"( "capabilities": {"hazard_mode": "bouncy"}})",
        R"({"schema_version": 1})");
    const ClientConfigLoadResult result = ClientConfigLoader(dir).load();
    bool success = true;
    success &= assertTrue(!result.success, "Invalid values should fail");
    success &= assertTrue(result.errors.size() == 3, "Each invalid value should be reported");
    success &= assertTrue(result.config.world.width == 50, "Failed loads should leave defaults in place");
    return success;
}

bool testSolidHazardsAndDefaults()
{
    const auto dir = scratchConfig(R"({"schema_version": 1, "capabilities": {"hazard_mode": "Solid"}})",
                                   R"({"schema_version": 1, "Move": {"Up": "I"}, "buffer_frames": 0})");
    const ClientConfigLoadResult result = ClientConfigLoader(dir).load();
    if (!result.success)
    {
        printErrors(result);
        return false;
    }
    bool success = true;
    success &= assertTrue(result.config.capabilities.hazardMode == HazardMode::Solid,
                          "Hazard mode should parse case-insensitively");
    success &= assertTrue(result.config.input.moveUp.size() == 1 && result.config.input.moveUp[0] == "I",
                          "A single key string should replace the defaults");
    success &= assertTrue(result.config.input.moveDown.size() == 2, "Unset bindings keep their defaults");
    success &= assertTrue(result.config.input.bufferFrames == 1, "Buffer frames should clamp to one");
    success &= assertTrue(result.config.movement.baseSpeed == 300.0f, "Missing sections keep defaults");
    return success;
}

bool testKeyValidator()
{
    const auto dir = scratchConfig(R"({"schema_version": 1})",
                                   R"({"schema_version": 1, "DeployTrap": "Bogus", "Quit": "Escape"})");
    ClientConfigLoader loader(dir);
    loader.setKeyValidator([](const std::string &key) { return key != "Bogus"; });
    const ClientConfigLoadResult result = loader.load();
    bool success = true;
    success &= assertTrue(!result.success && result.errors.size() == 1, "Unknown key should fail validation");
    success &= assertTrue(!result.errors.empty() && result.errors[0].message == "Invalid DeployTrap binding: Bogus",
                          "Error should name the binding");
    return success;
}

bool testMissingFiles()
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "qbit_city_config_missing";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const ClientConfigLoadResult result = ClientConfigLoader(dir).load();
    return assertTrue(!result.success && result.errors.size() == 1 &&
                          result.errors[0].message == "Failed to open JSON",
                      "Missing config should report the unreadable file");
}

} // namespace

int main()
{
    bool success = true;
    success &= testShippedConfig();
    success &= testSchemaMismatch();
    success &= testValuesValidated();
    success &= testSolidHazardsAndDefaults();
    success &= testKeyValidator();
    success &= testMissingFiles();
    return success ? 0 : 1;
}
