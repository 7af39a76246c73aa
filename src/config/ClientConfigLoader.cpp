#include "config/ClientConfigLoader.h"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

#include "json/JsonUtils.h"

namespace fs = std::filesystem;

namespace
{

constexpr int kClientSchemaVersion = 1;
constexpr int kInputSchemaVersion = 1;

ClientConfigLoadError makeError(const fs::path &path, std::string message)
{
    ClientConfigLoadError error;
    error.file = path.lexically_normal().string();
    error.message = std::move(message);
    return error;
}

std::optional<json::JsonValue> readLocalJson(const fs::path &path, std::vector<ClientConfigLoadError> &errors)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        errors.push_back(makeError(path, "Failed to open JSON"));
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    auto parsed = json::parseJson(buffer.str());
    if (!parsed)
    {
        errors.push_back(makeError(path, "Failed to parse JSON"));
        return std::nullopt;
    }
    return parsed;
}

bool validateSchema(const json::JsonValue &root, int expected, const fs::path &path,
                    std::vector<ClientConfigLoadError> &errors)
{
    const json::JsonValue *schemaValue = json::getObjectField(root, "schema_version");
    if (!schemaValue || schemaValue->type != json::JsonValue::Type::Number)
    {
        errors.push_back(makeError(path, "Missing schema_version"));
        return false;
    }
    if (static_cast<int>(schemaValue->number) != expected)
    {
        errors.push_back(makeError(path, "schema_version mismatch"));
        return false;
    }
    return true;
}

void requirePositive(float value, const char *label, const fs::path &path, std::vector<ClientConfigLoadError> &errors)
{
    if (value <= 0.0f)
    {
        std::string message = label;
        message += " must be positive";
        errors.push_back(makeError(path, std::move(message)));
    }
}

TelemetryOptions parseTelemetry(const json::JsonValue &root, TelemetryOptions options)
{
    const json::JsonValue *telemetry = json::getObjectField(root, "telemetry");
    if (!telemetry)
    {
        return options;
    }
    options.sink = json::getString(*telemetry, "sink", options.sink);
    const std::string output = json::getString(*telemetry, "output_dir", options.outputDirectory);
    if (!output.empty())
    {
        options.outputDirectory = output;
    }
    const double rotationMb = json::getNumber(*telemetry, "rotation_mb", 0.0f);
    if (rotationMb > 0.0)
    {
        options.rotationBytes = static_cast<std::uintmax_t>(rotationMb * 1024.0 * 1024.0);
    }
    const int maxFiles = json::getInt(*telemetry, "max_files", static_cast<int>(options.maxFiles));
    if (maxFiles > 0)
    {
        options.maxFiles = static_cast<std::size_t>(maxFiles);
    }
    if (json::getObjectField(*telemetry, "console_muted"))
    {
        options.consoleMuted = json::getStringArray(*telemetry, "console_muted");
    }
    return options;
}

void parseWorld(const json::JsonValue &root, WorldConfig &world, const fs::path &path,
                std::vector<ClientConfigLoadError> &errors)
{
    const json::JsonValue *obj = json::getObjectField(root, "world");
    if (!obj)
    {
        return;
    }
    world.width = json::getInt(*obj, "width", world.width);
    world.height = json::getInt(*obj, "height", world.height);
    world.blockSize = json::getInt(*obj, "block_size", world.blockSize);
    world.tileSize = json::getInt(*obj, "tile_size", world.tileSize);
    world.portalCount = json::getInt(*obj, "portal_count", world.portalCount);
    if (world.width < 3 || world.height < 3)
    {
        errors.push_back(makeError(path, "world dimensions must be at least 3x3"));
    }
    if (world.blockSize <= 0 || world.tileSize <= 0)
    {
        errors.push_back(makeError(path, "world block_size and tile_size must be positive"));
    }
}

void parseMovement(const json::JsonValue &root, MovementConfig &movement, const fs::path &path,
                   std::vector<ClientConfigLoadError> &errors)
{
    const json::JsonValue *obj = json::getObjectField(root, "movement");
    if (!obj)
    {
        return;
    }
    movement.baseSpeed = json::getNumber(*obj, "base_speed", movement.baseSpeed);
    movement.chaserSpeedMultiplier = json::getNumber(*obj, "chaser_speed_multiplier", movement.chaserSpeedMultiplier);
    movement.difficultySpeedMultiplier =
        json::getNumber(*obj, "difficulty_speed_multiplier", movement.difficultySpeedMultiplier);
    movement.difficultyThresholdSeconds =
        json::getNumber(*obj, "difficulty_threshold_seconds", movement.difficultyThresholdSeconds);
    movement.hitboxSize = json::getNumber(*obj, "hitbox_size", movement.hitboxSize);
    movement.trailCapacity = static_cast<std::size_t>(
        std::max(1, json::getInt(*obj, "trail_capacity", static_cast<int>(movement.trailCapacity))));
    movement.portalCooldownSeconds = json::getNumber(*obj, "portal_cooldown_seconds", movement.portalCooldownSeconds);
    movement.staminaRechargePerSecond =
        json::getNumber(*obj, "stamina_recharge_per_second", movement.staminaRechargePerSecond);
    requirePositive(movement.baseSpeed, "movement.base_speed", path, errors);
    requirePositive(movement.hitboxSize, "movement.hitbox_size", path, errors);
}

void parseNetwork(const json::JsonValue &root, NetworkConfig &network, const fs::path &path,
                  std::vector<ClientConfigLoadError> &errors)
{
    const json::JsonValue *obj = json::getObjectField(root, "network");
    if (!obj)
    {
        return;
    }
    network.positionIntervalMs =
        json::getNumber(*obj, "position_interval_ms", static_cast<float>(network.positionIntervalMs));
    network.interpolationSpeed = json::getNumber(*obj, "interpolation_speed", network.interpolationSpeed);
    network.snapEpsilonPx = json::getNumber(*obj, "snap_epsilon_px", network.snapEpsilonPx);
    requirePositive(static_cast<float>(network.positionIntervalMs), "network.position_interval_ms", path, errors);
    requirePositive(network.interpolationSpeed, "network.interpolation_speed", path, errors);
}

void parseTimers(const json::JsonValue &root, TimerConfig &timers)
{
    const json::JsonValue *obj = json::getObjectField(root, "timers");
    if (!obj)
    {
        return;
    }
    auto read = [obj](const char *key, double fallback) {
        return static_cast<double>(json::getNumber(*obj, key, static_cast<float>(fallback)));
    };
    timers.penaltyQuizFallbackMs = read("penalty_quiz_fallback_ms", timers.penaltyQuizFallbackMs);
    timers.snapshotPenaltyRequestMs = read("snapshot_penalty_request_ms", timers.snapshotPenaltyRequestMs);
    timers.roleAnnouncementMs = read("role_announcement_ms", timers.roleAnnouncementMs);
    timers.roleAnnouncementOtherMs = read("role_announcement_other_ms", timers.roleAnnouncementOtherMs);
    timers.huntStartAnnouncementCapMs = read("hunt_start_announcement_cap_ms", timers.huntStartAnnouncementCapMs);
    timers.screenFlashMs = read("screen_flash_ms", timers.screenFlashMs);
    timers.invulnerabilityMs = read("invulnerability_ms", timers.invulnerabilityMs);
    timers.roomClosedReturnMs = read("room_closed_return_ms", timers.roomClosedReturnMs);
}

void parseCollectibles(const json::JsonValue &root, CollectibleConfig &collectibles)
{
    const json::JsonValue *obj = json::getObjectField(root, "collectibles");
    if (!obj)
    {
        return;
    }
    collectibles.currencyPickupRadius =
        json::getNumber(*obj, "currency_pickup_radius", collectibles.currencyPickupRadius);
    collectibles.trapPickupRadius = json::getNumber(*obj, "trap_pickup_radius", collectibles.trapPickupRadius);
    collectibles.trapMatchRadius = json::getNumber(*obj, "trap_match_radius", collectibles.trapMatchRadius);
    collectibles.portalRadius = json::getNumber(*obj, "portal_radius", collectibles.portalRadius);
    collectibles.trapInventoryMax = std::max(0, json::getInt(*obj, "trap_inventory_max", collectibles.trapInventoryMax));
}

void parseCapabilities(const json::JsonValue &root, CapabilityFlags &caps, const fs::path &path,
                       std::vector<ClientConfigLoadError> &errors)
{
    const json::JsonValue *obj = json::getObjectField(root, "capabilities");
    if (!obj)
    {
        return;
    }
    caps.invulnerability = json::getBool(*obj, "invulnerability", caps.invulnerability);
    caps.stamina = json::getBool(*obj, "stamina", caps.stamina);
    const std::string mode = json::getString(*obj, "hazard_mode", hazardModeToString(caps.hazardMode));
    if (auto parsed = hazardModeFromString(mode))
    {
        caps.hazardMode = *parsed;
    }
    else
    {
        errors.push_back(makeError(path, "Unknown capabilities.hazard_mode: " + mode));
    }
}

void parseStore(const json::JsonValue &root, StoreConfig &store)
{
    if (const json::JsonValue *obj = json::getObjectField(root, "store"))
    {
        store.path = json::getString(*obj, "path", store.path);
        store.leaderboardCapacity = static_cast<std::size_t>(
            std::max(1, json::getInt(*obj, "leaderboard_capacity", static_cast<int>(store.leaderboardCapacity))));
    }
}

void parsePerformance(const json::JsonValue &root, PerformanceBudgetConfig &perf)
{
    if (const json::JsonValue *obj = json::getObjectField(root, "performance"))
    {
        perf.pumpMs = json::getNumber(*obj, "pump_ms", perf.pumpMs);
        perf.simulateMs = json::getNumber(*obj, "simulate_ms", perf.simulateMs);
        perf.renderMs = json::getNumber(*obj, "render_ms", perf.renderMs);
        perf.toleranceMs = json::getNumber(*obj, "tolerance_ms", perf.toleranceMs);
    }
}

void parseHud(const json::JsonValue &root, HudConfig &hud)
{
    if (const json::JsonValue *obj = json::getObjectField(root, "hud"))
    {
        hud.fontPath = json::getString(*obj, "font", hud.fontPath);
        hud.pointSize = std::max(6, json::getInt(*obj, "point_size", hud.pointSize));
    }
}

void assignKeys(const json::JsonValue *value, std::vector<std::string> &out)
{
    if (!value)
    {
        return;
    }
    out.clear();
    if (value->type == json::JsonValue::Type::Array)
    {
        for (const auto &entry : value->array)
        {
            if (entry.type == json::JsonValue::Type::String)
            {
                out.push_back(entry.string);
            }
        }
    }
    else if (value->type == json::JsonValue::Type::String)
    {
        out.push_back(value->string);
    }
}

InputBindings parseInputBindings(const json::JsonValue &root, const ClientConfigLoader::KeyValidator &validator,
                                 std::vector<ClientConfigLoadError> &errors, const fs::path &path)
{
    InputBindings bindings;
    if (const json::JsonValue *move = json::getObjectField(root, "Move"))
    {
        assignKeys(json::getObjectField(*move, "Up"), bindings.moveUp);
        assignKeys(json::getObjectField(*move, "Down"), bindings.moveDown);
        assignKeys(json::getObjectField(*move, "Left"), bindings.moveLeft);
        assignKeys(json::getObjectField(*move, "Right"), bindings.moveRight);
    }
    bindings.deployTrap = json::getString(root, "DeployTrap", bindings.deployTrap);
    bindings.toggleDebugHud = json::getString(root, "ToggleDebugHud", bindings.toggleDebugHud);
    bindings.quit = json::getString(root, "Quit", bindings.quit);
    bindings.bufferFrames = std::max(1, json::getInt(root, "buffer_frames", bindings.bufferFrames));
    bindings.bufferExpiryMs = json::getNumber(root, "buffer_expiry_ms", bindings.bufferExpiryMs);

    if (!validator)
    {
        return bindings;
    }

    auto validateKey = [&](const std::string &value, const char *label) {
        if (!value.empty() && !validator(value))
        {
            std::string message = "Invalid ";
            message += label;
            message += " binding: ";
            message += value;
            errors.push_back(makeError(path, std::move(message)));
        }
    };
    for (const auto &key : bindings.moveUp)
    {
        validateKey(key, "Move.Up");
    }
    for (const auto &key : bindings.moveDown)
    {
        validateKey(key, "Move.Down");
    }
    for (const auto &key : bindings.moveLeft)
    {
        validateKey(key, "Move.Left");
    }
    for (const auto &key : bindings.moveRight)
    {
        validateKey(key, "Move.Right");
    }
    validateKey(bindings.deployTrap, "DeployTrap");
    validateKey(bindings.toggleDebugHud, "ToggleDebugHud");
    validateKey(bindings.quit, "Quit");
    return bindings;
}

} // namespace

ClientConfigLoader::ClientConfigLoader(std::filesystem::path configRoot)
{
    if (!configRoot.empty())
    {
        m_configRoot = std::move(configRoot);
    }
    else
    {
        m_configRoot = fs::path("config");
    }
    m_configRoot = m_configRoot.lexically_normal();
}

ClientConfigLoadResult ClientConfigLoader::load() const
{
    ClientConfigLoadResult result;
    std::vector<ClientConfigLoadError> errors;

    const fs::path clientPath = m_configRoot / "client.json";
    auto clientJson = readLocalJson(clientPath, errors);
    if (!clientJson || !validateSchema(*clientJson, kClientSchemaVersion, clientPath, errors))
    {
        result.errors = std::move(errors);
        return result;
    }

    const fs::path inputPath = m_configRoot / "input.json";
    auto inputJson = readLocalJson(inputPath, errors);
    if (!inputJson || !validateSchema(*inputJson, kInputSchemaVersion, inputPath, errors))
    {
        result.errors = std::move(errors);
        return result;
    }

    ClientConfig config;
    config.telemetry = parseTelemetry(*clientJson, config.telemetry);
    parseWorld(*clientJson, config.world, clientPath, errors);
    parseMovement(*clientJson, config.movement, clientPath, errors);
    parseNetwork(*clientJson, config.network, clientPath, errors);
    parseTimers(*clientJson, config.timers);
    parseCollectibles(*clientJson, config.collectibles);
    parseCapabilities(*clientJson, config.capabilities, clientPath, errors);
    parseStore(*clientJson, config.store);
    parsePerformance(*clientJson, config.performance);
    parseHud(*clientJson, config.hud);
    config.input = parseInputBindings(*inputJson, m_keyValidator, errors, inputPath);

    if (errors.empty())
    {
        result.config = std::move(config);
    }
    result.errors = std::move(errors);
    result.success = result.errors.empty();
    return result;
}
