#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class HazardMode : std::uint8_t
{
    Lethal,
    Solid
};

const char *hazardModeToString(HazardMode mode);
std::optional<HazardMode> hazardModeFromString(const std::string &id);

struct TelemetryOptions
{
    std::string sink = "console";
    std::string outputDirectory = "build/session_logs";
    std::uintmax_t rotationBytes = 4ull * 1024ull * 1024ull;
    std::size_t maxFiles = 8;
    /// Event name prefixes the console sink counts without printing.
    std::vector<std::string> consoleMuted;
};

struct WorldConfig
{
    int width = 50;
    int height = 50;
    int blockSize = 4;
    int tileSize = 64;
    int portalCount = 4;
};

struct MovementConfig
{
    float baseSpeed = 300.0f;
    float chaserSpeedMultiplier = 1.0f;
    float difficultySpeedMultiplier = 1.2f;
    float difficultyThresholdSeconds = 30.0f;
    float hitboxSize = 24.0f;
    std::size_t trailCapacity = 20;
    float portalCooldownSeconds = 2.0f;
    float staminaRechargePerSecond = 0.3f;
};

struct NetworkConfig
{
    double positionIntervalMs = 20.0;
    float interpolationSpeed = 10.0f;
    float snapEpsilonPx = 1.0f;
};

struct TimerConfig
{
    double penaltyQuizFallbackMs = 3000.0;
    double snapshotPenaltyRequestMs = 500.0;
    double roleAnnouncementMs = 3000.0;
    double roleAnnouncementOtherMs = 2000.0;
    double huntStartAnnouncementCapMs = 1500.0;
    double screenFlashMs = 300.0;
    double invulnerabilityMs = 3000.0;
    double roomClosedReturnMs = 2000.0;
};

struct CollectibleConfig
{
    float currencyPickupRadius = 25.0f;
    float trapPickupRadius = 30.0f;
    float trapMatchRadius = 32.0f;
    float portalRadius = 20.0f;
    int trapInventoryMax = 3;
};

/// Behaviour that differs between game variants. Toggled per match, never forked in code.
struct CapabilityFlags
{
    bool invulnerability = true;
    bool stamina = false;
    HazardMode hazardMode = HazardMode::Lethal;
};

struct StoreConfig
{
    std::string path = "client_store.json";
    std::size_t leaderboardCapacity = 20;
};

struct PerformanceBudgetConfig
{
    float pumpMs = 2.0f;
    float simulateMs = 4.0f;
    float renderMs = 8.0f;
    float toleranceMs = 0.5f;
};

struct HudConfig
{
    std::string fontPath = "assets/ui/hud.ttf";
    int pointSize = 16;
};

struct InputBindings
{
    std::vector<std::string> moveUp{"W", "Up"};
    std::vector<std::string> moveDown{"S", "Down"};
    std::vector<std::string> moveLeft{"A", "Left"};
    std::vector<std::string> moveRight{"D", "Right"};
    std::string deployTrap = "Space";
    std::string toggleDebugHud = "F1";
    std::string quit = "Escape";
    int bufferFrames = 4;
    float bufferExpiryMs = 80.0f;
};

struct ClientConfig
{
    TelemetryOptions telemetry{};
    WorldConfig world{};
    MovementConfig movement{};
    NetworkConfig network{};
    TimerConfig timers{};
    CollectibleConfig collectibles{};
    CapabilityFlags capabilities{};
    StoreConfig store{};
    PerformanceBudgetConfig performance{};
    HudConfig hud{};
    InputBindings input{};
};
