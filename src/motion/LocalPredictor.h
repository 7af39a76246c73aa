#pragma once

#include <cstddef>
#include <deque>
#include <optional>

#include "config/ClientConfig.h"
#include "core/Vec2.h"
#include "motion/PositionThrottle.h"
#include "world/WorldGrid.h"

struct MoveIntent
{
    float x = 0.0f;
    float y = 0.0f;

    [[nodiscard]] bool active() const noexcept { return x != 0.0f || y != 0.0f; }
};

struct LocalEntity
{
    Vec2 position;
    Vec2 velocity;
    Vec2 facing{0.0f, 1.0f};
    std::deque<Vec2> trail;
    float portalCooldown = 0.0f;
    float stamina = 0.0f;
};

/// Wire shape of an outgoing position report. Pixel and grid cell are both carried.
struct PositionReport
{
    float x = 0.0f;
    float y = 0.0f;
    int row = 0;
    int col = 0;
    float dirX = 0.0f;
    float dirY = 0.0f;
    float velocity = 0.0f;
    double timestampMs = 0.0;
};

/// Per-tick gating decided by the session from the phase machine and the channel.
struct PredictorInput
{
    MoveIntent intent;
    float dt = 0.0f;
    double nowMs = 0.0;
    double elapsedSeconds = 0.0;
    bool frozen = false;
    bool broadcastAllowed = false;
    bool forceAnnounce = false;
};

struct PredictorTickResult
{
    bool moved = false;
    bool hazardEntered = false;
    std::optional<PositionReport> report;
};

class LocalPredictor
{
  public:
    LocalPredictor(MovementConfig movement, CapabilityFlags capabilities, double positionIntervalMs);

    PredictorTickResult tick(const world::WorldGrid &grid, const PredictorInput &input);

    /// Server correction: replaces the position and clears the trail in one step.
    void snapTo(const Vec2 &position);

    void setChaser(bool chaser) { m_chaser = chaser; }
    [[nodiscard]] bool chaser() const noexcept { return m_chaser; }
    float currentSpeed(double elapsedSeconds) const;

    /// Re-arms the hazard report after a respawn or a resolved penalty quiz.
    void clearHazardReport() { m_hazardReported = false; }
    [[nodiscard]] bool hazardReported() const noexcept { return m_hazardReported; }

    /// Arms the portal cooldown when it has expired. Returns false while still cooling down.
    bool tryUsePortal();

    void resetThrottle() { m_throttle.reset(); }

    const LocalEntity &entity() const { return m_entity; }
    const PositionThrottle &throttle() const { return m_throttle; }
    const MovementConfig &movement() const { return m_movement; }

  private:
    world::MoverKind moverKind() const;
    void pushTrail();

    MovementConfig m_movement;
    CapabilityFlags m_capabilities;
    PositionThrottle m_throttle;
    LocalEntity m_entity;
    bool m_chaser = false;
    bool m_hazardReported = false;
};
