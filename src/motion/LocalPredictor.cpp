#include "motion/LocalPredictor.h"

#include <algorithm>
#include <cmath>

#include "motion/Collision.h"
#include "world/GridMapper.h"

LocalPredictor::LocalPredictor(MovementConfig movement, CapabilityFlags capabilities, double positionIntervalMs)
    : m_movement(movement), m_capabilities(capabilities), m_throttle(positionIntervalMs)
{
}

float LocalPredictor::currentSpeed(double elapsedSeconds) const
{
    float speed = m_movement.baseSpeed;
    if (m_chaser)
    {
        speed *= m_movement.chaserSpeedMultiplier;
    }
    if (elapsedSeconds >= static_cast<double>(m_movement.difficultyThresholdSeconds))
    {
        speed *= m_movement.difficultySpeedMultiplier;
    }
    return speed;
}

PredictorTickResult LocalPredictor::tick(const world::WorldGrid &grid, const PredictorInput &input)
{
    PredictorTickResult result;
    const float dt = std::max(0.0f, input.dt);
    m_entity.portalCooldown = std::max(0.0f, m_entity.portalCooldown - dt);

    if (input.frozen || grid.empty())
    {
        m_entity.velocity = {};
        return result;
    }

    const Vec2 direction = normalize({input.intent.x, input.intent.y});
    const bool moving = lengthSq(direction) > 0.0f;
    const float speed = currentSpeed(input.elapsedSeconds);
    m_entity.velocity = direction * speed;

    if (moving)
    {
        m_entity.facing = direction;
        if (m_capabilities.stamina)
        {
            m_entity.stamina = std::min(1.0f, m_entity.stamina + m_movement.staminaRechargePerSecond * dt);
        }

        const world::MoverKind mover = moverKind();
        const Vec2 start = m_entity.position;
        const Vec2 stepX{m_entity.position.x + m_entity.velocity.x * dt, m_entity.position.y};
        if (!boxHitsSolid(grid, stepX, m_movement.hitboxSize, mover))
        {
            m_entity.position.x = stepX.x;
        }
        const Vec2 stepY{m_entity.position.x, m_entity.position.y + m_entity.velocity.y * dt};
        if (!boxHitsSolid(grid, stepY, m_movement.hitboxSize, mover))
        {
            m_entity.position.y = stepY.y;
        }
        if (m_entity.position != start)
        {
            result.moved = true;
            pushTrail();
        }
    }

    const world::GridMapper mapper(grid.tileSize());
    const world::GridCell cell = mapper.toGrid(m_entity.position);
    if (m_capabilities.hazardMode == HazardMode::Lethal && !m_hazardReported &&
        grid.inBounds(cell.row, cell.col) && grid.tile(cell.row, cell.col) == world::TileKind::Lava)
    {
        m_hazardReported = true;
        result.hazardEntered = true;
    }

    if (input.broadcastAllowed && (moving || input.forceAnnounce) && m_throttle.tryAcquire(input.nowMs))
    {
        PositionReport report;
        report.x = m_entity.position.x;
        report.y = m_entity.position.y;
        report.row = cell.row;
        report.col = cell.col;
        report.dirX = m_entity.facing.x;
        report.dirY = m_entity.facing.y;
        report.velocity = moving ? speed : 0.0f;
        report.timestampMs = input.nowMs;
        result.report = report;
    }
    return result;
}

void LocalPredictor::snapTo(const Vec2 &position)
{
    m_entity.position = position;
    m_entity.velocity = {};
    m_entity.trail.clear();
}

bool LocalPredictor::tryUsePortal()
{
    if (m_entity.portalCooldown > 0.0f)
    {
        return false;
    }
    m_entity.portalCooldown = m_movement.portalCooldownSeconds;
    return true;
}

world::MoverKind LocalPredictor::moverKind() const
{
    return m_capabilities.hazardMode == HazardMode::Solid ? world::MoverKind::LocalHazardSolid
                                                          : world::MoverKind::Local;
}

void LocalPredictor::pushTrail()
{
    if (m_movement.trailCapacity == 0)
    {
        return;
    }
    m_entity.trail.push_back(m_entity.position);
    while (m_entity.trail.size() > m_movement.trailCapacity)
    {
        m_entity.trail.pop_front();
    }
}
