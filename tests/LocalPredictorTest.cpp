#include "motion/Collision.h"
#include "motion/LocalPredictor.h"

#include <cmath>
#include <iostream>

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

bool almostEqual(float lhs, float rhs, float epsilon = 1e-3f)
{
    return std::fabs(lhs - rhs) <= epsilon;
}

/// 10x10 road field with tile 64. Callers paint obstacles on top.
world::WorldGrid openField()
{
    world::WorldGrid grid(10, 10, 64, 4);
    for (int row = 0; row < grid.height(); ++row)
    {
        for (int col = 0; col < grid.width(); ++col)
        {
            grid.setTile(row, col, world::TileKind::Road);
        }
    }
    return grid;
}

LocalPredictor makePredictor(CapabilityFlags capabilities = {})
{
    MovementConfig movement;
    movement.baseSpeed = 300.0f;
    movement.hitboxSize = 24.0f;
    movement.trailCapacity = 3;
    movement.portalCooldownSeconds = 2.0f;
    return LocalPredictor(movement, capabilities, 20.0);
}

PredictorInput moveRight(double nowMs, float dt = 0.1f)
{
    PredictorInput input;
    input.intent.x = 1.0f;
    input.dt = dt;
    input.nowMs = nowMs;
    input.broadcastAllowed = true;
    return input;
}

bool testMovementAndReport()
{
    const world::WorldGrid grid = openField();
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({320.0f, 352.0f});

    const PredictorTickResult result = predictor.tick(grid, moveRight(0.0));
    bool success = true;
    success &= assertTrue(result.moved, "Predictor should move on open road");
    success &= assertTrue(almostEqual(predictor.entity().position.x, 350.0f), "Expected 30px of travel at 300px/s");
    success &= assertTrue(almostEqual(predictor.entity().position.y, 352.0f), "Vertical position should not change");
    success &= assertTrue(predictor.entity().trail.size() == 1, "Trail should record the move");
    success &= assertTrue(result.report.has_value(), "First move should produce a position report");
    if (result.report)
    {
        success &= assertTrue(result.report->row == 5 && result.report->col == 5, "Report should carry the grid cell");
        success &= assertTrue(almostEqual(result.report->dirX, 1.0f), "Report should carry the facing");
        success &= assertTrue(almostEqual(result.report->velocity, 300.0f), "Report should carry the speed");
    }
    return success;
}

bool testReportThrottle()
{
    const world::WorldGrid grid = openField();
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({128.0f, 352.0f});

    bool success = true;
    success &= assertTrue(predictor.tick(grid, moveRight(0.0, 0.01f)).report.has_value(), "First report expected");
    success &= assertTrue(!predictor.tick(grid, moveRight(10.0, 0.01f)).report.has_value(),
                          "Report inside the interval should be suppressed");
    success &= assertTrue(predictor.tick(grid, moveRight(20.0, 0.01f)).report.has_value(),
                          "Report after the interval should pass");
    success &= assertTrue(predictor.throttle().acceptedCount() == 2, "Throttle should count two accepted reports");

    PredictorInput muted = moveRight(100.0, 0.01f);
    muted.broadcastAllowed = false;
    success &= assertTrue(!predictor.tick(grid, muted).report.has_value(), "No report while broadcast is disallowed");

    PredictorInput idle;
    idle.dt = 0.01f;
    idle.nowMs = 200.0;
    idle.broadcastAllowed = true;
    success &= assertTrue(!predictor.tick(grid, idle).report.has_value(), "Idle ticks should not report");
    idle.nowMs = 300.0;
    idle.forceAnnounce = true;
    success &= assertTrue(predictor.tick(grid, idle).report.has_value(), "Forced announce reports without moving");
    return success;
}

bool testBurstOfMovesIsThrottled()
{
    const world::WorldGrid grid = openField();
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({128.0f, 352.0f});

    // 100 position changes 3ms apart against a 20ms interval.
    int reports = 0;
    double lastMs = 0.0;
    for (int i = 0; i < 100; ++i)
    {
        lastMs = i * 3.0;
        const PredictorTickResult result = predictor.tick(grid, moveRight(lastMs, 0.001f));
        if (result.report)
        {
            ++reports;
        }
    }
    const int ceiling = static_cast<int>(std::floor(lastMs / 20.0)) + 1;
    bool success = true;
    success &= assertTrue(reports > 1, "Reports should keep flowing through a burst");
    success &= assertTrue(reports <= ceiling, "Burst must not exceed one report per interval");
    success &= assertTrue(predictor.throttle().acceptedCount() == static_cast<std::size_t>(reports),
                          "Throttle should count every sent report");
    return success;
}

bool testWallBlocksAxis()
{
    world::WorldGrid grid = openField();
    grid.setTile(5, 6, world::TileKind::Building);
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({360.0f, 352.0f});

    PredictorInput input = moveRight(0.0);
    input.intent.y = 1.0f;
    const PredictorTickResult result = predictor.tick(grid, input);
    bool success = true;
    success &= assertTrue(almostEqual(predictor.entity().position.x, 360.0f), "Wall should stop the x axis");
    success &= assertTrue(predictor.entity().position.y > 352.0f, "Free y axis should still slide");
    success &= assertTrue(result.moved, "Sliding along a wall counts as movement");
    success &= assertTrue(boxHitsSolid(grid, {380.0f, 352.0f}, 24.0f, world::MoverKind::Remote),
                          "Box overlapping a building is blocked");
    success &= assertTrue(!boxHitsSolid(grid, {350.0f, 352.0f}, 24.0f, world::MoverKind::Remote),
                          "Box clear of the building is free");
    return success;
}

bool testLethalHazard()
{
    world::WorldGrid grid = openField();
    grid.setTile(5, 6, world::TileKind::Lava);
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({370.0f, 352.0f});

    bool success = true;
    const PredictorTickResult entered = predictor.tick(grid, moveRight(0.0));
    success &= assertTrue(entered.hazardEntered, "Entering lava should be reported");
    success &= assertTrue(almostEqual(predictor.entity().position.x, 400.0f), "Lethal lava does not block the mover");

    PredictorInput idle;
    idle.dt = 0.016f;
    success &= assertTrue(!predictor.tick(grid, idle).hazardEntered, "Hazard should be reported once");
    predictor.clearHazardReport();
    success &= assertTrue(predictor.tick(grid, idle).hazardEntered, "Clearing the report re-arms it");
    return success;
}

bool testSolidHazard()
{
    world::WorldGrid grid = openField();
    grid.setTile(5, 6, world::TileKind::Lava);
    CapabilityFlags capabilities;
    capabilities.hazardMode = HazardMode::Solid;
    LocalPredictor predictor = makePredictor(capabilities);
    predictor.snapTo({370.0f, 352.0f});

    const PredictorTickResult result = predictor.tick(grid, moveRight(0.0));
    bool success = true;
    success &= assertTrue(!result.hazardEntered, "Solid lava is never entered");
    success &= assertTrue(almostEqual(predictor.entity().position.x, 370.0f), "Solid lava blocks like a wall");
    return success;
}

bool testFrozenAndSpeed()
{
    const world::WorldGrid grid = openField();
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({320.0f, 352.0f});

    PredictorInput frozen = moveRight(0.0);
    frozen.frozen = true;
    const PredictorTickResult result = predictor.tick(grid, frozen);
    bool success = true;
    success &= assertTrue(!result.moved && !result.report, "Frozen predictor neither moves nor reports");
    success &= assertTrue(almostEqual(predictor.entity().position.x, 320.0f), "Frozen predictor keeps its position");

    success &= assertTrue(almostEqual(predictor.currentSpeed(0.0), 300.0f), "Base speed before the threshold");
    success &= assertTrue(almostEqual(predictor.currentSpeed(31.0), 360.0f), "Difficulty multiplier after 30s");
    return success;
}

bool testTrailAndPortalCooldown()
{
    const world::WorldGrid grid = openField();
    LocalPredictor predictor = makePredictor();
    predictor.snapTo({128.0f, 352.0f});
    for (int i = 0; i < 5; ++i)
    {
        predictor.tick(grid, moveRight(i * 100.0, 0.01f));
    }
    bool success = true;
    success &= assertTrue(predictor.entity().trail.size() == 3, "Trail should be capped at its capacity");

    predictor.snapTo({200.0f, 352.0f});
    success &= assertTrue(predictor.entity().trail.empty(), "Snap should clear the trail");

    success &= assertTrue(predictor.tryUsePortal(), "First portal use should succeed");
    success &= assertTrue(!predictor.tryUsePortal(), "Portal should be cooling down");
    PredictorInput idle;
    idle.dt = 2.0f;
    predictor.tick(grid, idle);
    success &= assertTrue(predictor.tryUsePortal(), "Cooldown should expire after two seconds");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testMovementAndReport();
    success &= testReportThrottle();
    success &= testBurstOfMovesIsThrottled();
    success &= testWallBlocksAxis();
    success &= testLethalHazard();
    success &= testSolidHazard();
    success &= testFrozenAndSpeed();
    success &= testTrailAndPortalCooldown();
    return success ? 0 : 1;
}
