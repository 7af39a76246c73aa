#include "motion/RemoteInterpolator.h"

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

bool testSparseUpdates()
{
    RemoteInterpolator interpolator(10.0f, 1.0f);
    bool success = true;
    success &= assertTrue(interpolator.applyPosition("p2", {0.0f, 0.0f}), "First update should insert");
    success &= assertTrue(interpolator.applyPosition("p2", {100.0f, 0.0f}), "Second update should retarget");

    const RemoteEntity *entity = interpolator.find("p2");
    if (!assertTrue(entity != nullptr, "Entity missing after insert"))
    {
        return false;
    }
    success &= assertTrue(almostEqual(entity->position.x, 0.0f), "Update should not move the current position");
    success &= assertTrue(almostEqual(entity->target.x, 100.0f), "Update should move the target");
    success &= assertTrue(almostEqual(entity->facing.x, 1.0f), "Facing should follow the target delta");

    interpolator.tick(0.05f);
    success &= assertTrue(almostEqual(interpolator.find("p2")->position.x, 50.0f),
                          "Half the gap should close at speed 10 over 50ms");
    return success;
}

bool testConvergence()
{
    RemoteInterpolator interpolator(10.0f, 1.0f);
    interpolator.applyPosition("p2", {0.0f, 0.0f});
    interpolator.applyPosition("p2", {64.0f, -32.0f});
    for (int i = 0; i < 120; ++i)
    {
        interpolator.tick(1.0f / 60.0f);
    }
    const RemoteEntity *entity = interpolator.find("p2");
    bool success = true;
    success &= assertTrue(almostEqual(entity->position.x, 64.0f) && almostEqual(entity->position.y, -32.0f),
                          "Entity should settle exactly on the target");

    interpolator.tick(10.0f);
    success &= assertTrue(almostEqual(entity->position.x, 64.0f), "Large dt must not overshoot");
    success &= assertTrue(interpolator.size() == 1, "Idle entities are kept");
    return success;
}

bool testLocalIdIgnored()
{
    RemoteInterpolator interpolator;
    interpolator.setLocalId("me");
    bool success = true;
    success &= assertTrue(!interpolator.applyPosition("me", {10.0f, 10.0f}), "Local updates are ignored");
    success &= assertTrue(interpolator.upsert("me") == nullptr, "Local id cannot be upserted");
    success &= assertTrue(!interpolator.applyPosition("", {10.0f, 10.0f}), "Empty id is ignored");
    success &= assertTrue(interpolator.size() == 0, "No entities should have been created");
    return success;
}

bool testSnapAndRoles()
{
    RemoteInterpolator interpolator;
    interpolator.upsert("p2", "Bot");
    interpolator.upsert("p3");
    interpolator.applyPosition("p2", {10.0f, 10.0f});
    interpolator.applyPosition("p2", {90.0f, 10.0f});
    interpolator.snapTo("p2", {500.0f, 600.0f});

    const RemoteEntity *entity = interpolator.find("p2");
    bool success = true;
    success &= assertTrue(entity->name == "Bot", "Upsert should keep the display name");
    success &= assertTrue(almostEqual(entity->position.x, 500.0f) && almostEqual(entity->target.y, 600.0f),
                          "Snap should move position and target together");

    interpolator.setChaserIds({"p3"});
    success &= assertTrue(!interpolator.find("p2")->chaser && interpolator.find("p3")->chaser,
                          "Chaser flags should follow the id set");

    success &= assertTrue(interpolator.remove("p3"), "Remove should drop a known id");
    success &= assertTrue(!interpolator.remove("p3"), "Second remove is a no-op");
    success &= assertTrue(interpolator.find("p3") == nullptr, "Removed entity should be gone");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testSparseUpdates();
    success &= testConvergence();
    success &= testLocalIdIgnored();
    success &= testSnapAndRoles();
    return success ? 0 : 1;
}
