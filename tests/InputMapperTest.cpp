#include "input/ActionBuffer.h"
#include "input/InputMapper.h"

#include <iostream>
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

SDL_Event keyDown(SDL_Scancode code, Uint8 repeat = 0)
{
    SDL_Event event{};
    event.type = SDL_KEYDOWN;
    event.key.repeat = repeat;
    event.key.keysym.scancode = code;
    return event;
}

bool testKeyBindingValidation()
{
    bool success = true;
    success &= assertTrue(InputMapper::isValidKeyBinding("Space"), "Space should resolve");
    success &= assertTrue(InputMapper::isValidKeyBinding("F1"), "F1 should resolve");
    success &= assertTrue(InputMapper::isValidKeyBinding("W"), "Letter keys should resolve");
    success &= assertTrue(!InputMapper::isValidKeyBinding("Bogus"), "Unknown names should be rejected");
    success &= assertTrue(!InputMapper::isValidKeyBinding(""), "Empty names should be rejected");
    return success;
}

bool testPressesReachTheBuffer()
{
    InputBindings bindings;
    bindings.bufferFrames = 2;
    InputMapper mapper;
    mapper.configure(bindings);
    ActionBuffer buffer;

    mapper.beginEventPump();
    mapper.handleEvent(keyDown(SDL_SCANCODE_SPACE));
    mapper.handleEvent(keyDown(SDL_SCANCODE_ESCAPE, 1));
    mapper.handleEvent(keyDown(SDL_SCANCODE_Q));
    mapper.sampleFrame(false, 16.0, 1, buffer);

    bool success = true;
    success &= assertTrue(buffer.capacity() == 2, "Sampling should apply the configured capacity");
    success &= assertTrue(buffer.pressedThisFrame(ActionId::DeployTrap), "Bound key press should be buffered");
    success &= assertTrue(!buffer.pressedThisFrame(ActionId::Quit), "Key repeats must be ignored");
    success &= assertTrue(!buffer.moveIntent().active(), "Movement disabled should sample no intent");

    mapper.beginEventPump();
    mapper.sampleFrame(true, 32.0, 2, buffer);
    success &= assertTrue(!buffer.pressedThisFrame(ActionId::DeployTrap), "A press lasts exactly one frame");
    return success;
}

bool testBufferHistory()
{
    ActionBuffer buffer(0);
    bool success = true;
    success &= assertTrue(buffer.capacity() == 1, "Capacity should clamp to one");

    buffer.setCapacity(3);
    MoveIntent right;
    right.x = 4.0f;
    buffer.pushFrame(1, 0.0, right, {});
    buffer.pushFrame(2, 16.0, MoveIntent{}, {ActionEvent{ActionId::Quit, true}});
    buffer.pushFrame(2, 17.0, right, {});
    success &= assertTrue(buffer.size() == 2, "Same sequence should replace the newest frame");
    success &= assertTrue(!buffer.pressedThisFrame(ActionId::Quit), "Replaced frame should drop its events");
    success &= assertTrue(buffer.moveIntent().x == 1.0f, "Move intent should clamp to the unit range");

    buffer.pushFrame(3, 33.0, MoveIntent{}, {});
    buffer.pushFrame(4, 50.0, MoveIntent{}, {});
    success &= assertTrue(buffer.size() == 3, "Oldest frame should be evicted at capacity");
    buffer.expireOlderThan(40.0);
    success &= assertTrue(buffer.size() == 1 && buffer.latest()->sequence == 4, "Expired frames should be dropped");
    buffer.clear();
    success &= assertTrue(buffer.empty() && !buffer.moveIntent().active(), "Cleared buffer has no intent");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testKeyBindingValidation();
    success &= testPressesReachTheBuffer();
    success &= testBufferHistory();
    return success ? 0 : 1;
}
