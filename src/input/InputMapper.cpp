#include "input/InputMapper.h"

#include <utility>

InputMapper::InputMapper()
    : m_bufferFrames(4),
      m_bufferExpiryMs(80.0)
{
}

void InputMapper::configure(const InputBindings &bindings)
{
    m_moveUp = resolveKeys(bindings.moveUp);
    m_moveDown = resolveKeys(bindings.moveDown);
    m_moveLeft = resolveKeys(bindings.moveLeft);
    m_moveRight = resolveKeys(bindings.moveRight);

    m_pressBindings.clear();
    m_pendingEvents.clear();
    bindKey(bindings.deployTrap, ActionId::DeployTrap);
    bindKey(bindings.toggleDebugHud, ActionId::ToggleDebugHud);
    bindKey(bindings.quit, ActionId::Quit);

    const int configuredFrames = bindings.bufferFrames > 0 ? bindings.bufferFrames : 1;
    setBufferFrames(static_cast<std::size_t>(configuredFrames));
    setBufferExpiryMs(static_cast<double>(bindings.bufferExpiryMs));
}

void InputMapper::setBufferFrames(std::size_t frames)
{
    m_bufferFrames = frames == 0 ? 1 : frames;
}

void InputMapper::setBufferExpiryMs(double ms)
{
    m_bufferExpiryMs = ms < 0.0 ? 0.0 : ms;
}

void InputMapper::beginEventPump()
{
    m_pendingEvents.clear();
}

void InputMapper::handleEvent(const SDL_Event &event)
{
    if (event.type != SDL_KEYDOWN || event.key.repeat != 0)
    {
        return;
    }
    const auto it = m_pressBindings.find(event.key.keysym.scancode);
    if (it == m_pressBindings.end())
    {
        return;
    }
    ActionEvent action;
    action.id = it->second;
    action.pressed = true;
    m_pendingEvents.push_back(action);
}

void InputMapper::sampleFrame(bool movementEnabled, double deviceTimestampMs, std::uint64_t frameSequence,
                              ActionBuffer &buffer)
{
    if (buffer.capacity() != m_bufferFrames)
    {
        buffer.setCapacity(m_bufferFrames);
    }
    if (m_bufferExpiryMs > 0.0)
    {
        buffer.expireOlderThan(deviceTimestampMs - m_bufferExpiryMs);
    }

    MoveIntent move;
    const Uint8 *keyboardState = SDL_GetKeyboardState(nullptr);
    if (movementEnabled && keyboardState)
    {
        move.x = (anyDown(m_moveRight, keyboardState) ? 1.0f : 0.0f) - (anyDown(m_moveLeft, keyboardState) ? 1.0f : 0.0f);
        move.y = (anyDown(m_moveDown, keyboardState) ? 1.0f : 0.0f) - (anyDown(m_moveUp, keyboardState) ? 1.0f : 0.0f);
    }

    buffer.pushFrame(frameSequence, deviceTimestampMs, move, std::move(m_pendingEvents));
    m_pendingEvents.clear();
}

bool InputMapper::isValidKeyBinding(const std::string &name)
{
    return !name.empty() && scancodeFromName(name) != SDL_SCANCODE_UNKNOWN;
}

SDL_Scancode InputMapper::scancodeFromName(const std::string &name)
{
    return SDL_GetScancodeFromName(name.c_str());
}

InputMapper::KeyList InputMapper::resolveKeys(const std::vector<std::string> &names)
{
    KeyList keys;
    for (const std::string &name : names)
    {
        if (SDL_Scancode sc = scancodeFromName(name); sc != SDL_SCANCODE_UNKNOWN)
        {
            keys.push_back(sc);
        }
    }
    return keys;
}

bool InputMapper::anyDown(const KeyList &keys, const Uint8 *keyboardState)
{
    for (SDL_Scancode code : keys)
    {
        if (keyboardState[code])
        {
            return true;
        }
    }
    return false;
}

void InputMapper::bindKey(const std::string &name, ActionId action)
{
    if (name.empty())
    {
        return;
    }
    if (SDL_Scancode sc = scancodeFromName(name); sc != SDL_SCANCODE_UNKNOWN)
    {
        m_pressBindings[sc] = action;
    }
}
