#pragma once

#include "config/ClientConfig.h"
#include "input/ActionBuffer.h"

#include <SDL.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

/// Maps SDL keyboard state onto a movement intent and single-press match actions.
class InputMapper
{
  public:
    InputMapper();

    void configure(const InputBindings &bindings);

    void setBufferFrames(std::size_t frames);
    void setBufferExpiryMs(double ms);

    void beginEventPump();
    void handleEvent(const SDL_Event &event);

    /// Movement axes are sampled only when movementEnabled; presses are always kept.
    void sampleFrame(bool movementEnabled, double deviceTimestampMs, std::uint64_t frameSequence,
                     ActionBuffer &buffer);

    /// True for names SDL resolves to a scancode. Used to validate config/input.json.
    static bool isValidKeyBinding(const std::string &name);

    std::size_t bufferFrames() const { return m_bufferFrames; }
    double bufferExpiryMs() const { return m_bufferExpiryMs; }

  private:
    using KeyList = std::vector<SDL_Scancode>;

    static SDL_Scancode scancodeFromName(const std::string &name);
    static KeyList resolveKeys(const std::vector<std::string> &names);
    static bool anyDown(const KeyList &keys, const Uint8 *keyboardState);

    void bindKey(const std::string &name, ActionId action);

    KeyList m_moveUp;
    KeyList m_moveDown;
    KeyList m_moveLeft;
    KeyList m_moveRight;
    std::unordered_map<SDL_Scancode, ActionId> m_pressBindings;
    std::vector<ActionEvent> m_pendingEvents;

    std::size_t m_bufferFrames;
    double m_bufferExpiryMs;
};
