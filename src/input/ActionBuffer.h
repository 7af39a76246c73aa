#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "motion/LocalPredictor.h"

enum class ActionId : std::uint8_t
{
    DeployTrap = 0,
    ToggleDebugHud,
    Quit,
    Count
};

struct ActionEvent
{
    ActionId id = ActionId::DeployTrap;
    bool pressed = false;
};

/// Short history of sampled input frames. Frames older than the expiry window are dropped.
class ActionBuffer
{
  public:
    struct Frame
    {
        std::uint64_t sequence = 0;
        double deviceTimestampMs = 0.0;
        MoveIntent move;
        std::vector<ActionEvent> events;
    };

    explicit ActionBuffer(std::size_t capacity = 4);

    void setCapacity(std::size_t capacity);
    std::size_t capacity() const { return m_capacity; }

    void clear();

    /// A frame with the same sequence as the newest one replaces it.
    void pushFrame(std::uint64_t sequence, double deviceTimestampMs, const MoveIntent &move,
                   std::vector<ActionEvent> events);

    void expireOlderThan(double minTimestampMs);

    bool empty() const { return m_frames.empty(); }
    std::size_t size() const { return m_frames.size(); }
    const Frame *latest() const;

    MoveIntent moveIntent() const;
    bool pressedThisFrame(ActionId id) const;

  private:
    std::size_t m_capacity;
    std::deque<Frame> m_frames;
};
