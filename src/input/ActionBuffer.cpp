#include "input/ActionBuffer.h"

#include <algorithm>

namespace
{

constexpr std::size_t clampCapacity(std::size_t capacity)
{
    return capacity == 0 ? 1 : capacity;
}

} // namespace

ActionBuffer::ActionBuffer(std::size_t capacity)
    : m_capacity(clampCapacity(capacity))
{
}

void ActionBuffer::setCapacity(std::size_t capacity)
{
    m_capacity = clampCapacity(capacity);
    while (m_frames.size() > m_capacity)
    {
        m_frames.pop_front();
    }
}

void ActionBuffer::clear()
{
    m_frames.clear();
}

void ActionBuffer::pushFrame(std::uint64_t sequence, double deviceTimestampMs, const MoveIntent &move,
                             std::vector<ActionEvent> events)
{
    Frame frame;
    frame.sequence = sequence;
    frame.deviceTimestampMs = deviceTimestampMs;
    frame.move = move;
    frame.events = std::move(events);

    if (!m_frames.empty() && m_frames.back().sequence == sequence)
    {
        m_frames.back() = std::move(frame);
    }
    else
    {
        m_frames.push_back(std::move(frame));
    }

    while (m_frames.size() > m_capacity)
    {
        m_frames.pop_front();
    }
}

void ActionBuffer::expireOlderThan(double minTimestampMs)
{
    while (!m_frames.empty() && m_frames.front().deviceTimestampMs < minTimestampMs)
    {
        m_frames.pop_front();
    }
}

const ActionBuffer::Frame *ActionBuffer::latest() const
{
    if (m_frames.empty())
    {
        return nullptr;
    }
    return &m_frames.back();
}

MoveIntent ActionBuffer::moveIntent() const
{
    const Frame *frame = latest();
    if (!frame)
    {
        return {};
    }
    MoveIntent intent;
    intent.x = std::clamp(frame->move.x, -1.0f, 1.0f);
    intent.y = std::clamp(frame->move.y, -1.0f, 1.0f);
    return intent;
}

bool ActionBuffer::pressedThisFrame(ActionId id) const
{
    const Frame *frame = latest();
    if (!frame)
    {
        return false;
    }
    return std::any_of(frame->events.begin(), frame->events.end(),
                       [id](const ActionEvent &event) { return event.id == id && event.pressed; });
}
