#include "motion/RemoteInterpolator.h"

#include <algorithm>

RemoteInterpolator::RemoteInterpolator(float interpolationSpeed, float snapEpsilonPx)
    : m_interpolationSpeed(std::max(0.0f, interpolationSpeed)), m_snapEpsilon(std::max(0.0f, snapEpsilonPx))
{
}

bool RemoteInterpolator::applyPosition(const std::string &id, const Vec2 &position)
{
    if (id.empty() || id == m_localId)
    {
        return false;
    }
    auto it = m_entities.find(id);
    if (it == m_entities.end())
    {
        RemoteEntity entity;
        entity.id = id;
        entity.position = position;
        entity.target = position;
        m_entities.emplace(id, std::move(entity));
        return true;
    }

    RemoteEntity &entity = it->second;
    const Vec2 delta = position - entity.target;
    if (lengthSq(delta) > 0.0f)
    {
        entity.facing = normalize(delta);
    }
    entity.target = position;
    return true;
}

bool RemoteInterpolator::snapTo(const std::string &id, const Vec2 &position)
{
    RemoteEntity *entity = upsert(id);
    if (!entity)
    {
        return false;
    }
    entity->position = position;
    entity->target = position;
    return true;
}

RemoteEntity *RemoteInterpolator::upsert(const std::string &id, const std::string &name)
{
    if (id.empty() || id == m_localId)
    {
        return nullptr;
    }
    auto [it, inserted] = m_entities.try_emplace(id);
    if (inserted)
    {
        it->second.id = id;
    }
    if (!name.empty())
    {
        it->second.name = name;
    }
    return &it->second;
}

bool RemoteInterpolator::remove(const std::string &id)
{
    return m_entities.erase(id) > 0;
}

void RemoteInterpolator::setChaserIds(const std::vector<std::string> &ids)
{
    for (auto &[id, entity] : m_entities)
    {
        entity.chaser = std::find(ids.begin(), ids.end(), id) != ids.end();
    }
}

void RemoteInterpolator::tick(float dt)
{
    const float factor = std::min(1.0f, m_interpolationSpeed * std::max(0.0f, dt));
    for (auto &[id, entity] : m_entities)
    {
        const Vec2 remaining = entity.target - entity.position;
        if (length(remaining) <= m_snapEpsilon)
        {
            entity.position = entity.target;
            continue;
        }
        entity.position += remaining * factor;
    }
}

RemoteEntity *RemoteInterpolator::find(const std::string &id)
{
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

const RemoteEntity *RemoteInterpolator::find(const std::string &id) const
{
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}
