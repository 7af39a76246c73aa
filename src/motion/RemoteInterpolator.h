#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Vec2.h"

struct RemoteEntity
{
    std::string id;
    std::string name;
    Vec2 position;
    Vec2 target;
    Vec2 facing{0.0f, 1.0f};
    bool chaser = false;
    bool frozen = false;
    bool eliminated = false;
    bool disconnected = false;
    double invulnerableUntilMs = 0.0;

    [[nodiscard]] bool invulnerableAt(double nowMs) const noexcept { return nowMs < invulnerableUntilMs; }
};

/// Keyed table of remote players. Entities leave only through remove(); idle entities are kept.
class RemoteInterpolator
{
  public:
    RemoteInterpolator(float interpolationSpeed = 10.0f, float snapEpsilonPx = 1.0f);

    void setLocalId(std::string id) { m_localId = std::move(id); }
    const std::string &localId() const { return m_localId; }

    /// Sparse update: inserts unseen ids at the reported position, otherwise moves only the target.
    /// Updates for the local id are ignored and return false.
    bool applyPosition(const std::string &id, const Vec2 &position);

    /// Teleport, respawn and trap corrections: current and target both jump.
    bool snapTo(const std::string &id, const Vec2 &position);

    /// Creates the record when missing. Returns nullptr for the local id.
    RemoteEntity *upsert(const std::string &id, const std::string &name = {});
    bool remove(const std::string &id);
    void clear() { m_entities.clear(); }

    void setChaserIds(const std::vector<std::string> &ids);

    void tick(float dt);

    RemoteEntity *find(const std::string &id);
    const RemoteEntity *find(const std::string &id) const;
    const std::map<std::string, RemoteEntity> &entities() const { return m_entities; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entities.size(); }

  private:
    float m_interpolationSpeed;
    float m_snapEpsilon;
    std::string m_localId;
    std::map<std::string, RemoteEntity> m_entities;
};
