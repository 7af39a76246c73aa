#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/Vec2.h"
#include "telemetry/TelemetrySink.h"
#include "world/WorldGrid.h"

enum class CollectibleKind
{
    Coin,
    TrapPickup,
    DeployedTrap,
    Portal
};

const char *collectibleKindToString(CollectibleKind kind);

struct Collectible
{
    std::string id;
    CollectibleKind kind = CollectibleKind::Coin;
    world::GridCell cell;
    Vec2 position;
    int hue = 0;
    bool collected = false;
    bool confirmed = false;
};

/// Identifies the item a server confirmation refers to. Either key may be missing on legacy shapes.
struct CollectibleKey
{
    std::optional<std::string> id;
    std::optional<world::GridCell> cell;
};

enum class ConfirmOutcome
{
    Applied,
    Duplicate,
    Unmatched
};

/// Ephemeral world objects with optimistic local collection and idempotent server reconciliation.
/// Every id flagged collected or triggered is tombstoned until reset() so it cannot come back.
class CollectibleStore
{
  public:
    explicit CollectibleStore(int tileSize = 64, std::shared_ptr<TelemetrySink> telemetry = nullptr);

    static std::string synthesizeId(CollectibleKind kind, const world::GridCell &cell);

    /// Adds an item, synthesizing an id from the cell when none is given.
    /// Returns false for tombstoned ids and ids already active.
    bool spawn(CollectibleKind kind, const std::optional<std::string> &id, const world::GridCell &cell,
               const std::optional<Vec2> &position = std::nullopt, int hue = 0);

    /// Replaces the whole set of a kind from a snapshot. Tombstoned ids stay out, so locally flagged items stay hidden.
    void replaceAll(CollectibleKind kind, const std::vector<Collectible> &items);

    /// Optimistic local collection. The item disappears from active() immediately.
    bool markCollected(CollectibleKind kind, const std::string &id);

    /// Matches a server confirmation by id+cell, then id, then cell.
    ConfirmOutcome confirm(CollectibleKind kind, const CollectibleKey &key);

    /// Removes the deployed trap closest to from within radius and tombstones it.
    std::optional<Collectible> triggerTrapNear(const Vec2 &from, float radius);

    const Collectible *findWithin(CollectibleKind kind, const Vec2 &from, float radius) const;
    const Collectible *find(CollectibleKind kind, const std::string &id) const;

    /// Items not flagged collected. Flagged items never appear here, pruned or not.
    std::vector<Collectible> active(CollectibleKind kind) const;
    std::size_t activeCount(CollectibleKind kind) const;

    /// Drops flagged items from storage. Returns the number removed.
    std::size_t prune();

    void clearKind(CollectibleKind kind);
    void reset();

    bool isTombstoned(const std::string &id) const;

    [[nodiscard]] int trapInventory() const noexcept { return m_trapInventory; }
    void setTrapInventory(int count);
    /// Decrements the local inventory ahead of the server echo. False when empty.
    bool consumeTrapOptimistic();

  private:
    std::vector<Collectible> &itemsOf(CollectibleKind kind);
    const std::vector<Collectible> &itemsOf(CollectibleKind kind) const;
    void flag(Collectible &item, bool confirmed);
    void report(std::string_view eventName, CollectibleKind kind, const std::string &id, const char *reason) const;

    int m_tileSize;
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::array<std::vector<Collectible>, 4> m_items;
    std::unordered_set<std::string> m_tombstones;
    int m_trapInventory = 0;
};
