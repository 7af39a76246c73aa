#include "match/CollectibleStore.h"

#include <algorithm>
#include <utility>

#include "world/GridMapper.h"

namespace
{

std::size_t kindIndex(CollectibleKind kind)
{
    return static_cast<std::size_t>(kind);
}

const char *idPrefix(CollectibleKind kind)
{
    switch (kind)
    {
    case CollectibleKind::Coin:
        return "coin_";
    case CollectibleKind::TrapPickup:
        return "trap_";
    case CollectibleKind::DeployedTrap:
        return "deployed_";
    case CollectibleKind::Portal:
        return "sinkhole_";
    }
    return "item_";
}

} // namespace

const char *collectibleKindToString(CollectibleKind kind)
{
    switch (kind)
    {
    case CollectibleKind::Coin:
        return "coin";
    case CollectibleKind::TrapPickup:
        return "trap_pickup";
    case CollectibleKind::DeployedTrap:
        return "deployed_trap";
    case CollectibleKind::Portal:
        return "portal";
    }
    return "unknown";
}

CollectibleStore::CollectibleStore(int tileSize, std::shared_ptr<TelemetrySink> telemetry)
    : m_tileSize(tileSize > 0 ? tileSize : 64), m_telemetry(std::move(telemetry))
{
}

std::string CollectibleStore::synthesizeId(CollectibleKind kind, const world::GridCell &cell)
{
    return std::string(idPrefix(kind)) + std::to_string(cell.row) + "_" + std::to_string(cell.col);
}

bool CollectibleStore::spawn(CollectibleKind kind, const std::optional<std::string> &id, const world::GridCell &cell,
                             const std::optional<Vec2> &position, int hue)
{
    const std::string itemId = id && !id->empty() ? *id : synthesizeId(kind, cell);
    if (isTombstoned(itemId))
    {
        report("collectible.spawn_ignored", kind, itemId, "tombstoned");
        return false;
    }

    auto &items = itemsOf(kind);
    const auto existing =
        std::find_if(items.begin(), items.end(), [&](const Collectible &item) { return item.id == itemId; });
    if (existing != items.end())
    {
        return false;
    }

    Collectible item;
    item.id = itemId;
    item.kind = kind;
    item.cell = cell;
    item.position = position ? *position : world::GridMapper(m_tileSize).toPixel(cell);
    item.hue = hue;
    items.push_back(std::move(item));
    return true;
}

void CollectibleStore::replaceAll(CollectibleKind kind, const std::vector<Collectible> &items)
{
    std::vector<Collectible> merged;
    merged.reserve(items.size());
    for (const Collectible &incoming : items)
    {
        if (incoming.id.empty() || isTombstoned(incoming.id))
        {
            continue;
        }
        Collectible item = incoming;
        item.kind = kind;
        item.collected = false;
        item.confirmed = false;
        merged.push_back(std::move(item));
    }
    itemsOf(kind) = std::move(merged);
}

bool CollectibleStore::markCollected(CollectibleKind kind, const std::string &id)
{
    auto &items = itemsOf(kind);
    auto it = std::find_if(items.begin(), items.end(), [&](const Collectible &item) { return item.id == id; });
    if (it == items.end() || it->collected)
    {
        return false;
    }
    flag(*it, false);
    return true;
}

ConfirmOutcome CollectibleStore::confirm(CollectibleKind kind, const CollectibleKey &key)
{
    auto &items = itemsOf(kind);
    auto match = items.end();
    if (key.id && key.cell)
    {
        match = std::find_if(items.begin(), items.end(),
                             [&](const Collectible &item) { return item.id == *key.id && item.cell == *key.cell; });
    }
    if (match == items.end() && key.id)
    {
        match = std::find_if(items.begin(), items.end(), [&](const Collectible &item) { return item.id == *key.id; });
    }
    if (match == items.end() && key.cell)
    {
        // Positional matches prefer live items so a stale flagged entry does not shadow a fresh one.
        match = std::find_if(items.begin(), items.end(),
                             [&](const Collectible &item) { return !item.collected && item.cell == *key.cell; });
        if (match == items.end())
        {
            match = std::find_if(items.begin(), items.end(), [&](const Collectible &item) {
                return item.cell == *key.cell && !item.confirmed;
            });
        }
    }

    if (match == items.end())
    {
        if (key.id && isTombstoned(*key.id))
        {
            return ConfirmOutcome::Duplicate;
        }
        report("collectible.confirm_unmatched", kind, key.id.value_or(""), "unknown_item");
        return ConfirmOutcome::Unmatched;
    }
    if (match->confirmed)
    {
        return ConfirmOutcome::Duplicate;
    }
    flag(*match, true);
    return ConfirmOutcome::Applied;
}

std::optional<Collectible> CollectibleStore::triggerTrapNear(const Vec2 &from, float radius)
{
    auto &items = itemsOf(CollectibleKind::DeployedTrap);
    auto best = items.end();
    float bestDistance = radius;
    for (auto it = items.begin(); it != items.end(); ++it)
    {
        if (it->collected)
        {
            continue;
        }
        const float d = distance(it->position, from);
        if (d <= bestDistance)
        {
            bestDistance = d;
            best = it;
        }
    }
    if (best == items.end())
    {
        return std::nullopt;
    }
    flag(*best, true);
    return *best;
}

const Collectible *CollectibleStore::findWithin(CollectibleKind kind, const Vec2 &from, float radius) const
{
    for (const Collectible &item : itemsOf(kind))
    {
        if (!item.collected && distance(item.position, from) < radius)
        {
            return &item;
        }
    }
    return nullptr;
}

const Collectible *CollectibleStore::find(CollectibleKind kind, const std::string &id) const
{
    for (const Collectible &item : itemsOf(kind))
    {
        if (item.id == id)
        {
            return &item;
        }
    }
    return nullptr;
}

std::vector<Collectible> CollectibleStore::active(CollectibleKind kind) const
{
    std::vector<Collectible> result;
    for (const Collectible &item : itemsOf(kind))
    {
        if (!item.collected)
        {
            result.push_back(item);
        }
    }
    return result;
}

std::size_t CollectibleStore::activeCount(CollectibleKind kind) const
{
    const auto &items = itemsOf(kind);
    return static_cast<std::size_t>(
        std::count_if(items.begin(), items.end(), [](const Collectible &item) { return !item.collected; }));
}

std::size_t CollectibleStore::prune()
{
    std::size_t removed = 0;
    for (auto &items : m_items)
    {
        const auto before = items.size();
        items.erase(std::remove_if(items.begin(), items.end(), [](const Collectible &item) { return item.collected; }),
                    items.end());
        removed += before - items.size();
    }
    return removed;
}

void CollectibleStore::clearKind(CollectibleKind kind)
{
    itemsOf(kind).clear();
}

void CollectibleStore::reset()
{
    for (auto &items : m_items)
    {
        items.clear();
    }
    m_tombstones.clear();
    m_trapInventory = 0;
}

bool CollectibleStore::isTombstoned(const std::string &id) const
{
    return m_tombstones.find(id) != m_tombstones.end();
}

void CollectibleStore::setTrapInventory(int count)
{
    m_trapInventory = std::max(0, count);
}

bool CollectibleStore::consumeTrapOptimistic()
{
    if (m_trapInventory <= 0)
    {
        return false;
    }
    --m_trapInventory;
    return true;
}

std::vector<Collectible> &CollectibleStore::itemsOf(CollectibleKind kind)
{
    return m_items[kindIndex(kind)];
}

const std::vector<Collectible> &CollectibleStore::itemsOf(CollectibleKind kind) const
{
    return m_items[kindIndex(kind)];
}

void CollectibleStore::flag(Collectible &item, bool confirmed)
{
    item.collected = true;
    item.confirmed = item.confirmed || confirmed;
    m_tombstones.insert(item.id);
}

void CollectibleStore::report(std::string_view eventName, CollectibleKind kind, const std::string &id,
                              const char *reason) const
{
    recordTelemetry(m_telemetry, eventName, {{"kind", collectibleKindToString(kind)}, {"id", id}, {"reason", reason}});
}
