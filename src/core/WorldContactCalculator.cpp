#include "WorldContactCalculator.h"
#include "Grid.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"
#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>

namespace SandSim {

namespace {

struct PendingBlast {
    Vector2i center;
    MaterialId material;
    ExplodeContact effect;
};

} // namespace

bool WorldContactCalculator::blastReaches(Vector2i center, float radius, const DirtyRect& rect)
{
    if (rect.isEmpty()) {
        return false;
    }
    const int nearestX = std::clamp(center.x, rect.minX, rect.maxX);
    const int nearestY = std::clamp(center.y, rect.minY, rect.maxY);
    const float dx = static_cast<float>(nearestX - center.x);
    const float dy = static_cast<float>(nearestY - center.y);
    return dx * dx + dy * dy <= radius * radius;
}

std::vector<WorldEvent> WorldContactCalculator::resolve(
    Grid& grid, const std::vector<ActorHitbox>& hitboxes, uint32_t tick)
{
    std::vector<WorldEvent> events;
    std::vector<PendingBlast> blasts;
    const auto& registry = grid.registry();
    auto logger = LoggingChannels::contact();

    for (const auto& hitbox : hitboxes) {
        if (hitbox.rect.isEmpty()) {
            continue;
        }

        std::map<MaterialId, ContactEvent> touching;
        grid.regionQuery(hitbox.rect.expanded(1), [&](Vector2i where, const Cell& cell) {
            if (cell.isEmpty()) {
                return;
            }
            const auto& material = registry.get(cell.material);
            if (!material.contact) {
                return;
            }

            if (const auto* explode = std::get_if<ExplodeContact>(&*material.contact)) {
                const bool queued = std::any_of(blasts.begin(), blasts.end(), [&](const auto& b) {
                    return b.center == where;
                });
                if (!queued) {
                    blasts.push_back({ where, cell.material, *explode });
                }
                return;
            }

            auto& event = touching[cell.material];
            event.tick = tick;
            event.actor_id = hitbox.actor_id;
            event.material = cell.material;
            event.cell_count++;
            if (const auto* damage = std::get_if<DamageContact>(&*material.contact)) {
                event.kind = ContactKind::Damage;
                event.amount += damage->amount;
            }
            else if (const auto* heal = std::get_if<HealContact>(&*material.contact)) {
                event.kind = ContactKind::Heal;
                event.amount += heal->amount;
            }
        });

        for (auto& [materialId, event] : touching) {
            logger->debug(
                "Actor {} touched {} x{} ({} {})",
                event.actor_id,
                registry.get(materialId).name,
                event.cell_count,
                event.kind == ContactKind::Damage ? "damage" : "heal",
                event.amount);
            events.push_back(event);
        }
    }

    for (const auto& blast : blasts) {
        // An earlier blast may already have consumed this cell.
        if (grid.getCell(blast.center.x, blast.center.y).material != blast.material) {
            continue;
        }

        BlastEvent event;
        event.tick = tick;
        event.center = blast.center;
        event.material = blast.material;
        event.radius = blast.effect.radius;
        event.damage = blast.effect.damage;
        event.force = blast.effect.force;
        event.cells_cleared =
            static_cast<uint32_t>(grid.carveCircle(blast.center, blast.effect.radius));
        for (const auto& hitbox : hitboxes) {
            if (blastReaches(blast.center, blast.effect.radius, hitbox.rect)) {
                event.actors_hit.push_back(hitbox.actor_id);
            }
        }

        logger->info(
            "{} exploded at {} (radius {}, {} cells, {} actors hit)",
            registry.get(blast.material).name,
            blast.center.toString(),
            blast.effect.radius,
            event.cells_cleared,
            event.actors_hit.size());
        events.push_back(std::move(event));
    }

    return events;
}

nlohmann::json worldEventToJson(const WorldEvent& event)
{
    return std::visit(
        [](const auto& e) -> nlohmann::json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ContactEvent>) {
                return { { "type", e.kind == ContactKind::Damage ? "damage" : "heal" },
                         { "tick", e.tick },
                         { "actor_id", e.actor_id },
                         { "material", e.material },
                         { "cell_count", e.cell_count },
                         { "amount", e.amount } };
            }
            else {
                return { { "type", "blast" },
                         { "tick", e.tick },
                         { "center", e.center },
                         { "material", e.material },
                         { "radius", e.radius },
                         { "damage", e.damage },
                         { "force", e.force },
                         { "cells_cleared", e.cells_cleared },
                         { "actors_hit", e.actors_hit } };
            }
        },
        event);
}

} // namespace SandSim
