#pragma once

#include "Cell.h"
#include "DirtyRect.h"
#include "Vector2.h"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <variant>
#include <vector>

namespace SandSim {

/**
 * An external actor's footprint in world cells. The engine only uses it to
 * find touching cells; the actor itself lives outside the simulation.
 */
struct ActorHitbox {
    uint32_t actor_id = 0;
    DirtyRect rect;
};

enum class ContactKind : uint8_t { Damage, Heal };

/**
 * Damage or healing an actor took from one material during one tick,
 * summed over every touching cell.
 */
struct ContactEvent {
    uint32_t tick = 0;
    uint32_t actor_id = 0;
    MaterialId material = MATERIAL_EMPTY;
    ContactKind kind = ContactKind::Damage;
    uint32_t cell_count = 0;
    float amount = 0.0f;
};

/**
 * An explosive cell touched an actor and went off.
 */
struct BlastEvent {
    uint32_t tick = 0;
    Vector2i center;
    MaterialId material = MATERIAL_EMPTY;
    float radius = 0.0f;
    float damage = 0.0f;
    float force = 0.0f;
    uint32_t cells_cleared = 0;
    std::vector<uint32_t> actors_hit;
};

using WorldEvent = std::variant<ContactEvent, BlastEvent>;

/**
 * Receives the events of each World::advance() as they are produced, on the
 * thread driving the simulation.
 */
class WorldEventSink {
public:
    virtual ~WorldEventSink() = default;

    virtual void queueEvent(const WorldEvent& event) = 0;
};

nlohmann::json worldEventToJson(const WorldEvent& event);

} // namespace SandSim
