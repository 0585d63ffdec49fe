#pragma once

#include "ConfigError.h"
#include "MaterialDefinition.h"
#include "Result.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace SandSim {

/**
 * Pairwise reaction: when input_a touches input_b, with `probability` per
 * tick both convert (a -> output_a, b -> output_b).
 *
 * A wildcard reaction (`"input_b": "any"` in JSON) has no input_b and applies
 * to every non-empty neighbour of input_a that has no reaction of its own.
 */
struct Reaction {
    float probability = 0.0f;
    MaterialId input_a = MATERIAL_EMPTY;
    MaterialId input_b = MATERIAL_EMPTY;
    MaterialId output_a = MATERIAL_EMPTY;
    MaterialId output_b = MATERIAL_EMPTY;
    bool any_neighbour = false;
};

inline constexpr const char* REACTION_ANY_NAME = "any";

/**
 * A reaction seen from one participant: what `self` and `other` turn into.
 */
struct ReactionOutcome {
    float probability = 0.0f;
    MaterialId self_output = MATERIAL_EMPTY;
    MaterialId other_output = MATERIAL_EMPTY;
};

/**
 * @brief The immutable set of material definitions and reactions.
 *
 * Built once at startup and passed by const reference to everything that
 * needs material lookups. Loading is all-or-nothing: any bad entry fails the
 * whole load with a ConfigError naming that entry.
 *
 * JSON layout:
 *   { "materials": [ { "name": "sand", "color": [..], "physics": {..} }, .. ],
 *     "reactions": [ { "probability": 0.5, "input_a": "lava", ... }, .. ] }
 *
 * Id 0 is the built-in "empty" material; file entries get ids 1.. in order.
 */
class MaterialRegistry {
public:
    static Result<MaterialRegistry, ConfigError> loadFromJson(const nlohmann::json& json);
    static Result<MaterialRegistry, ConfigError> loadFromFile(const std::string& path);

    size_t size() const { return materials_.size(); }
    bool contains(MaterialId id) const { return id < materials_.size(); }

    // Precondition: contains(id). Cells are validated before they reach the grid.
    const MaterialDefinition& get(MaterialId id) const { return materials_[id]; }

    const MaterialDefinition* find(MaterialId id) const;
    const MaterialDefinition* findByName(std::string_view name) const;
    std::optional<MaterialId> idOf(std::string_view name) const;

    /**
     * Reaction between `self` and `other`, in either declared order. Falls back
     * to the wildcard reaction of `self` when the pair has no entry.
     */
    std::optional<ReactionOutcome> findReaction(MaterialId self, MaterialId other) const;

    bool hasReactions(MaterialId id) const;

    const std::vector<MaterialDefinition>& materials() const { return materials_; }
    const std::vector<Reaction>& reactions() const { return reactions_; }

    nlohmann::json toJson() const;

private:
    MaterialRegistry() = default;

    static uint32_t pairKey(MaterialId a, MaterialId b);

    std::vector<MaterialDefinition> materials_;
    std::unordered_map<std::string, MaterialId> nameToId_;
    std::vector<Reaction> reactions_;
    std::unordered_map<uint32_t, size_t> reactionIndex_;
    std::unordered_map<MaterialId, size_t> anyReactionIndex_;
    std::vector<bool> reactive_;
};

} // namespace SandSim
