#include "MaterialRegistry.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace SandSim {

namespace {

constexpr const char* EMPTY_NAME = "empty";

MaterialDefinition makeEmptyMaterial()
{
    MaterialDefinition empty;
    empty.id = MATERIAL_EMPTY;
    empty.name = EMPTY_NAME;
    empty.display_name = "Empty";
    empty.color = { 0, 0, 0, 0 };
    empty.physics = StaticPhysics{};
    return empty;
}

std::string materialEntryName(size_t index, const nlohmann::json& json)
{
    std::string entry = "materials[" + std::to_string(index) + "]";
    if (json.is_object() && json.contains("name") && json["name"].is_string()) {
        entry += " (" + json["name"].get<std::string>() + ")";
    }
    return entry;
}

} // namespace

uint32_t MaterialRegistry::pairKey(MaterialId a, MaterialId b)
{
    const MaterialId low = std::min(a, b);
    const MaterialId high = std::max(a, b);
    return (static_cast<uint32_t>(low) << 16) | high;
}

Result<MaterialRegistry, ConfigError> MaterialRegistry::loadFromJson(const nlohmann::json& json)
{
    using R = Result<MaterialRegistry, ConfigError>;

    if (!json.is_object() || !json.contains("materials") || !json["materials"].is_array()) {
        return R::error(ConfigError{ "materials", "expected an object with a 'materials' array" });
    }
    for (const auto& [key, value] : json.items()) {
        if (key != "materials" && key != "reactions") {
            return R::error(ConfigError{ key, "unknown top-level key" });
        }
    }

    const auto& entries = json["materials"];
    if (entries.size() >= std::numeric_limits<MaterialId>::max()) {
        return R::error(ConfigError{ "materials", "too many materials" });
    }

    MaterialRegistry registry;
    registry.materials_.push_back(makeEmptyMaterial());
    registry.nameToId_[EMPTY_NAME] = MATERIAL_EMPTY;

    // Pass 1: parse entries and assign ids so later entries can be referenced.
    for (size_t i = 0; i < entries.size(); ++i) {
        const std::string entryName = materialEntryName(i, entries[i]);
        auto parsed = parseMaterialDefinition(entries[i], entryName);
        if (parsed.isError()) {
            return R::error(parsed.errorValue());
        }

        MaterialDefinition material = std::move(parsed).value();
        if (material.name == REACTION_ANY_NAME) {
            return R::error(ConfigError{ entryName, "'any' is reserved" });
        }
        if (registry.nameToId_.count(material.name)) {
            return R::error(ConfigError{ entryName,
                                         material.name == EMPTY_NAME
                                             ? "'empty' is reserved"
                                             : "duplicate material name" });
        }
        material.id = static_cast<MaterialId>(registry.materials_.size());
        registry.nameToId_[material.name] = material.id;
        registry.materials_.push_back(std::move(material));
    }

    // Pass 2: resolve names inside fire parameters.
    for (size_t i = 1; i < registry.materials_.size(); ++i) {
        auto& material = registry.materials_[i];
        if (!material.fire || material.fire->burns_into.empty()) {
            continue;
        }
        auto target = registry.idOf(material.fire->burns_into);
        if (!target) {
            return R::error(ConfigError{ materialEntryName(i - 1, entries[i - 1]),
                                         "burns_into references unknown material '"
                                             + material.fire->burns_into + "'" });
        }
        material.fire->burns_into_id = *target;
    }

    // Reactions.
    registry.reactive_.assign(registry.materials_.size(), false);
    if (json.contains("reactions")) {
        const auto& reactionEntries = json["reactions"];
        if (!reactionEntries.is_array()) {
            return R::error(ConfigError{ "reactions", "must be an array" });
        }

        for (size_t i = 0; i < reactionEntries.size(); ++i) {
            const std::string entryName = "reactions[" + std::to_string(i) + "]";
            const auto& entry = reactionEntries[i];

            Reaction reaction;
            try {
                if (!entry.is_object()) {
                    return R::error(ConfigError{ entryName, "must be an object" });
                }
                for (const auto& [key, value] : entry.items()) {
                    if (key != "probability" && key != "input_a" && key != "input_b"
                        && key != "output_a" && key != "output_b") {
                        return R::error(ConfigError{ entryName, "unknown key '" + key + "'" });
                    }
                }

                reaction.probability = entry.at("probability").get<float>();
                if (!(reaction.probability >= 0.0f && reaction.probability <= 1.0f)) {
                    return R::error(ConfigError{ entryName, "probability must be within [0, 1]" });
                }

                auto resolve = [&](const char* key, MaterialId& out) -> std::optional<ConfigError> {
                    const auto name = entry.at(key).get<std::string>();
                    auto id = registry.idOf(name);
                    if (!id) {
                        return ConfigError{ entryName,
                                            std::string(key) + " references unknown material '"
                                                + name + "'" };
                    }
                    out = *id;
                    return std::nullopt;
                };

                const std::array<std::pair<const char*, MaterialId*>, 4> fields = { {
                    { "input_a", &reaction.input_a },
                    { "input_b", &reaction.input_b },
                    { "output_a", &reaction.output_a },
                    { "output_b", &reaction.output_b },
                } };
                if (entry.at("input_b").is_string()
                    && entry.at("input_b").get<std::string>() == REACTION_ANY_NAME) {
                    reaction.any_neighbour = true;
                }
                for (const auto& [key, target] : fields) {
                    if (reaction.any_neighbour && target == &reaction.input_b) {
                        continue;
                    }
                    if (auto err = resolve(key, *target)) {
                        return R::error(*err);
                    }
                }
            }
            catch (const nlohmann::json::exception& e) {
                return R::error(ConfigError{ entryName, e.what() });
            }

            if (reaction.input_a == MATERIAL_EMPTY
                || (!reaction.any_neighbour && reaction.input_b == MATERIAL_EMPTY)) {
                return R::error(ConfigError{ entryName, "reaction inputs cannot be empty" });
            }
            if (reaction.any_neighbour) {
                if (registry.anyReactionIndex_.count(reaction.input_a)) {
                    return R::error(
                        ConfigError{ entryName, "duplicate 'any' reaction for this material" });
                }
                registry.anyReactionIndex_[reaction.input_a] = registry.reactions_.size();
                registry.reactive_[reaction.input_a] = true;
                registry.reactions_.push_back(reaction);
                continue;
            }
            if (reaction.input_a == reaction.input_b) {
                return R::error(ConfigError{ entryName, "reaction inputs must differ" });
            }

            const uint32_t key = pairKey(reaction.input_a, reaction.input_b);
            if (registry.reactionIndex_.count(key)) {
                return R::error(ConfigError{ entryName, "duplicate reaction for this pair" });
            }
            registry.reactionIndex_[key] = registry.reactions_.size();
            registry.reactive_[reaction.input_a] = true;
            registry.reactive_[reaction.input_b] = true;
            registry.reactions_.push_back(reaction);
        }
    }

    LoggingChannels::registry()->info(
        "Loaded {} materials and {} reactions",
        registry.materials_.size() - 1,
        registry.reactions_.size());
    return R::okay(std::move(registry));
}

Result<MaterialRegistry, ConfigError> MaterialRegistry::loadFromFile(const std::string& path)
{
    using R = Result<MaterialRegistry, ConfigError>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return R::error(ConfigError{ path, "cannot open material file" });
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        return R::error(ConfigError{ path, e.what() });
    }

    auto result = loadFromJson(json);
    if (result.isError()) {
        LoggingChannels::registry()->error(
            "Rejected material file {}: {}", path, result.errorValue().toString());
    }
    return result;
}

const MaterialDefinition* MaterialRegistry::find(MaterialId id) const
{
    return contains(id) ? &materials_[id] : nullptr;
}

const MaterialDefinition* MaterialRegistry::findByName(std::string_view name) const
{
    auto id = idOf(name);
    return id ? &materials_[*id] : nullptr;
}

std::optional<MaterialId> MaterialRegistry::idOf(std::string_view name) const
{
    auto it = nameToId_.find(std::string(name));
    if (it == nameToId_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ReactionOutcome> MaterialRegistry::findReaction(MaterialId self, MaterialId other) const
{
    if (self == other || !hasReactions(self)) {
        return std::nullopt;
    }
    auto it = reactionIndex_.find(pairKey(self, other));
    if (it == reactionIndex_.end()) {
        if (other == MATERIAL_EMPTY) {
            return std::nullopt;
        }
        auto any = anyReactionIndex_.find(self);
        if (any == anyReactionIndex_.end()) {
            return std::nullopt;
        }
        const Reaction& wildcard = reactions_[any->second];
        return ReactionOutcome{ wildcard.probability, wildcard.output_a, wildcard.output_b };
    }

    const Reaction& reaction = reactions_[it->second];
    if (reaction.input_a == self) {
        return ReactionOutcome{ reaction.probability, reaction.output_a, reaction.output_b };
    }
    return ReactionOutcome{ reaction.probability, reaction.output_b, reaction.output_a };
}

bool MaterialRegistry::hasReactions(MaterialId id) const
{
    return id < reactive_.size() && reactive_[id];
}

nlohmann::json MaterialRegistry::toJson() const
{
    nlohmann::json materials = nlohmann::json::array();
    for (size_t i = 1; i < materials_.size(); ++i) {
        materials.push_back(materialDefinitionToJson(materials_[i]));
    }

    nlohmann::json reactions = nlohmann::json::array();
    for (const auto& reaction : reactions_) {
        reactions.push_back({ { "probability", reaction.probability },
                              { "input_a", materials_[reaction.input_a].name },
                              { "input_b",
                                reaction.any_neighbour ? std::string(REACTION_ANY_NAME)
                                                       : materials_[reaction.input_b].name },
                              { "output_a", materials_[reaction.output_a].name },
                              { "output_b", materials_[reaction.output_b].name } });
    }

    return nlohmann::json{ { "materials", materials }, { "reactions", reactions } };
}

} // namespace SandSim
