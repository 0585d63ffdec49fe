#include "MaterialDefinition.h"
#include <cmath>
#include <initializer_list>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace SandSim {

namespace {

// Thrown while parsing one entry, turned into a ConfigError at the boundary.
struct InvalidField : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void rejectUnknownKeys(
    const nlohmann::json& object, const char* where, std::initializer_list<const char*> allowed)
{
    if (!object.is_object()) {
        throw InvalidField(std::string(where) + " must be an object");
    }
    for (const auto& [key, value] : object.items()) {
        bool known = false;
        for (const char* name : allowed) {
            if (key == name) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw InvalidField("unknown key '" + key + "' in " + where);
        }
    }
}

float requireRange(const nlohmann::json& object, const char* key, float fallback, float min, float max)
{
    const float value = object.contains(key) ? object.at(key).get<float>() : fallback;
    if (!std::isfinite(value) || value < min || value > max) {
        throw InvalidField(
            std::string(key) + " = " + std::to_string(value) + " is outside [" + std::to_string(min)
            + ", " + std::to_string(max) + "]");
    }
    return value;
}

Rgba parseRgba(const nlohmann::json& json, const char* key)
{
    if (!json.is_array() || json.size() != 4) {
        throw InvalidField(std::string(key) + " must be an array of 4 channel values");
    }
    Rgba rgba{};
    for (size_t i = 0; i < 4; ++i) {
        const int channel = json[i].get<int>();
        if (channel < 0 || channel > 255) {
            throw InvalidField(std::string(key) + " channel out of range: " + std::to_string(channel));
        }
        rgba[i] = static_cast<uint8_t>(channel);
    }
    return rgba;
}

PhysicsType parsePhysics(const nlohmann::json& json)
{
    const auto type = json.at("type").get<std::string>();
    constexpr float maxFloat = std::numeric_limits<float>::max();

    if (type == "static") {
        rejectUnknownKeys(json, "physics", { "type" });
        return StaticPhysics{};
    }
    if (type == "powder") {
        rejectUnknownKeys(json, "physics", { "type", "density" });
        PowderPhysics powder;
        powder.density = requireRange(json, "density", powder.density, 0.001f, maxFloat);
        return powder;
    }
    if (type == "liquid") {
        rejectUnknownKeys(
            json, "physics", { "type", "density", "flow_rate", "dry_threshold", "max_compression" });
        LiquidPhysics liquid;
        liquid.density = requireRange(json, "density", liquid.density, 0.001f, maxFloat);
        liquid.flow_rate = requireRange(json, "flow_rate", liquid.flow_rate, 0.001f, 1.0f);
        liquid.dry_threshold =
            requireRange(json, "dry_threshold", liquid.dry_threshold, 0.0f, 0.5f);
        liquid.max_compression =
            requireRange(json, "max_compression", liquid.max_compression, 1.0f, 2.0f);
        return liquid;
    }
    if (type == "gas") {
        rejectUnknownKeys(json, "physics", { "type", "density", "dissipate" });
        GasPhysics gas;
        gas.density = requireRange(json, "density", gas.density, 0.001f, maxFloat);
        gas.dissipate = json.value("dissipate", gas.dissipate);
        if (gas.dissipate == 0 || gas.dissipate < -1) {
            throw InvalidField("dissipate must be -1 (never) or a positive tick count");
        }
        return gas;
    }
    throw InvalidField("unknown physics type '" + type + "'");
}

FireParameters parseFire(const nlohmann::json& json)
{
    rejectUnknownKeys(
        json,
        "fire",
        { "probability", "fire_hp", "requires_oxygen", "try_to_ignite", "burns_into" });

    FireParameters fire;
    fire.probability = requireRange(json, "probability", fire.probability, 0.0f, 1.0f);
    fire.fire_hp = json.at("fire_hp").get<int32_t>();
    if (fire.fire_hp < 1) {
        throw InvalidField("fire_hp must be at least 1");
    }
    fire.requires_oxygen = json.value("requires_oxygen", fire.requires_oxygen);
    fire.try_to_ignite = json.value("try_to_ignite", fire.try_to_ignite);
    fire.burns_into = json.value("burns_into", std::string{});
    return fire;
}

ContactEffect parseContact(const nlohmann::json& json)
{
    const auto type = json.at("type").get<std::string>();
    constexpr float maxFloat = std::numeric_limits<float>::max();

    if (type == "damage") {
        rejectUnknownKeys(json, "contact", { "type", "amount" });
        return DamageContact{ .amount = requireRange(json, "amount", 0.0f, 0.0f, maxFloat) };
    }
    if (type == "heal") {
        rejectUnknownKeys(json, "contact", { "type", "amount" });
        return HealContact{ .amount = requireRange(json, "amount", 0.0f, 0.0f, maxFloat) };
    }
    if (type == "explode") {
        rejectUnknownKeys(json, "contact", { "type", "radius", "damage", "force" });
        return ExplodeContact{ .radius = requireRange(json, "radius", 1.0f, 0.5f, 256.0f),
                               .damage = requireRange(json, "damage", 0.0f, 0.0f, maxFloat),
                               .force = requireRange(json, "force", 0.0f, 0.0f, maxFloat) };
    }
    throw InvalidField("unknown contact type '" + type + "'");
}

nlohmann::json rgbaToJson(const Rgba& rgba)
{
    return nlohmann::json::array({ rgba[0], rgba[1], rgba[2], rgba[3] });
}

} // namespace

float MaterialDefinition::density() const
{
    if (isEmptyMaterial()) {
        return AIR_DENSITY;
    }
    return std::visit(
        [](const auto& physics) -> float {
            using T = std::decay_t<decltype(physics)>;
            if constexpr (std::is_same_v<T, StaticPhysics>) {
                return std::numeric_limits<float>::infinity();
            }
            else {
                return physics.density;
            }
        },
        physics);
}

const char* physicsKindName(PhysicsKind kind)
{
    switch (kind) {
        case PhysicsKind::Static:
            return "static";
        case PhysicsKind::Powder:
            return "powder";
        case PhysicsKind::Liquid:
            return "liquid";
        case PhysicsKind::Gas:
            return "gas";
    }
    return "unknown";
}

Result<MaterialDefinition, ConfigError> parseMaterialDefinition(
    const nlohmann::json& json, const std::string& entryName)
{
    using R = Result<MaterialDefinition, ConfigError>;

    try {
        rejectUnknownKeys(
            json,
            "material",
            { "name",
              "display_name",
              "color",
              "color_offset",
              "physics",
              "fire",
              "contact",
              "lighting",
              "durability",
              "tags" });

        MaterialDefinition material;
        material.name = json.at("name").get<std::string>();
        if (material.name.empty()) {
            throw InvalidField("name must not be empty");
        }
        material.display_name = json.value("display_name", material.name);
        material.color = parseRgba(json.at("color"), "color");

        const int colorOffset = json.value("color_offset", 0);
        if (colorOffset < 0 || colorOffset > 255) {
            throw InvalidField("color_offset must be within [0, 255]");
        }
        material.color_offset = static_cast<uint8_t>(colorOffset);

        material.physics = parsePhysics(json.at("physics"));

        if (json.contains("fire")) {
            material.fire = parseFire(json["fire"]);
        }
        if (json.contains("contact")) {
            material.contact = parseContact(json["contact"]);
        }
        if (json.contains("lighting")) {
            material.lighting = parseRgba(json["lighting"], "lighting");
        }
        if (json.contains("durability")) {
            material.durability = requireRange(
                json, "durability", 0.0f, 0.0f, std::numeric_limits<float>::max());
        }
        if (json.contains("tags")) {
            for (const auto& tag : json["tags"]) {
                material.tags.insert(tag.get<std::string>());
            }
        }
        return R::okay(std::move(material));
    }
    catch (const InvalidField& e) {
        return R::error(ConfigError{ entryName, e.what() });
    }
    catch (const nlohmann::json::exception& e) {
        return R::error(ConfigError{ entryName, e.what() });
    }
}

nlohmann::json materialDefinitionToJson(const MaterialDefinition& material)
{
    nlohmann::json j{ { "id", material.id },
                      { "name", material.name },
                      { "display_name", material.display_name },
                      { "color", rgbaToJson(material.color) },
                      { "color_offset", material.color_offset } };

    nlohmann::json physics{ { "type", physicsKindName(material.kind()) } };
    std::visit(
        [&physics](const auto& params) {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, PowderPhysics>) {
                physics["density"] = params.density;
            }
            else if constexpr (std::is_same_v<T, LiquidPhysics>) {
                physics["density"] = params.density;
                physics["flow_rate"] = params.flow_rate;
                physics["dry_threshold"] = params.dry_threshold;
                physics["max_compression"] = params.max_compression;
            }
            else if constexpr (std::is_same_v<T, GasPhysics>) {
                physics["density"] = params.density;
                physics["dissipate"] = params.dissipate;
            }
        },
        material.physics);
    j["physics"] = physics;

    if (material.fire) {
        j["fire"] = { { "probability", material.fire->probability },
                      { "fire_hp", material.fire->fire_hp },
                      { "requires_oxygen", material.fire->requires_oxygen },
                      { "try_to_ignite", material.fire->try_to_ignite },
                      { "burns_into", material.fire->burns_into } };
    }
    if (material.contact) {
        std::visit(
            [&j](const auto& effect) {
                using T = std::decay_t<decltype(effect)>;
                if constexpr (std::is_same_v<T, DamageContact>) {
                    j["contact"] = { { "type", "damage" }, { "amount", effect.amount } };
                }
                else if constexpr (std::is_same_v<T, HealContact>) {
                    j["contact"] = { { "type", "heal" }, { "amount", effect.amount } };
                }
                else {
                    j["contact"] = { { "type", "explode" },
                                     { "radius", effect.radius },
                                     { "damage", effect.damage },
                                     { "force", effect.force } };
                }
            },
            *material.contact);
    }
    if (material.lighting) {
        j["lighting"] = rgbaToJson(*material.lighting);
    }
    if (material.durability) {
        j["durability"] = *material.durability;
    }
    if (!material.tags.empty()) {
        j["tags"] = material.tags;
    }
    return j;
}

} // namespace SandSim
