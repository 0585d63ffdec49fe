#include "Cell.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace SandSim {

Cell Cell::of(MaterialId material, float fill)
{
    Cell cell;
    cell.material = material;
    cell.fill_level = material == MATERIAL_EMPTY ? 0.0f : fill;
    return cell;
}

nlohmann::json Cell::toJson() const
{
    nlohmann::json j{ { "material", material },
                      { "fill_level", fill_level },
                      { "last_tick", last_tick },
                      { "velocity_hint", velocity_hint } };
    if (fire) {
        j["fire"] = { { "hp", fire->hp },
                      { "burning", fire->burning },
                      { "igniting", fire->igniting } };
    }
    return j;
}

Cell Cell::fromJson(const nlohmann::json& json)
{
    Cell cell;
    cell.material = json.at("material").get<MaterialId>();
    cell.fill_level = json.at("fill_level").get<float>();
    cell.last_tick = json.value("last_tick", 0u);
    cell.velocity_hint = json.value("velocity_hint", int8_t{ 0 });
    if (json.contains("fire") && !json["fire"].is_null()) {
        const auto& fire = json["fire"];
        cell.fire = FireState{ .hp = fire.at("hp").get<int32_t>(),
                               .burning = fire.value("burning", false),
                               .igniting = fire.value("igniting", false) };
    }
    return cell;
}

std::string Cell::toString() const
{
    std::ostringstream ss;
    ss << "Cell{material=" << material << ", fill=" << fill_level;
    if (fire) {
        ss << ", fire={hp=" << fire->hp << (fire->burning ? ", burning" : "")
           << (fire->igniting ? ", igniting" : "") << "}";
    }
    ss << ", tick=" << last_tick << "}";
    return ss.str();
}

void to_json(nlohmann::json& j, const Cell& cell)
{
    j = cell.toJson();
}

void from_json(const nlohmann::json& j, Cell& cell)
{
    cell = Cell::fromJson(j);
}

} // namespace SandSim
