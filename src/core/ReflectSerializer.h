#pragma once

#include <nlohmann/json.hpp>
#include <reflect>
#include <string>
#include <type_traits>

namespace SandSim {

/**
 * Reflection-based JSON conversion for plain aggregates (settings, stats).
 *
 * qlibs/reflect enumerates the members at compile time; nlohmann/json does
 * the value conversion. Missing keys keep the value already in the target.
 */
namespace ReflectSerializer {

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            j[name] = reflect::get<I>(obj);
        },
        obj);

    return j;
}

template <typename T>
void update_from_json(const nlohmann::json& j, T& obj)
{
    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            if (j.contains(name)) {
                using MemberType = std::remove_cvref_t<decltype(reflect::get<I>(obj))>;
                reflect::get<I>(obj) = j.at(name).template get<MemberType>();
            }
        },
        obj);
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    update_from_json(j, obj);
    return obj;
}

} // namespace ReflectSerializer

} // namespace SandSim
