#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <zpp_bits.h>

namespace SandSim {

/**
 * Small 2D vector used for world and chunk coordinates.
 */
template <typename T>
struct Vector2 {
    T x = T{};
    T y = T{};

    using serialize = zpp::bits::members<2>;

    Vector2 add(const Vector2& other) const { return { x + other.x, y + other.y }; }

    Vector2 subtract(const Vector2& other) const { return { x - other.x, y - other.y }; }

    Vector2 times(T scalar) const { return { x * scalar, y * scalar }; }

    T magnitudeSquared() const { return x * x + y * y; }

    auto mag() const
    {
        if constexpr (std::is_integral_v<T>) {
            return std::sqrt(static_cast<double>(x * x + y * y));
        }
        else {
            return std::sqrt(x * x + y * y);
        }
    }

    std::string toString() const
    {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }

    Vector2 operator+(const Vector2& other) const { return add(other); }
    Vector2 operator-(const Vector2& other) const { return subtract(other); }
    Vector2 operator*(T scalar) const { return times(scalar); }
    Vector2 operator-() const { return { -x, -y }; }

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vector2& other) const { return !(*this == other); }

    Vector2& operator+=(const Vector2& other)
    {
        x += other.x;
        y += other.y;
        return *this;
    }

    nlohmann::json toJson() const { return nlohmann::json{ { "x", x }, { "y", y } }; }

    static Vector2 fromJson(const nlohmann::json& json)
    {
        return { json.at("x").get<T>(), json.at("y").get<T>() };
    }
};

using Vector2d = Vector2<double>;
using Vector2i = Vector2<int>;

template <typename T>
inline void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = v.toJson();
}

template <typename T>
inline void from_json(const nlohmann::json& j, Vector2<T>& v)
{
    v = Vector2<T>::fromJson(j);
}

} // namespace SandSim

namespace std {
template <typename T>
struct hash<SandSim::Vector2<T>> {
    std::size_t operator()(const SandSim::Vector2<T>& v) const noexcept
    {
        // Chunk maps hash many small negative and positive coordinates.
        std::size_t h1 = std::hash<T>{}(v.x);
        std::size_t h2 = std::hash<T>{}(v.y);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
} // namespace std
