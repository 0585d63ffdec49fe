#include "DirtyRect.h"
#include <nlohmann/json.hpp>

namespace SandSim {

DirtyRect DirtyRect::fromBounds(int minX, int minY, int maxX, int maxY)
{
    DirtyRect rect;
    rect.minX = minX;
    rect.minY = minY;
    rect.maxX = maxX;
    rect.maxY = maxY;
    return rect;
}

bool DirtyRect::intersects(const DirtyRect& other) const
{
    if (isEmpty() || other.isEmpty()) {
        return false;
    }
    return minX <= other.maxX && other.minX <= maxX && minY <= other.maxY && other.minY <= maxY;
}

void DirtyRect::extend(const DirtyRect& other)
{
    if (other.isEmpty()) {
        return;
    }
    minX = std::min(minX, other.minX);
    minY = std::min(minY, other.minY);
    maxX = std::max(maxX, other.maxX);
    maxY = std::max(maxY, other.maxY);
}

DirtyRect DirtyRect::expanded(int margin) const
{
    if (isEmpty()) {
        return *this;
    }
    return fromBounds(minX - margin, minY - margin, maxX + margin, maxY + margin);
}

DirtyRect DirtyRect::clippedTo(const DirtyRect& bounds) const
{
    if (!intersects(bounds)) {
        return DirtyRect{};
    }
    return fromBounds(
        std::max(minX, bounds.minX),
        std::max(minY, bounds.minY),
        std::min(maxX, bounds.maxX),
        std::min(maxY, bounds.maxY));
}

DirtyRect DirtyRect::translated(Vector2i offset) const
{
    if (isEmpty()) {
        return *this;
    }
    return fromBounds(minX + offset.x, minY + offset.y, maxX + offset.x, maxY + offset.y);
}

std::string DirtyRect::toString() const
{
    if (isEmpty()) {
        return "[empty]";
    }
    return "[" + std::to_string(minX) + "," + std::to_string(minY) + " .. " + std::to_string(maxX)
        + "," + std::to_string(maxY) + "]";
}

void to_json(nlohmann::json& j, const DirtyRect& rect)
{
    if (rect.isEmpty()) {
        j = nullptr;
        return;
    }
    j = nlohmann::json{
        { "min_x", rect.minX }, { "min_y", rect.minY }, { "max_x", rect.maxX }, { "max_y", rect.maxY }
    };
}

void from_json(const nlohmann::json& j, DirtyRect& rect)
{
    if (j.is_null()) {
        rect.clear();
        return;
    }
    rect = DirtyRect::fromBounds(
        j.at("min_x").get<int>(),
        j.at("min_y").get<int>(),
        j.at("max_x").get<int>(),
        j.at("max_y").get<int>());
}

} // namespace SandSim
