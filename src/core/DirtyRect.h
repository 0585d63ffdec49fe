#pragma once

#include "Vector2.h"
#include <algorithm>
#include <limits>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace SandSim {

/**
 * Inclusive integer bounding box. Default-constructed rects are empty.
 *
 * Chunks keep their rects in local cell coordinates; the Grid hands them
 * out translated to world coordinates.
 */
struct DirtyRect {
    int minX = std::numeric_limits<int>::max();
    int minY = std::numeric_limits<int>::max();
    int maxX = std::numeric_limits<int>::min();
    int maxY = std::numeric_limits<int>::min();

    static DirtyRect fromBounds(int minX, int minY, int maxX, int maxY);
    static DirtyRect fromPoint(int x, int y) { return fromBounds(x, y, x, y); }

    bool isEmpty() const { return minX > maxX || minY > maxY; }
    int width() const { return isEmpty() ? 0 : maxX - minX + 1; }
    int height() const { return isEmpty() ? 0 : maxY - minY + 1; }
    int area() const { return width() * height(); }

    bool contains(int x, int y) const
    {
        return x >= minX && x <= maxX && y >= minY && y <= maxY;
    }

    bool intersects(const DirtyRect& other) const;

    void extend(int x, int y)
    {
        minX = std::min(minX, x);
        minY = std::min(minY, y);
        maxX = std::max(maxX, x);
        maxY = std::max(maxY, y);
    }

    void extend(const DirtyRect& other);
    void clear() { *this = DirtyRect{}; }

    DirtyRect expanded(int margin) const;
    DirtyRect clippedTo(const DirtyRect& bounds) const;
    DirtyRect translated(Vector2i offset) const;

    bool operator==(const DirtyRect& other) const = default;

    std::string toString() const;
};

void to_json(nlohmann::json& j, const DirtyRect& rect);
void from_json(const nlohmann::json& j, DirtyRect& rect);

} // namespace SandSim
