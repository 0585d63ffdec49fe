#include "GridDiagram.h"
#include "ChunkCoords.h"
#include "Grid.h"
#include "MaterialRegistry.h"

#include <cctype>
#include <sstream>
#include <unordered_set>

namespace SandSim {

std::vector<char> GridDiagram::glyphTable(const MaterialRegistry& registry)
{
    std::vector<char> glyphs(registry.size(), '?');
    std::unordered_set<char> used = { '.', '*', ' ', '?' };

    for (const auto& material : registry.materials()) {
        if (material.isEmptyMaterial()) {
            glyphs[material.id] = '.';
            continue;
        }

        char chosen = '?';
        for (int pass = 0; pass < 2 && chosen == '?'; ++pass) {
            for (char c : material.name) {
                if (!std::isalpha(static_cast<unsigned char>(c))) {
                    continue;
                }
                const char candidate = static_cast<char>(
                    pass == 0 ? std::tolower(static_cast<unsigned char>(c))
                              : std::toupper(static_cast<unsigned char>(c)));
                if (!used.count(candidate)) {
                    chosen = candidate;
                    break;
                }
            }
        }
        if (chosen != '?') {
            used.insert(chosen);
        }
        glyphs[material.id] = chosen;
    }
    return glyphs;
}

std::string GridDiagram::legend(const MaterialRegistry& registry)
{
    const auto glyphs = glyphTable(registry);
    std::ostringstream out;
    for (const auto& material : registry.materials()) {
        if (material.isEmptyMaterial()) {
            continue;
        }
        out << glyphs[material.id] << '=' << material.name << ' ';
    }
    out << "*=burning";
    return out.str();
}

std::string GridDiagram::generate(const Grid& grid, const DirtyRect& worldRect)
{
    if (worldRect.isEmpty()) {
        return "";
    }

    const auto glyphs = glyphTable(grid.registry());
    std::ostringstream diagram;

    diagram << '+' << std::string(worldRect.width(), '-') << "+\n";
    for (int y = worldRect.minY; y <= worldRect.maxY; ++y) {
        diagram << '|';
        for (int x = worldRect.minX; x <= worldRect.maxX; ++x) {
            const Cell* cell = grid.tryGetCell(x, y);
            if (!cell) {
                diagram << ' ';
            }
            else if (cell->isBurning()) {
                diagram << '*';
            }
            else {
                diagram << glyphs[cell->material];
            }
        }
        diagram << "|\n";
    }
    diagram << '+' << std::string(worldRect.width(), '-') << "+\n";
    return diagram.str();
}

std::string GridDiagram::generate(const Grid& grid)
{
    DirtyRect bounds;
    for (const auto& coord : grid.chunkCoords()) {
        bounds.extend(Chunk::bounds().translated(chunkOrigin(coord)));
    }
    return generate(grid, bounds);
}

} // namespace SandSim
