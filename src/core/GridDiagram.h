#pragma once

#include "DirtyRect.h"
#include <string>
#include <vector>

namespace SandSim {

class Grid;
class MaterialRegistry;

/**
 * ASCII rendering of part of a grid for logs, the CLI and test failure output.
 *
 * Each material gets one character, the first letter of its name not already
 * taken by a lower id (then the upper-case form). Empty cells print as '.',
 * burning cells as '*', and unloaded space as ' '.
 */
class GridDiagram {
public:
    static std::string generate(const Grid& grid, const DirtyRect& worldRect);

    // Covers every loaded chunk.
    static std::string generate(const Grid& grid);

    // Glyph for each material id, indexed by id.
    static std::vector<char> glyphTable(const MaterialRegistry& registry);

    // "s=sand t=stone ..." for the materials in the table.
    static std::string legend(const MaterialRegistry& registry);
};

} // namespace SandSim
