#pragma once

#include <string>

namespace SandSim {

/**
 * A rejected configuration entry. `entry` names what was being parsed, e.g.
 * "materials[3] (lava)" or "reactions[0]".
 */
struct ConfigError {
    std::string entry;
    std::string message;

    std::string toString() const
    {
        if (entry.empty()) {
            return message;
        }
        return entry + ": " + message;
    }
};

} // namespace SandSim
