#pragma once

#include <cstdint>

namespace SandSim {

/**
 * Stateless per-cell randomness: every roll is a hash of (seed, tick, x, y,
 * salt), so a cell draws the same numbers whichever worker thread updates it
 * and in whatever order.
 */
class CellRandom {
public:
    // Salts keep independent decisions about the same cell uncorrelated.
    enum Salt : uint32_t {
        SALT_DIRECTION = 1,
        SALT_FLOW = 2,
        SALT_GAS = 3,
        SALT_IGNITE = 4,
        SALT_REACTION = 16, // + neighbour index 0..7
    };

    explicit CellRandom(uint32_t seed = 0) : seed_(seed) {}

    uint32_t seed() const { return seed_; }

    uint64_t hash(uint32_t tick, int x, int y, uint32_t salt) const
    {
        uint64_t value = (static_cast<uint64_t>(seed_) << 32) | tick;
        value = mix(value ^ (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32)
                    ^ static_cast<uint32_t>(y));
        return mix(value + salt * 0x9e3779b97f4a7c15ULL);
    }

    // Uniform in [0, 1).
    float unit(uint32_t tick, int x, int y, uint32_t salt) const
    {
        return static_cast<float>(hash(tick, x, y, salt) >> 40) / static_cast<float>(1u << 24);
    }

    // -1 or +1.
    int direction(uint32_t tick, int x, int y, uint32_t salt) const
    {
        return (hash(tick, x, y, salt) & 1u) ? 1 : -1;
    }

private:
    // splitmix64 finalizer.
    static uint64_t mix(uint64_t z)
    {
        z += 0x9e3779b97f4a7c15ULL;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    uint32_t seed_;
};

} // namespace SandSim
