#pragma once

#include "Vector2.h"

namespace SandSim {

constexpr int CHUNK_SIZE = 64;
constexpr int CHUNK_AREA = CHUNK_SIZE * CHUNK_SIZE;

// How far (in cells) a chunk update may read or write past its own chunk edge.
// Chunks updated in the same pass are two chunks apart, so their reach windows
// can never touch.
constexpr int CHUNK_MAX_REACH = CHUNK_SIZE / 2 - 1;

/**
 * Integer division rounding toward negative infinity.
 * floorDiv(-1, 64) == -1, where plain '/' would give 0.
 */
constexpr int floorDiv(int value, int divisor)
{
    int quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

/**
 * Modulo with the sign of the divisor. floorMod(-1, 64) == 63.
 */
constexpr int floorMod(int value, int divisor)
{
    int remainder = value % divisor;
    if (remainder != 0 && ((remainder < 0) != (divisor < 0))) {
        remainder += divisor;
    }
    return remainder;
}

struct CellAddress {
    Vector2i chunk;
    Vector2i local;
};

inline CellAddress toCellAddress(int worldX, int worldY)
{
    return CellAddress{
        .chunk = { floorDiv(worldX, CHUNK_SIZE), floorDiv(worldY, CHUNK_SIZE) },
        .local = { floorMod(worldX, CHUNK_SIZE), floorMod(worldY, CHUNK_SIZE) },
    };
}

inline Vector2i chunkOrigin(Vector2i chunk)
{
    return { chunk.x * CHUNK_SIZE, chunk.y * CHUNK_SIZE };
}

inline Vector2i toWorld(Vector2i chunk, Vector2i local)
{
    return chunkOrigin(chunk) + local;
}

} // namespace SandSim
