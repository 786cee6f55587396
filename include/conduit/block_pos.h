/**
 * @file block_pos.h
 * @brief 4-D block coordinate (dimension + x, y, z) and the six facings
 *
 * Coordinates are plain values. Offsetting never leaves the dimension the
 * coordinate started in.
 */

#ifndef CONDUIT_BLOCK_POS_H
#define CONDUIT_BLOCK_POS_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Buffer size for conduit_block_pos_to_string() */
#define CONDUIT_BLOCK_POS_STRING_SIZE 64

/**
 * @brief Axis-aligned directions, in host world order
 */
typedef enum Conduit_Facing {
    CONDUIT_FACING_DOWN = 0,    /**< -Y */
    CONDUIT_FACING_UP,          /**< +Y */
    CONDUIT_FACING_NORTH,       /**< -Z */
    CONDUIT_FACING_SOUTH,       /**< +Z */
    CONDUIT_FACING_WEST,        /**< -X */
    CONDUIT_FACING_EAST,        /**< +X */
    CONDUIT_FACING_COUNT
} Conduit_Facing;

/**
 * @brief Block coordinate within a dimension
 */
typedef struct Conduit_BlockPos4D {
    int32_t dimension;      /**< Dimension ID */
    int32_t x;
    int32_t y;
    int32_t z;
} Conduit_BlockPos4D;

/**
 * @brief Build a coordinate
 */
Conduit_BlockPos4D conduit_block_pos_make(int32_t dimension, int32_t x, int32_t y, int32_t z);

/**
 * @brief Coordinate one block away along a facing
 *
 * @param pos Origin coordinate
 * @param facing Direction (CONDUIT_FACING_COUNT or above returns pos unchanged)
 * @return New coordinate in the same dimension
 *
 * @note Coordinates wrap at the int32 limits: EAST of INT32_MAX is INT32_MIN.
 */
Conduit_BlockPos4D conduit_block_pos_offset(Conduit_BlockPos4D pos, Conduit_Facing facing);

/**
 * @brief Compare all four fields
 */
bool conduit_block_pos_equals(Conduit_BlockPos4D a, Conduit_BlockPos4D b);

/**
 * @brief Hash over all four fields (FNV-1a)
 */
uint64_t conduit_block_pos_hash(Conduit_BlockPos4D pos);

/**
 * @brief Format as "dim:x,y,z" for diagnostics
 *
 * @param pos Coordinate
 * @param buf Output buffer
 * @param size Buffer size (CONDUIT_BLOCK_POS_STRING_SIZE is always enough)
 * @return buf
 */
const char *conduit_block_pos_to_string(Conduit_BlockPos4D pos, char *buf, size_t size);

Conduit_Facing conduit_facing_opposite(Conduit_Facing facing);
const char *conduit_facing_name(Conduit_Facing facing);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_BLOCK_POS_H */
