/**
 * @file block_pos.cpp
 * @brief Block coordinate helpers
 */

#include "conduit/block_pos.h"

#include <stdio.h>

/* Unit offsets indexed by Conduit_Facing */
static const int32_t k_facing_offsets[CONDUIT_FACING_COUNT][3] = {
    {  0, -1,  0 },     /* DOWN */
    {  0,  1,  0 },     /* UP */
    {  0,  0, -1 },     /* NORTH */
    {  0,  0,  1 },     /* SOUTH */
    { -1,  0,  0 },     /* WEST */
    {  1,  0,  0 },     /* EAST */
};

static const char *k_facing_names[CONDUIT_FACING_COUNT] = {
    "down", "up", "north", "south", "west", "east"
};

Conduit_BlockPos4D conduit_block_pos_make(int32_t dimension, int32_t x, int32_t y, int32_t z) {
    Conduit_BlockPos4D pos;
    pos.dimension = dimension;
    pos.x = x;
    pos.y = y;
    pos.z = z;
    return pos;
}

Conduit_BlockPos4D conduit_block_pos_offset(Conduit_BlockPos4D pos, Conduit_Facing facing) {
    if ((int)facing < 0 || facing >= CONDUIT_FACING_COUNT) {
        return pos;
    }
    /* Unsigned arithmetic: the edges of the int32 range wrap around */
    pos.x = (int32_t)((uint32_t)pos.x + (uint32_t)k_facing_offsets[facing][0]);
    pos.y = (int32_t)((uint32_t)pos.y + (uint32_t)k_facing_offsets[facing][1]);
    pos.z = (int32_t)((uint32_t)pos.z + (uint32_t)k_facing_offsets[facing][2]);
    return pos;
}

bool conduit_block_pos_equals(Conduit_BlockPos4D a, Conduit_BlockPos4D b) {
    return a.x == b.x && a.y == b.y && a.z == b.z && a.dimension == b.dimension;
}

uint64_t conduit_block_pos_hash(Conduit_BlockPos4D pos) {
    const uint32_t fields[4] = {
        (uint32_t)pos.dimension, (uint32_t)pos.x, (uint32_t)pos.y, (uint32_t)pos.z
    };

    /* FNV-1a over the 16 field bytes */
    uint64_t hash = 14695981039346656037ULL;
    for (int f = 0; f < 4; f++) {
        for (int i = 0; i < 4; i++) {
            hash ^= (fields[f] >> (i * 8)) & 0xFF;
            hash *= 1099511628211ULL;
        }
    }
    return hash;
}

const char *conduit_block_pos_to_string(Conduit_BlockPos4D pos, char *buf, size_t size) {
    if (!buf || size == 0) return buf;
    snprintf(buf, size, "%d:%d,%d,%d", (int)pos.dimension, (int)pos.x, (int)pos.y, (int)pos.z);
    return buf;
}

Conduit_Facing conduit_facing_opposite(Conduit_Facing facing) {
    if ((int)facing < 0 || facing >= CONDUIT_FACING_COUNT) {
        return facing;
    }
    /* Facings are laid out in opposite pairs */
    return (Conduit_Facing)((int)facing ^ 1);
}

const char *conduit_facing_name(Conduit_Facing facing) {
    if ((int)facing < 0 || facing >= CONDUIT_FACING_COUNT) {
        return "unknown";
    }
    return k_facing_names[facing];
}
