/*
 * Conduit Block Position Tests
 *
 * Tests for 4D coordinates, facings and hashing.
 */

#include <catch2/catch_test_macros.hpp>
#include "conduit/block_pos.h"
#include <cstdint>
#include <cstring>
#include <set>

/* ============================================================================
 * Construction and Equality
 * ============================================================================ */

TEST_CASE("Block position equality", "[block_pos][basic]") {
    Conduit_BlockPos4D a = conduit_block_pos_make(0, 1, 2, 3);

    SECTION("Same fields are equal") {
        REQUIRE(conduit_block_pos_equals(a, conduit_block_pos_make(0, 1, 2, 3)));
        REQUIRE(conduit_block_pos_hash(a) == conduit_block_pos_hash(conduit_block_pos_make(0, 1, 2, 3)));
    }

    SECTION("Dimension takes part in equality") {
        Conduit_BlockPos4D nether = conduit_block_pos_make(-1, 1, 2, 3);
        REQUIRE_FALSE(conduit_block_pos_equals(a, nether));
        REQUIRE(conduit_block_pos_hash(a) != conduit_block_pos_hash(nether));
    }

    SECTION("Each axis takes part in equality") {
        REQUIRE_FALSE(conduit_block_pos_equals(a, conduit_block_pos_make(0, 9, 2, 3)));
        REQUIRE_FALSE(conduit_block_pos_equals(a, conduit_block_pos_make(0, 1, 9, 3)));
        REQUIRE_FALSE(conduit_block_pos_equals(a, conduit_block_pos_make(0, 1, 2, 9)));
    }

    SECTION("Hash spreads a small cube") {
        std::set<uint64_t> hashes;
        for (int x = -4; x < 4; x++) {
            for (int y = -4; y < 4; y++) {
                for (int z = -4; z < 4; z++) {
                    hashes.insert(conduit_block_pos_hash(conduit_block_pos_make(0, x, y, z)));
                }
            }
        }
        REQUIRE(hashes.size() == 512);
    }
}

/* ============================================================================
 * Facings
 * ============================================================================ */

TEST_CASE("Block position facings", "[block_pos][facing]") {
    Conduit_BlockPos4D origin = conduit_block_pos_make(2, 10, 64, -10);

    SECTION("Offsets are unit steps") {
        Conduit_BlockPos4D down = conduit_block_pos_offset(origin, CONDUIT_FACING_DOWN);
        REQUIRE(down.y == 63);
        Conduit_BlockPos4D up = conduit_block_pos_offset(origin, CONDUIT_FACING_UP);
        REQUIRE(up.y == 65);
        Conduit_BlockPos4D north = conduit_block_pos_offset(origin, CONDUIT_FACING_NORTH);
        REQUIRE(north.z == -11);
        Conduit_BlockPos4D south = conduit_block_pos_offset(origin, CONDUIT_FACING_SOUTH);
        REQUIRE(south.z == -9);
        Conduit_BlockPos4D west = conduit_block_pos_offset(origin, CONDUIT_FACING_WEST);
        REQUIRE(west.x == 9);
        Conduit_BlockPos4D east = conduit_block_pos_offset(origin, CONDUIT_FACING_EAST);
        REQUIRE(east.x == 11);
        REQUIRE(east.dimension == 2);
    }

    SECTION("Opposite facing undoes the offset") {
        for (int f = 0; f < CONDUIT_FACING_COUNT; f++) {
            Conduit_Facing facing = (Conduit_Facing)f;
            Conduit_BlockPos4D there = conduit_block_pos_offset(origin, facing);
            Conduit_BlockPos4D back = conduit_block_pos_offset(there, conduit_facing_opposite(facing));
            REQUIRE(conduit_block_pos_equals(back, origin));
        }
    }

    SECTION("Invalid facing leaves the position alone") {
        Conduit_BlockPos4D same = conduit_block_pos_offset(origin, CONDUIT_FACING_COUNT);
        REQUIRE(conduit_block_pos_equals(same, origin));
        REQUIRE(strcmp(conduit_facing_name(CONDUIT_FACING_COUNT), "unknown") == 0);
    }

    SECTION("Offsets wrap at the edges of the coordinate range") {
        Conduit_BlockPos4D edge = conduit_block_pos_make(0, INT32_MAX, INT32_MIN, INT32_MAX);
        Conduit_BlockPos4D east = conduit_block_pos_offset(edge, CONDUIT_FACING_EAST);
        REQUIRE(east.x == INT32_MIN);
        Conduit_BlockPos4D down = conduit_block_pos_offset(edge, CONDUIT_FACING_DOWN);
        REQUIRE(down.y == INT32_MAX);
        Conduit_BlockPos4D south = conduit_block_pos_offset(edge, CONDUIT_FACING_SOUTH);
        REQUIRE(south.z == INT32_MIN);
        Conduit_BlockPos4D back = conduit_block_pos_offset(east, CONDUIT_FACING_WEST);
        REQUIRE(conduit_block_pos_equals(back, edge));
    }

    SECTION("Names") {
        REQUIRE(strcmp(conduit_facing_name(CONDUIT_FACING_DOWN), "down") == 0);
        REQUIRE(strcmp(conduit_facing_name(CONDUIT_FACING_EAST), "east") == 0);
    }
}

TEST_CASE("Block position formatting", "[block_pos][string]") {
    char buf[CONDUIT_BLOCK_POS_STRING_SIZE];
    const char *s = conduit_block_pos_to_string(conduit_block_pos_make(-1, 5, 70, -3), buf, sizeof(buf));
    REQUIRE(s == buf);
    REQUIRE(strcmp(buf, "-1:5,70,-3") == 0);

    REQUIRE(conduit_block_pos_to_string(conduit_block_pos_make(0, 0, 0, 0), nullptr, 8) == nullptr);
}
