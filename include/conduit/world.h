/**
 * @file world.h
 * @brief Host-world callbacks consumed by the network engine
 *
 * The engine never owns world state. It asks the host, through a
 * Conduit_World, what occupies a coordinate. Entities that consume power
 * opt in by exposing a Conduit_SinkVTable on their tile.
 *
 * Usage:
 *   static bool my_conduit_type(const Conduit_World *w, Conduit_BlockPos4D pos,
 *                               Conduit_Type *out_type) {
 *       MyWorld *mw = (MyWorld *)w->userdata;
 *       ...
 *   }
 *
 *   Conduit_World world = {0};
 *   world.dimension = 0;
 *   world.get_conduit_type = my_conduit_type;
 *   world.get_tile = my_get_tile;
 *   world.userdata = my_world;
 */

#ifndef CONDUIT_WORLD_H
#define CONDUIT_WORLD_H

#include "conduit/block_pos.h"
#include "conduit/conduit_type.h"
#include "conduit/power_request.h"

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Block ID meaning "no block" */
#define CONDUIT_BLOCK_NONE 0

typedef struct Conduit_World Conduit_World;

/**
 * @brief Sink capability exposed by power-consuming entities
 *
 * Both functions are called on the simulation thread. Faults raised inside
 * them are not caught by the engine.
 */
typedef struct Conduit_SinkVTable {
    /** Whether the entity currently accepts power */
    bool (*is_power_sink)(void *entity);

    /** The entity's request for a given energy type, or the nothing sentinel */
    Conduit_PowerRequest (*get_power_request)(void *entity, const Conduit_Type *energy_type);
} Conduit_SinkVTable;

/**
 * @brief Tile entity at a coordinate
 */
typedef struct Conduit_TileEntity {
    uint32_t block_id;                  /**< Host block ID at the coordinate */
    void *entity;                       /**< Host tile entity, NULL if none */
    const Conduit_SinkVTable *sink;     /**< NULL if not sink-capable */
} Conduit_TileEntity;

/**
 * @brief World query interface for one dimension
 */
struct Conduit_World {
    int32_t dimension;      /**< Dimension ID of this world */
    bool is_remote;         /**< Replica of state simulated elsewhere */

    /**
     * Report the conduit type of the block at pos.
     * @return true if a conduit-bearing block occupies pos
     */
    bool (*get_conduit_type)(const Conduit_World *world, Conduit_BlockPos4D pos,
                             Conduit_Type *out_type);

    /**
     * Report the block at pos and its tile entity.
     * @return false if pos holds no block with a tile entity provider
     */
    bool (*get_tile)(const Conduit_World *world, Conduit_BlockPos4D pos,
                     Conduit_TileEntity *out_tile);

    void *userdata;         /**< Host data for the callbacks */
};

/**
 * @brief Check whether pos holds a conduit of the given type
 *
 * @return false if world has no conduit callback or the block differs
 */
bool conduit_world_is_conduit_of_type(const Conduit_World *world, Conduit_BlockPos4D pos,
                                      const Conduit_Type *type);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_WORLD_H */
