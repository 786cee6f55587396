/**
 * @file external_power.h
 * @brief Registry of third-party blocks that draw power without a sink vtable
 *
 * Some blocks added by other mods consume power but know nothing about
 * Conduit_SinkVTable. Registering their block ID with an amount callback
 * lets the network registry include them when extended mod compatibility
 * is enabled.
 *
 * Usage:
 *   Conduit_ExternalPowerRegistry *ext = conduit_external_power_create();
 *   conduit_external_power_register_block(ext, FURNACE_ID, furnace_demand, game);
 *   conduit_registry_set_external_power(reg, ext);
 *   ...
 *   conduit_external_power_destroy(ext);
 */

#ifndef CONDUIT_EXTERNAL_POWER_H
#define CONDUIT_EXTERNAL_POWER_H

#include "conduit/block_pos.h"
#include "conduit/conduit_type.h"
#include "conduit/world.h"

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Conduit_ExternalPowerRegistry Conduit_ExternalPowerRegistry;

/**
 * @brief Amount of energy_type the block at pos wants right now
 *
 * @return Requested amount; values <= 0 mean no demand
 */
typedef float (*Conduit_ExternalAmountFunc)(const Conduit_World *world,
                                            Conduit_BlockPos4D pos,
                                            const Conduit_Type *energy_type,
                                            void *userdata);

Conduit_ExternalPowerRegistry *conduit_external_power_create(void);
void conduit_external_power_destroy(Conduit_ExternalPowerRegistry *ext);

/**
 * @brief Register or replace the amount callback for a block ID
 *
 * @return false if block_id is CONDUIT_BLOCK_NONE or amount_fn is NULL
 */
bool conduit_external_power_register_block(Conduit_ExternalPowerRegistry *ext,
                                           uint32_t block_id,
                                           Conduit_ExternalAmountFunc amount_fn,
                                           void *userdata);

/**
 * @brief Remove a block ID
 *
 * @return true if it was registered
 */
bool conduit_external_power_unregister_block(Conduit_ExternalPowerRegistry *ext, uint32_t block_id);

/**
 * @brief Check whether a block ID is a registered external consumer
 */
bool conduit_external_power_is_power_block(const Conduit_ExternalPowerRegistry *ext, uint32_t block_id);

/**
 * @brief Ask a registered block how much it wants
 *
 * @return Requested amount, 0 if the block is not registered
 */
float conduit_external_power_get_requested_amount(const Conduit_ExternalPowerRegistry *ext,
                                                  const Conduit_World *world,
                                                  Conduit_BlockPos4D pos,
                                                  uint32_t block_id,
                                                  const Conduit_Type *energy_type);

int conduit_external_power_count(const Conduit_ExternalPowerRegistry *ext);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_EXTERNAL_POWER_H */
