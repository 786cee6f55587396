/**
 * @file registry.h
 * @brief Owner of all conduit network managers and entry point for queries
 *
 * The registry is created once when a world/server starts and passed to
 * every call site that needs power routing. It keeps one network manager
 * per conduit type, created the first time that type is seen.
 *
 * Power sources call conduit_registry_get_requests_for_power() to learn who
 * on their network wants power, highest priority first. Block placement and
 * removal are reported through the event functions, which stale the cached
 * networks around the changed block.
 *
 * Threading: create the registry during startup, then use it only from the
 * simulation thread. Nothing inside is synchronized; concurrent calls from
 * several threads need external locking.
 *
 * Usage:
 *   Conduit_Config cfg = CONDUIT_CONFIG_DEFAULT;
 *   Conduit_Registry *reg = conduit_registry_create(&cfg);
 *
 *   // Block events from the host
 *   conduit_registry_block_placed(reg, &world, pos, &electricity);
 *
 *   // Power source asking who to serve
 *   Conduit_PowerRequest requests[64];
 *   int n = conduit_registry_get_requests_for_power(reg, &world, source_pos,
 *                                                   &electricity, requests, 64);
 *   for (int i = 0; i < n; i++) { ... }
 *
 *   conduit_registry_destroy(reg);
 */

#ifndef CONDUIT_REGISTRY_H
#define CONDUIT_REGISTRY_H

#include "conduit/block_pos.h"
#include "conduit/conduit_type.h"
#include "conduit/config.h"
#include "conduit/external_power.h"
#include "conduit/network_manager.h"
#include "conduit/power_request.h"
#include "conduit/world.h"

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Conduit_Registry Conduit_Registry;

/**
 * @brief Registry statistics
 */
typedef struct Conduit_RegistryStats {
    int manager_count;              /**< Conduit types seen so far */
    int cached_positions;           /**< Sum over all managers */
    int live_networks;              /**< Sum over all managers */
    uint64_t request_queries;       /**< get_requests_for_power calls */
    uint64_t block_events;          /**< Placed/removed events processed */
} Conduit_RegistryStats;

/* ============================================================================
 * Creation and Destruction
 * ========================================================================= */

/**
 * @brief Create a registry
 *
 * @param config Configuration (NULL for CONDUIT_CONFIG_DEFAULT)
 * @return New registry or NULL on failure
 */
Conduit_Registry *conduit_registry_create(const Conduit_Config *config);

/**
 * @brief Destroy a registry and all of its network managers
 *
 * The external power registry, if set, is not destroyed.
 */
void conduit_registry_destroy(Conduit_Registry *registry);

/**
 * @brief Discard every network manager
 *
 * Cached networks are rebuilt from the world on the next query.
 */
void conduit_registry_clear(Conduit_Registry *registry);

const Conduit_Config *conduit_registry_get_config(const Conduit_Registry *registry);

/**
 * @brief Toggle querying of third-party power blocks
 */
void conduit_registry_set_extended_compatibility(Conduit_Registry *registry, bool enabled);

/**
 * @brief Attach the registry of third-party power blocks
 *
 * @param registry Conduit registry
 * @param ext External power registry (borrowed, NULL to detach)
 */
void conduit_registry_set_external_power(Conduit_Registry *registry,
                                         Conduit_ExternalPowerRegistry *ext);

/* ============================================================================
 * Network Managers
 * ========================================================================= */

/**
 * @brief Get or create the manager for a conduit type
 *
 * @return Manager owned by the registry, NULL if type is invalid
 */
Conduit_NetworkManager *conduit_registry_get_manager(Conduit_Registry *registry,
                                                     const Conduit_Type *type);

/**
 * @brief Get the manager for a type without creating it
 *
 * @return Manager or NULL if the type has not been seen
 */
Conduit_NetworkManager *conduit_registry_find_manager(const Conduit_Registry *registry,
                                                      const Conduit_Type *type);

int conduit_registry_manager_count(const Conduit_Registry *registry);

/* ============================================================================
 * Power Requests
 * ========================================================================= */

/**
 * @brief Collect power requests from every sink on the network at pos
 *
 * Same as conduit_registry_get_requests_for_power_typed() with
 * energy_type == conduit_type and no total.
 */
int conduit_registry_get_requests_for_power(Conduit_Registry *registry,
                                            const Conduit_World *world,
                                            Conduit_BlockPos4D pos,
                                            const Conduit_Type *conduit_type,
                                            Conduit_PowerRequest *out_requests,
                                            int max_requests);

/**
 * @brief Collect power requests for a subtype of energy
 *
 * Resolves the network of conduit_type containing pos (revalidating it if
 * stale) and asks every sink on it for a request for energy_type. Sentinel
 * "nothing" requests are dropped. If extended compatibility is on, blocks
 * registered with the external power registry are asked too. Results are
 * sorted by descending priority; equal priorities keep network order.
 *
 * A pos that is not a conduit of conduit_type yields no requests, and any
 * cache entry left there by a removed block is dropped.
 *
 * @param registry Conduit registry
 * @param world World containing pos
 * @param pos Coordinate of the block asking (normally the power source)
 * @param conduit_type Type used to connect conduits (e.g. "fluid")
 * @param energy_type Type being offered (e.g. "water")
 * @param out_requests Output array
 * @param max_requests Output array capacity (0 only counts)
 * @param out_total Receives the number of requests found before truncation
 *                  (may be NULL). Retry with a larger array if it exceeds
 *                  max_requests.
 * @return Number of requests written (the highest-priority ones if more exist)
 */
int conduit_registry_get_requests_for_power_typed(Conduit_Registry *registry,
                                                  const Conduit_World *world,
                                                  Conduit_BlockPos4D pos,
                                                  const Conduit_Type *conduit_type,
                                                  const Conduit_Type *energy_type,
                                                  Conduit_PowerRequest *out_requests,
                                                  int max_requests,
                                                  int *out_total);

/* ============================================================================
 * World Events
 * ========================================================================= */

/**
 * @brief Report that a conduit block entered the world
 *
 * Ignored for remote worlds. Otherwise stales the networks of the six
 * neighbors of pos in the manager for type.
 */
void conduit_registry_block_placed(Conduit_Registry *registry,
                                   const Conduit_World *world,
                                   Conduit_BlockPos4D pos,
                                   const Conduit_Type *type);

/**
 * @brief Report that a conduit block left the world
 *
 * Ignored for remote worlds. Otherwise stales the networks of the six
 * neighbors of pos in the manager for type.
 */
void conduit_registry_block_removed(Conduit_Registry *registry,
                                    const Conduit_World *world,
                                    Conduit_BlockPos4D pos,
                                    const Conduit_Type *type);

/* ============================================================================
 * Statistics
 * ========================================================================= */

void conduit_registry_get_stats(const Conduit_Registry *registry, Conduit_RegistryStats *out_stats);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_REGISTRY_H */
