/**
 * @file network_manager.h
 * @brief Connectivity cache for all conduits of one type
 *
 * A network is the maximal set of same-type conduit blocks connected
 * through face-adjacent neighbors in one dimension. The manager discovers
 * networks lazily with a flood-fill and caches the result for every member
 * at once.
 *
 * Cache layout: networks live in an arena of components. Each component
 * carries a generation counter and each cached coordinate remembers the
 * (component, generation) it was filled with. A coordinate is validated
 * while those generations match. Invalidating any member bumps the
 * component's generation, which stales the whole network in O(1).
 *
 * Threading: not internally synchronized. All calls must come from the
 * simulation thread that owns the manager.
 *
 * Usage:
 *   Conduit_Type power = conduit_type_make("electricity");
 *   Conduit_NetworkManager *mgr = conduit_network_manager_create(&power);
 *
 *   if (!conduit_network_manager_is_validated(mgr, pos)) {
 *       conduit_network_manager_revalidate(mgr, pos, &world);
 *   }
 *   int count = 0;
 *   const Conduit_BlockPos4D *members = conduit_network_manager_get_members(mgr, pos, &count);
 *
 *   // A block next to pos changed
 *   conduit_network_manager_invalidate(mgr, neighbor);
 *
 *   conduit_network_manager_destroy(mgr);
 */

#ifndef CONDUIT_NETWORK_MANAGER_H
#define CONDUIT_NETWORK_MANAGER_H

#include "conduit/block_pos.h"
#include "conduit/conduit_type.h"
#include "conduit/world.h"

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Invalid network ID */
#define CONDUIT_NETWORK_INVALID UINT32_MAX

/**
 * @brief Opaque network manager handle
 */
typedef struct Conduit_NetworkManager Conduit_NetworkManager;

/**
 * @brief Cache statistics
 */
typedef struct Conduit_NetworkStats {
    int cached_positions;       /**< Coordinates with a cache entry (valid or stale) */
    int valid_positions;        /**< Coordinates whose entry is current */
    int live_networks;          /**< Components referenced by at least one coordinate */
    uint64_t revalidations;     /**< Flood-fills performed */
    uint64_t invalidations;     /**< Invalidate calls that staled a network */
} Conduit_NetworkStats;

/**
 * @brief Callback fired after a flood-fill stores a network
 */
typedef void (*Conduit_NetworkCallback)(Conduit_NetworkManager *manager,
                                        uint32_t network_id,
                                        int member_count,
                                        void *userdata);

/* ============================================================================
 * Creation and Destruction
 * ========================================================================= */

/**
 * @brief Create a manager for one conduit type
 *
 * @param type Conduit type (must be valid)
 * @return New manager or NULL on failure
 */
Conduit_NetworkManager *conduit_network_manager_create(const Conduit_Type *type);

/**
 * @brief Destroy a manager and free all memory
 */
void conduit_network_manager_destroy(Conduit_NetworkManager *manager);

/**
 * @brief Drop every cached network
 *
 * Also resets the component arena and the counters, so network IDs start
 * over. Use it when a world unloads.
 */
void conduit_network_manager_clear(Conduit_NetworkManager *manager);

/**
 * @brief Reserve cache space for a number of coordinates
 *
 * A negative capacity sets an error and reserves nothing.
 */
void conduit_network_manager_reserve(Conduit_NetworkManager *manager, int capacity);

/**
 * @brief Get the conduit type this manager tracks
 */
const Conduit_Type *conduit_network_manager_get_type(const Conduit_NetworkManager *manager);

/* ============================================================================
 * Cache Operations
 * ========================================================================= */

/**
 * @brief Check if the cache holds a current network for pos
 */
bool conduit_network_manager_is_validated(const Conduit_NetworkManager *manager,
                                          Conduit_BlockPos4D pos);

/**
 * @brief Recompute the network containing pos
 *
 * Checks pos is still a conduit of the manager's type, then flood-fills
 * through same-type face neighbors. Every member is stored as validated
 * and pointing at the same network.
 *
 * If pos is not a conduit of this type, any cache entry for pos is dropped
 * and nothing is stored.
 *
 * Entries of the networks this one replaces are dropped for blocks that
 * are no longer conduits of this type, so removed blocks do not keep a
 * stale entry (and their old network) alive.
 *
 * @param manager Network manager
 * @param pos Starting coordinate
 * @param world World to query (its dimension must match pos)
 * @return Number of members, 0 if pos is not a conduit of this type
 */
int conduit_network_manager_revalidate(Conduit_NetworkManager *manager,
                                       Conduit_BlockPos4D pos,
                                       const Conduit_World *world);

/**
 * @brief Mark the network containing pos as stale
 *
 * O(1). Does nothing if pos has no cache entry or is already stale.
 */
void conduit_network_manager_invalidate(Conduit_NetworkManager *manager,
                                        Conduit_BlockPos4D pos);

/* ============================================================================
 * Network Queries
 *
 * These require pos to be validated. Querying a stale or unknown
 * coordinate sets an error and returns an empty result.
 * ========================================================================= */

/**
 * @brief Get the members of the network containing pos
 *
 * Members are in flood-fill discovery order, starting with the coordinate
 * the fill began at.
 *
 * @param manager Network manager
 * @param pos Validated coordinate
 * @param out_count Receives the member count (0 on failure)
 * @return Pointer to members, or NULL if pos is not validated
 *
 * @note Pointer is valid until the next revalidate, clear or destroy
 */
const Conduit_BlockPos4D *conduit_network_manager_get_members(const Conduit_NetworkManager *manager,
                                                              Conduit_BlockPos4D pos,
                                                              int *out_count);

/**
 * @brief Copy the members of the network containing pos
 *
 * @param manager Network manager
 * @param pos Validated coordinate
 * @param out_members Output array
 * @param max_members Output array capacity (negative sets an error)
 * @return Number of members written
 */
int conduit_network_manager_get_network(const Conduit_NetworkManager *manager,
                                        Conduit_BlockPos4D pos,
                                        Conduit_BlockPos4D *out_members,
                                        int max_members);

/**
 * @brief Get the ID of the network containing pos
 *
 * IDs are arena slots and are reused after a network is discarded.
 *
 * @return Network ID or CONDUIT_NETWORK_INVALID if pos is not validated
 */
uint32_t conduit_network_manager_get_network_id(const Conduit_NetworkManager *manager,
                                                Conduit_BlockPos4D pos);

/**
 * @brief Get the member count of the network containing pos
 *
 * @return Member count, 0 if pos is not validated
 */
int conduit_network_manager_get_size(const Conduit_NetworkManager *manager,
                                     Conduit_BlockPos4D pos);

/* ============================================================================
 * Callbacks and Statistics
 * ========================================================================= */

/**
 * @brief Set callback fired after each successful revalidation
 *
 * @param manager Network manager
 * @param callback Callback function (NULL to disable)
 * @param userdata User data passed to callback
 */
void conduit_network_manager_set_callback(Conduit_NetworkManager *manager,
                                          Conduit_NetworkCallback callback,
                                          void *userdata);

/**
 * @brief Get cache statistics
 *
 * @param manager Network manager
 * @param out_stats Output structure
 */
void conduit_network_manager_get_stats(const Conduit_NetworkManager *manager,
                                       Conduit_NetworkStats *out_stats);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_NETWORK_MANAGER_H */
