/**
 * @file registry.cpp
 * @brief Conduit registry implementation
 *
 * Managers are kept in a small vector searched linearly; a world rarely
 * has more than a handful of conduit types.
 */

#include "conduit/registry.h"
#include "conduit/error.h"
#include "conduit/log.h"
#include "conduit/validate.h"

#include <cstring>
#include <new>
#include <vector>

/* ============================================================================
 * Internal Structures
 * ========================================================================= */

struct ManagerEntry {
    Conduit_Type type;
    Conduit_NetworkManager *manager;
};

struct Conduit_Registry {
    Conduit_Config config;
    std::vector<ManagerEntry> managers;
    Conduit_ExternalPowerRegistry *external;

    /* Reused between queries */
    std::vector<Conduit_PowerRequest> scratch;

    uint64_t request_queries;
    uint64_t block_events;
};

/* ============================================================================
 * Helper Functions
 * ========================================================================= */

static void destroy_managers(Conduit_Registry *registry) {
    for (size_t i = 0; i < registry->managers.size(); i++) {
        conduit_network_manager_destroy(registry->managers[i].manager);
    }
    registry->managers.clear();
}

/**
 * @brief Collect the request of the block at pos, if it has one
 */
static void collect_request(Conduit_Registry *registry,
                            const Conduit_World *world,
                            Conduit_BlockPos4D pos,
                            const Conduit_Type *energy_type) {
    if (!world->get_tile) return;

    Conduit_TileEntity tile;
    memset(&tile, 0, sizeof(tile));
    if (!world->get_tile(world, pos, &tile)) return;

    if (tile.entity && tile.sink && tile.sink->is_power_sink &&
        tile.sink->is_power_sink(tile.entity)) {
        if (!tile.sink->get_power_request) return;

        Conduit_PowerRequest req = tile.sink->get_power_request(tile.entity, energy_type);
        if (!conduit_power_request_is_nothing(&req)) {
            registry->scratch.push_back(req);
        }
        return;
    }

    if (!registry->config.extended_mod_compatibility || !registry->external) return;
    if (!conduit_external_power_is_power_block(registry->external, tile.block_id)) return;
    if (!tile.entity) return;

    float amount = conduit_external_power_get_requested_amount(registry->external, world, pos,
                                                               tile.block_id, energy_type);
    if (amount > 0.0f) {
        Conduit_PowerRequest req = conduit_power_request_make(CONDUIT_PRIORITY_LOW, amount, tile.entity);
        req.external = true;
        registry->scratch.push_back(req);
    }
}

/**
 * @brief Stale the networks of the six neighbors of pos
 */
static void invalidate_neighbors(Conduit_Registry *registry,
                                 const Conduit_World *world,
                                 Conduit_BlockPos4D pos,
                                 const Conduit_Type *type) {
    /* Replicas mirror topology decided elsewhere */
    if (world->is_remote) return;

    Conduit_NetworkManager *manager = conduit_registry_get_manager(registry, type);
    if (!manager) return;

    for (int f = 0; f < CONDUIT_FACING_COUNT; f++) {
        conduit_network_manager_invalidate(manager, conduit_block_pos_offset(pos, (Conduit_Facing)f));
    }
    registry->block_events++;
}

/* ============================================================================
 * Creation and Destruction
 * ========================================================================= */

Conduit_Registry *conduit_registry_create(const Conduit_Config *config) {
    Conduit_Registry *registry = new (std::nothrow) Conduit_Registry();
    if (!registry) {
        conduit_set_error("Registry: failed to allocate registry");
        return nullptr;
    }

    if (config) {
        registry->config = *config;
    } else {
        Conduit_Config def = CONDUIT_CONFIG_DEFAULT;
        registry->config = def;
    }
    if (registry->config.initial_cache_capacity < 0) {
        registry->config.initial_cache_capacity = 0;
    }

    registry->external = nullptr;
    registry->request_queries = 0;
    registry->block_events = 0;

    conduit_log_info(CONDUIT_LOG_REGISTRY, "Registry created (extended compatibility %s)",
                     registry->config.extended_mod_compatibility ? "on" : "off");
    return registry;
}

void conduit_registry_destroy(Conduit_Registry *registry) {
    if (!registry) return;
    destroy_managers(registry);
    delete registry;
}

void conduit_registry_clear(Conduit_Registry *registry) {
    CONDUIT_VALIDATE_PTR(registry);
    destroy_managers(registry);
    registry->scratch.clear();
    conduit_log_info(CONDUIT_LOG_REGISTRY, "Registry cleared");
}

const Conduit_Config *conduit_registry_get_config(const Conduit_Registry *registry) {
    CONDUIT_VALIDATE_PTR_RET(registry, nullptr);
    return &registry->config;
}

void conduit_registry_set_extended_compatibility(Conduit_Registry *registry, bool enabled) {
    CONDUIT_VALIDATE_PTR(registry);
    registry->config.extended_mod_compatibility = enabled;
}

void conduit_registry_set_external_power(Conduit_Registry *registry,
                                         Conduit_ExternalPowerRegistry *ext) {
    CONDUIT_VALIDATE_PTR(registry);
    registry->external = ext;
}

/* ============================================================================
 * Network Managers
 * ========================================================================= */

Conduit_NetworkManager *conduit_registry_find_manager(const Conduit_Registry *registry,
                                                      const Conduit_Type *type) {
    CONDUIT_VALIDATE_PTRS2_RET(registry, type, nullptr);

    for (size_t i = 0; i < registry->managers.size(); i++) {
        if (conduit_type_equals(&registry->managers[i].type, type)) {
            return registry->managers[i].manager;
        }
    }
    return nullptr;
}

Conduit_NetworkManager *conduit_registry_get_manager(Conduit_Registry *registry,
                                                     const Conduit_Type *type) {
    CONDUIT_VALIDATE_PTR_RET(registry, nullptr);
    CONDUIT_VALIDATE_TYPE_RET(type, nullptr);

    Conduit_NetworkManager *manager = conduit_registry_find_manager(registry, type);
    if (manager) return manager;

    manager = conduit_network_manager_create(type);
    if (!manager) return nullptr;
    conduit_network_manager_reserve(manager, registry->config.initial_cache_capacity);

    ManagerEntry entry;
    entry.type = *type;
    entry.manager = manager;
    registry->managers.push_back(entry);

    conduit_log_info(CONDUIT_LOG_REGISTRY, "Created network manager for %s", type->name);
    return manager;
}

int conduit_registry_manager_count(const Conduit_Registry *registry) {
    CONDUIT_VALIDATE_PTR_RET(registry, 0);
    return (int)registry->managers.size();
}

/* ============================================================================
 * Power Requests
 * ========================================================================= */

int conduit_registry_get_requests_for_power(Conduit_Registry *registry,
                                            const Conduit_World *world,
                                            Conduit_BlockPos4D pos,
                                            const Conduit_Type *conduit_type,
                                            Conduit_PowerRequest *out_requests,
                                            int max_requests) {
    return conduit_registry_get_requests_for_power_typed(registry, world, pos, conduit_type,
                                                         conduit_type, out_requests, max_requests,
                                                         nullptr);
}

int conduit_registry_get_requests_for_power_typed(Conduit_Registry *registry,
                                                  const Conduit_World *world,
                                                  Conduit_BlockPos4D pos,
                                                  const Conduit_Type *conduit_type,
                                                  const Conduit_Type *energy_type,
                                                  Conduit_PowerRequest *out_requests,
                                                  int max_requests,
                                                  int *out_total) {
    if (out_total) *out_total = 0;
    CONDUIT_VALIDATE_PTRS2_RET(registry, world, 0);
    CONDUIT_VALIDATE_PTRS2_RET(conduit_type, energy_type, 0);
    CONDUIT_VALIDATE_PTR_RET(out_requests, 0);
    CONDUIT_VALIDATE_NON_NEGATIVE_RET(max_requests, 0);

    Conduit_NetworkManager *manager = conduit_registry_get_manager(registry, conduit_type);
    if (!manager) return 0;

    registry->request_queries++;

    /*
     * Removing an isolated conduit stales none of its neighbors, so its own
     * entry can outlive the block. Revalidating drops it.
     */
    if (!conduit_world_is_conduit_of_type(world, pos, conduit_type)) {
        conduit_network_manager_revalidate(manager, pos, world);
        return 0;
    }

    if (!conduit_network_manager_is_validated(manager, pos)) {
        conduit_network_manager_revalidate(manager, pos, world);
    }

    int member_count = 0;
    const Conduit_BlockPos4D *members = conduit_network_manager_get_members(manager, pos, &member_count);
    if (!members) return 0;

    registry->scratch.clear();
    for (int i = 0; i < member_count; i++) {
        collect_request(registry, world, members[i], energy_type);
    }

    int count = (int)registry->scratch.size();
    conduit_power_request_sort(registry->scratch.data(), count);
    if (out_total) *out_total = count;

    if (count > max_requests) {
        conduit_log_debug(CONDUIT_LOG_REGISTRY, "%d %s requests truncated to %d",
                          count, conduit_type->name, max_requests);
        count = max_requests;
    }
    if (count > 0) {
        memcpy(out_requests, registry->scratch.data(), (size_t)count * sizeof(Conduit_PowerRequest));
    }
    return count;
}

/* ============================================================================
 * World Events
 * ========================================================================= */

void conduit_registry_block_placed(Conduit_Registry *registry,
                                   const Conduit_World *world,
                                   Conduit_BlockPos4D pos,
                                   const Conduit_Type *type) {
    CONDUIT_VALIDATE_PTRS2(registry, world);
    CONDUIT_VALIDATE_PTR(type);
    invalidate_neighbors(registry, world, pos, type);
}

void conduit_registry_block_removed(Conduit_Registry *registry,
                                    const Conduit_World *world,
                                    Conduit_BlockPos4D pos,
                                    const Conduit_Type *type) {
    CONDUIT_VALIDATE_PTRS2(registry, world);
    CONDUIT_VALIDATE_PTR(type);
    invalidate_neighbors(registry, world, pos, type);
}

/* ============================================================================
 * Statistics
 * ========================================================================= */

void conduit_registry_get_stats(const Conduit_Registry *registry, Conduit_RegistryStats *out_stats) {
    CONDUIT_VALIDATE_PTRS2(registry, out_stats);

    memset(out_stats, 0, sizeof(*out_stats));
    out_stats->manager_count = (int)registry->managers.size();
    out_stats->request_queries = registry->request_queries;
    out_stats->block_events = registry->block_events;

    for (size_t i = 0; i < registry->managers.size(); i++) {
        Conduit_NetworkStats stats;
        conduit_network_manager_get_stats(registry->managers[i].manager, &stats);
        out_stats->cached_positions += stats.cached_positions;
        out_stats->live_networks += stats.live_networks;
    }
}
