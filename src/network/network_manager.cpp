/**
 * @file network_manager.cpp
 * @brief Conduit network cache implementation
 *
 * Networks are discovered with a breadth-first flood-fill over the six
 * face neighbors of each conduit block. The result is stored in an arena
 * of components; coordinates point into the arena together with the
 * generation they saw. Bumping a component's generation stales every
 * coordinate that points at it without touching them.
 *
 * A component is recycled once no coordinate references it any more.
 */

#include "conduit/network_manager.h"
#include "conduit/error.h"
#include "conduit/log.h"
#include "conduit/validate.h"

#include <algorithm>
#include <cstring>
#include <new>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/* ============================================================================
 * Internal Structures
 * ========================================================================= */

struct BlockPosHash {
    size_t operator()(const Conduit_BlockPos4D &pos) const {
        return (size_t)conduit_block_pos_hash(pos);
    }
};

struct BlockPosEqual {
    bool operator()(const Conduit_BlockPos4D &a, const Conduit_BlockPos4D &b) const {
        return conduit_block_pos_equals(a, b);
    }
};

/** One discovered network */
struct NetworkComponent {
    uint32_t generation;                        /**< Bumped on invalidate and on recycle */
    int refs;                                   /**< Cache entries pointing here */
    bool in_use;                                /**< Slot holds a network */
    std::vector<Conduit_BlockPos4D> members;    /**< Discovery order */
};

/** Cache entry for one coordinate */
struct CacheEntry {
    uint32_t component;     /**< Arena slot */
    uint32_t generation;    /**< Component generation when stored */
};

typedef std::unordered_map<Conduit_BlockPos4D, CacheEntry, BlockPosHash, BlockPosEqual> PositionCache;
typedef std::unordered_set<Conduit_BlockPos4D, BlockPosHash, BlockPosEqual> PositionSet;

struct Conduit_NetworkManager {
    Conduit_Type type;

    std::vector<NetworkComponent> components;
    std::vector<uint32_t> free_components;
    PositionCache cache;

    uint64_t revalidations;
    uint64_t invalidations;

    Conduit_NetworkCallback callback;
    void *callback_userdata;
};

/* ============================================================================
 * Component Arena
 * ========================================================================= */

static uint32_t alloc_component(Conduit_NetworkManager *manager) {
    uint32_t index;
    if (!manager->free_components.empty()) {
        index = manager->free_components.back();
        manager->free_components.pop_back();
    } else {
        index = (uint32_t)manager->components.size();
        NetworkComponent fresh;
        fresh.generation = 0;
        fresh.refs = 0;
        fresh.in_use = false;
        manager->components.push_back(fresh);
    }

    NetworkComponent &comp = manager->components[index];
    comp.in_use = true;
    comp.refs = 0;
    comp.members.clear();
    return index;
}

static void release_ref(Conduit_NetworkManager *manager, uint32_t index) {
    NetworkComponent &comp = manager->components[index];
    if (--comp.refs > 0) return;

    comp.in_use = false;
    comp.generation++;
    comp.members.clear();
    comp.members.shrink_to_fit();
    manager->free_components.push_back(index);
}

/**
 * @brief Point pos at a component, releasing whatever it pointed at before
 */
static void set_entry(Conduit_NetworkManager *manager, Conduit_BlockPos4D pos, uint32_t index) {
    NetworkComponent &comp = manager->components[index];
    comp.refs++;

    CacheEntry entry;
    entry.component = index;
    entry.generation = comp.generation;

    PositionCache::iterator it = manager->cache.find(pos);
    if (it == manager->cache.end()) {
        manager->cache.emplace(pos, entry);
        return;
    }

    uint32_t old = it->second.component;
    it->second = entry;
    release_ref(manager, old);
}

static void drop_entry(Conduit_NetworkManager *manager, Conduit_BlockPos4D pos) {
    PositionCache::iterator it = manager->cache.find(pos);
    if (it == manager->cache.end()) return;

    uint32_t old = it->second.component;
    manager->cache.erase(it);
    release_ref(manager, old);
}

/**
 * @brief Drop entries of a replaced component whose blocks are gone
 *
 * Coordinates that are still conduits keep their stale entry and are
 * refilled when next queried.
 */
static void sweep_removed(Conduit_NetworkManager *manager, uint32_t index,
                          const Conduit_World *world) {
    if (!manager->components[index].in_use) return;

    /* drop_entry may recycle the component under us */
    std::vector<Conduit_BlockPos4D> members = manager->components[index].members;
    for (size_t i = 0; i < members.size(); i++) {
        PositionCache::iterator it = manager->cache.find(members[i]);
        if (it == manager->cache.end() || it->second.component != index) continue;

        if (!conduit_world_is_conduit_of_type(world, members[i], &manager->type)) {
            drop_entry(manager, members[i]);
        }
    }
}

/**
 * @brief Find the current component for pos, or NULL if stale/unknown
 */
static const NetworkComponent *find_valid(const Conduit_NetworkManager *manager,
                                          Conduit_BlockPos4D pos) {
    PositionCache::const_iterator it = manager->cache.find(pos);
    if (it == manager->cache.end()) return NULL;

    const NetworkComponent &comp = manager->components[it->second.component];
    if (!comp.in_use || comp.generation != it->second.generation) return NULL;
    return &comp;
}

static const NetworkComponent *require_valid(const Conduit_NetworkManager *manager,
                                             Conduit_BlockPos4D pos,
                                             const char *func) {
    const NetworkComponent *comp = find_valid(manager, pos);
    if (!comp) {
        char buf[CONDUIT_BLOCK_POS_STRING_SIZE];
        conduit_set_error("%s: network at %s is not validated for %s", func,
                          conduit_block_pos_to_string(pos, buf, sizeof(buf)),
                          manager->type.name);
    }
    return comp;
}

/* ============================================================================
 * Creation and Destruction
 * ========================================================================= */

Conduit_NetworkManager *conduit_network_manager_create(const Conduit_Type *type) {
    CONDUIT_VALIDATE_TYPE_RET(type, nullptr);

    Conduit_NetworkManager *manager = new (std::nothrow) Conduit_NetworkManager();
    if (!manager) {
        conduit_set_error("Network: failed to allocate manager for %s", type->name);
        return nullptr;
    }

    manager->type = *type;
    manager->revalidations = 0;
    manager->invalidations = 0;
    manager->callback = nullptr;
    manager->callback_userdata = nullptr;

    return manager;
}

void conduit_network_manager_destroy(Conduit_NetworkManager *manager) {
    if (!manager) return;
    delete manager;
}

void conduit_network_manager_clear(Conduit_NetworkManager *manager) {
    CONDUIT_VALIDATE_PTR(manager);

    manager->cache.clear();
    manager->components.clear();
    manager->free_components.clear();
    manager->revalidations = 0;
    manager->invalidations = 0;
}

void conduit_network_manager_reserve(Conduit_NetworkManager *manager, int capacity) {
    CONDUIT_VALIDATE_PTR(manager);
    CONDUIT_VALIDATE_NON_NEGATIVE(capacity);
    manager->cache.reserve((size_t)capacity);
}

const Conduit_Type *conduit_network_manager_get_type(const Conduit_NetworkManager *manager) {
    CONDUIT_VALIDATE_PTR_RET(manager, nullptr);
    return &manager->type;
}

/* ============================================================================
 * Cache Operations
 * ========================================================================= */

bool conduit_network_manager_is_validated(const Conduit_NetworkManager *manager,
                                          Conduit_BlockPos4D pos) {
    CONDUIT_VALIDATE_PTR_RET(manager, false);
    return find_valid(manager, pos) != nullptr;
}

int conduit_network_manager_revalidate(Conduit_NetworkManager *manager,
                                       Conduit_BlockPos4D pos,
                                       const Conduit_World *world) {
    CONDUIT_VALIDATE_PTRS2_RET(manager, world, 0);

    /* A removed or replaced block never seeds a network */
    if (!conduit_world_is_conduit_of_type(world, pos, &manager->type)) {
        drop_entry(manager, pos);
        return 0;
    }

    /* Breadth-first fill; members doubles as the queue */
    std::vector<Conduit_BlockPos4D> members;
    PositionSet visited;
    members.push_back(pos);
    visited.insert(pos);

    for (size_t head = 0; head < members.size(); head++) {
        Conduit_BlockPos4D current = members[head];
        for (int f = 0; f < CONDUIT_FACING_COUNT; f++) {
            Conduit_BlockPos4D next = conduit_block_pos_offset(current, (Conduit_Facing)f);
            if (!visited.insert(next).second) continue;

            if (conduit_world_is_conduit_of_type(world, next, &manager->type)) {
                members.push_back(next);
            }
        }
    }

    /* Components the new network replaces */
    std::vector<uint32_t> replaced;
    for (size_t i = 0; i < members.size(); i++) {
        PositionCache::const_iterator it = manager->cache.find(members[i]);
        if (it == manager->cache.end()) continue;
        if (std::find(replaced.begin(), replaced.end(), it->second.component) == replaced.end()) {
            replaced.push_back(it->second.component);
        }
    }

    uint32_t index = alloc_component(manager);
    manager->components[index].members = std::move(members);

    const std::vector<Conduit_BlockPos4D> &stored = manager->components[index].members;
    for (size_t i = 0; i < stored.size(); i++) {
        set_entry(manager, stored[i], index);
    }

    for (size_t i = 0; i < replaced.size(); i++) {
        sweep_removed(manager, replaced[i], world);
    }

    int count = (int)stored.size();
    manager->revalidations++;

    char buf[CONDUIT_BLOCK_POS_STRING_SIZE];
    conduit_log_debug(CONDUIT_LOG_NETWORK, "%s network %u revalidated from %s: %d blocks",
                      manager->type.name, index,
                      conduit_block_pos_to_string(pos, buf, sizeof(buf)), count);

    if (manager->callback) {
        manager->callback(manager, index, count, manager->callback_userdata);
    }

    return count;
}

void conduit_network_manager_invalidate(Conduit_NetworkManager *manager,
                                        Conduit_BlockPos4D pos) {
    CONDUIT_VALIDATE_PTR(manager);

    PositionCache::iterator it = manager->cache.find(pos);
    if (it == manager->cache.end()) return;

    NetworkComponent &comp = manager->components[it->second.component];
    if (comp.generation != it->second.generation) return;  /* Already stale */

    comp.generation++;
    manager->invalidations++;
}

/* ============================================================================
 * Network Queries
 * ========================================================================= */

const Conduit_BlockPos4D *conduit_network_manager_get_members(const Conduit_NetworkManager *manager,
                                                              Conduit_BlockPos4D pos,
                                                              int *out_count) {
    if (out_count) *out_count = 0;
    CONDUIT_VALIDATE_PTR_RET(manager, nullptr);

    const NetworkComponent *comp = require_valid(manager, pos, __func__);
    if (!comp) return nullptr;

    if (out_count) *out_count = (int)comp->members.size();
    return comp->members.data();
}

int conduit_network_manager_get_network(const Conduit_NetworkManager *manager,
                                        Conduit_BlockPos4D pos,
                                        Conduit_BlockPos4D *out_members,
                                        int max_members) {
    CONDUIT_VALIDATE_PTRS2_RET(manager, out_members, 0);
    CONDUIT_VALIDATE_NON_NEGATIVE_RET(max_members, 0);

    const NetworkComponent *comp = require_valid(manager, pos, __func__);
    if (!comp) return 0;

    int count = (int)comp->members.size();
    if (count > max_members) count = max_members;
    if (count == 0) return 0;
    memcpy(out_members, comp->members.data(), (size_t)count * sizeof(Conduit_BlockPos4D));
    return count;
}

uint32_t conduit_network_manager_get_network_id(const Conduit_NetworkManager *manager,
                                                Conduit_BlockPos4D pos) {
    CONDUIT_VALIDATE_PTR_RET(manager, CONDUIT_NETWORK_INVALID);

    if (!find_valid(manager, pos)) return CONDUIT_NETWORK_INVALID;
    return manager->cache.find(pos)->second.component;
}

int conduit_network_manager_get_size(const Conduit_NetworkManager *manager,
                                     Conduit_BlockPos4D pos) {
    CONDUIT_VALIDATE_PTR_RET(manager, 0);

    const NetworkComponent *comp = find_valid(manager, pos);
    return comp ? (int)comp->members.size() : 0;
}

/* ============================================================================
 * Callbacks and Statistics
 * ========================================================================= */

void conduit_network_manager_set_callback(Conduit_NetworkManager *manager,
                                          Conduit_NetworkCallback callback,
                                          void *userdata) {
    CONDUIT_VALIDATE_PTR(manager);
    manager->callback = callback;
    manager->callback_userdata = userdata;
}

void conduit_network_manager_get_stats(const Conduit_NetworkManager *manager,
                                       Conduit_NetworkStats *out_stats) {
    CONDUIT_VALIDATE_PTRS2(manager, out_stats);

    int valid = 0;
    for (PositionCache::const_iterator it = manager->cache.begin(); it != manager->cache.end(); ++it) {
        const NetworkComponent &comp = manager->components[it->second.component];
        if (comp.in_use && comp.generation == it->second.generation) {
            valid++;
        }
    }

    int live = 0;
    for (size_t i = 0; i < manager->components.size(); i++) {
        if (manager->components[i].in_use) live++;
    }

    out_stats->cached_positions = (int)manager->cache.size();
    out_stats->valid_positions = valid;
    out_stats->live_networks = live;
    out_stats->revalidations = manager->revalidations;
    out_stats->invalidations = manager->invalidations;
}
