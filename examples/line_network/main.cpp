/**
 * Conduit - Line Network Example
 *
 * Builds a line of five electricity conduits with a machine at each end,
 * asks the generator end who wants power, then breaks the line in the
 * middle and asks again.
 *
 * Usage: conduit_example_line [config.toml]
 */

#include "conduit/conduit.h"
#include <stdio.h>
#include <map>
#include <tuple>

/* ============================================================================
 * Host World
 * ========================================================================= */

struct Machine {
    const char *name;
    int32_t priority;
    float demand;
};

struct Cell {
    Conduit_Type type;
    Machine *machine;
};

typedef std::map<std::tuple<int, int, int>, Cell> Grid;

static bool machine_is_sink(void *entity) {
    return ((Machine *)entity)->demand > 0.0f;
}

static Conduit_PowerRequest machine_request(void *entity, const Conduit_Type *energy_type) {
    (void)energy_type;
    Machine *m = (Machine *)entity;
    return conduit_power_request_make(m->priority, m->demand, m);
}

static const Conduit_SinkVTable machine_vtable = { machine_is_sink, machine_request };

static bool grid_conduit_type(const Conduit_World *world, Conduit_BlockPos4D pos, Conduit_Type *out_type) {
    const Grid *grid = (const Grid *)world->userdata;
    Grid::const_iterator it = grid->find(std::make_tuple(pos.x, pos.y, pos.z));
    if (it == grid->end()) return false;
    *out_type = it->second.type;
    return true;
}

static bool grid_tile(const Conduit_World *world, Conduit_BlockPos4D pos, Conduit_TileEntity *out_tile) {
    const Grid *grid = (const Grid *)world->userdata;
    Grid::const_iterator it = grid->find(std::make_tuple(pos.x, pos.y, pos.z));
    if (it == grid->end()) return false;
    out_tile->block_id = 1;
    out_tile->entity = it->second.machine;
    out_tile->sink = it->second.machine ? &machine_vtable : NULL;
    return true;
}

/* ============================================================================
 * Main
 * ========================================================================= */

static void print_requests(Conduit_Registry *registry, const Conduit_World *world,
                           Conduit_BlockPos4D pos, const Conduit_Type *type) {
    Conduit_PowerRequest requests[16];
    int n = conduit_registry_get_requests_for_power(registry, world, pos, type, requests, 16);

    char buf[CONDUIT_BLOCK_POS_STRING_SIZE];
    printf("Requests seen from %s: %d\n", conduit_block_pos_to_string(pos, buf, sizeof(buf)), n);
    for (int i = 0; i < n; i++) {
        Machine *m = (Machine *)requests[i].target;
        printf("  %-10s priority %4d  amount %.1f\n", m->name, (int)requests[i].priority, requests[i].amount);
    }
}

int main(int argc, char *argv[]) {
    conduit_log_init();

    Conduit_Config config = CONDUIT_CONFIG_DEFAULT;
    if (argc > 1 && !conduit_config_load_file(argv[1], &config)) {
        conduit_log_warning(CONDUIT_LOG_CONFIG, "%s", conduit_get_last_error());
        conduit_clear_error();
    }
    conduit_config_apply_logging(&config);

    Conduit_Registry *registry = conduit_registry_create(&config);
    if (!registry) {
        fprintf(stderr, "Failed to create registry: %s\n", conduit_get_last_error());
        conduit_log_shutdown();
        return 1;
    }

    Conduit_Type electricity = conduit_type_make("electricity");
    Machine furnace = { "furnace", CONDUIT_PRIORITY_HIGH, 40.0f };
    Machine battery = { "battery", CONDUIT_PRIORITY_BACKUP, 200.0f };

    Grid grid;
    for (int x = 0; x < 5; x++) {
        Cell cell = { electricity, NULL };
        grid[std::make_tuple(x, 64, 0)] = cell;
    }
    grid[std::make_tuple(0, 64, 0)].machine = &furnace;
    grid[std::make_tuple(4, 64, 0)].machine = &battery;

    Conduit_World world = {};
    world.dimension = 0;
    world.is_remote = false;
    world.get_conduit_type = grid_conduit_type;
    world.get_tile = grid_tile;
    world.userdata = &grid;

    Conduit_BlockPos4D west = conduit_block_pos_make(0, 0, 64, 0);
    Conduit_BlockPos4D middle = conduit_block_pos_make(0, 2, 64, 0);
    Conduit_BlockPos4D east = conduit_block_pos_make(0, 4, 64, 0);

    print_requests(registry, &world, west, &electricity);

    /* Break the line */
    grid.erase(std::make_tuple(2, 64, 0));
    conduit_registry_block_removed(registry, &world, middle, &electricity);

    print_requests(registry, &world, west, &electricity);
    print_requests(registry, &world, east, &electricity);

    Conduit_RegistryStats stats;
    conduit_registry_get_stats(registry, &stats);
    printf("Managers: %d  cached: %d  networks: %d  queries: %llu\n",
           stats.manager_count, stats.cached_positions, stats.live_networks,
           (unsigned long long)stats.request_queries);

    conduit_registry_destroy(registry);
    conduit_log_shutdown();
    return 0;
}
