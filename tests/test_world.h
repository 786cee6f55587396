/*
 * In-memory world used by the network tests.
 *
 * Blocks live in a std::map keyed by (x, y, z) for a single dimension.
 * Sinks are plain structs exposed through a shared vtable.
 */

#ifndef CONDUIT_TEST_WORLD_H
#define CONDUIT_TEST_WORLD_H

#include "conduit/world.h"

#include <map>
#include <string>
#include <tuple>

struct TestSink {
    bool accepts = true;
    int32_t priority = CONDUIT_PRIORITY_MEDIUM;
    float amount = 0.0f;
    std::string energy;     /* Only answers for this energy type; empty answers all */
    int queries = 0;
};

class TestWorld {
public:
    explicit TestWorld(int32_t dimension = 0) {
        world.dimension = dimension;
        world.is_remote = false;
        world.get_conduit_type = &TestWorld::get_conduit_type;
        world.get_tile = &TestWorld::get_tile;
        world.userdata = this;
    }

    TestWorld(const TestWorld &) = delete;
    TestWorld &operator=(const TestWorld &) = delete;

    Conduit_BlockPos4D pos(int32_t x, int32_t y, int32_t z) const {
        return conduit_block_pos_make(world.dimension, x, y, z);
    }

    /* Place a conduit of type_name, optionally carrying a sink */
    Conduit_BlockPos4D place(int32_t x, int32_t y, int32_t z, const char *type_name,
                             TestSink *sink = nullptr, uint32_t block_id = 1) {
        Cell &cell = cells[std::make_tuple(x, y, z)];
        cell.has_conduit = true;
        cell.type = conduit_type_make(type_name);
        cell.block_id = block_id;
        cell.entity = sink;
        cell.sink = sink ? &sink_vtable() : nullptr;
        return pos(x, y, z);
    }

    /* Place a conduit whose tile entity is foreign (no sink vtable) */
    Conduit_BlockPos4D place_foreign(int32_t x, int32_t y, int32_t z, const char *type_name,
                                     uint32_t block_id, void *entity) {
        Cell &cell = cells[std::make_tuple(x, y, z)];
        cell.has_conduit = true;
        cell.type = conduit_type_make(type_name);
        cell.block_id = block_id;
        cell.entity = entity;
        cell.sink = nullptr;
        return pos(x, y, z);
    }

    /* Place a plain block with a sink tile but no conduit */
    Conduit_BlockPos4D place_tile(int32_t x, int32_t y, int32_t z, TestSink *sink, uint32_t block_id = 2) {
        Cell &cell = cells[std::make_tuple(x, y, z)];
        cell.has_conduit = false;
        cell.type = Conduit_Type();
        cell.block_id = block_id;
        cell.entity = sink;
        cell.sink = &sink_vtable();
        return pos(x, y, z);
    }

    void remove(int32_t x, int32_t y, int32_t z) {
        cells.erase(std::make_tuple(x, y, z));
    }

    int conduit_queries = 0;
    int tile_queries = 0;
    Conduit_World world;

    static const Conduit_SinkVTable &sink_vtable() {
        static const Conduit_SinkVTable vtable = { &TestWorld::sink_accepts, &TestWorld::sink_request };
        return vtable;
    }

private:
    struct Cell {
        bool has_conduit = false;
        Conduit_Type type = {};
        uint32_t block_id = CONDUIT_BLOCK_NONE;
        void *entity = nullptr;
        const Conduit_SinkVTable *sink = nullptr;
    };

    typedef std::map<std::tuple<int32_t, int32_t, int32_t>, Cell> CellMap;
    CellMap cells;

    const Cell *find(Conduit_BlockPos4D p) const {
        if (p.dimension != world.dimension) return nullptr;
        CellMap::const_iterator it = cells.find(std::make_tuple(p.x, p.y, p.z));
        return it == cells.end() ? nullptr : &it->second;
    }

    static bool get_conduit_type(const Conduit_World *w, Conduit_BlockPos4D p, Conduit_Type *out_type) {
        TestWorld *self = static_cast<TestWorld *>(w->userdata);
        self->conduit_queries++;
        const Cell *cell = self->find(p);
        if (!cell || !cell->has_conduit) return false;
        *out_type = cell->type;
        return true;
    }

    static bool get_tile(const Conduit_World *w, Conduit_BlockPos4D p, Conduit_TileEntity *out_tile) {
        TestWorld *self = static_cast<TestWorld *>(w->userdata);
        self->tile_queries++;
        const Cell *cell = self->find(p);
        if (!cell) return false;
        out_tile->block_id = cell->block_id;
        out_tile->entity = cell->entity;
        out_tile->sink = cell->sink;
        return true;
    }

    static bool sink_accepts(void *entity) {
        return static_cast<TestSink *>(entity)->accepts;
    }

    static Conduit_PowerRequest sink_request(void *entity, const Conduit_Type *energy_type) {
        TestSink *sink = static_cast<TestSink *>(entity);
        sink->queries++;
        if (!sink->energy.empty() && sink->energy != conduit_type_name(energy_type)) {
            return conduit_power_request_nothing();
        }
        return conduit_power_request_make(sink->priority, sink->amount, sink);
    }
};

#endif /* CONDUIT_TEST_WORLD_H */
