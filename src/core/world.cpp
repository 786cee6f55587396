#include "conduit/world.h"

bool conduit_world_is_conduit_of_type(const Conduit_World *world, Conduit_BlockPos4D pos,
                                      const Conduit_Type *type) {
    if (!world || !world->get_conduit_type || !type) return false;
    if (pos.dimension != world->dimension) return false;

    Conduit_Type found;
    if (!world->get_conduit_type(world, pos, &found)) {
        return false;
    }
    return conduit_type_equals(&found, type);
}
