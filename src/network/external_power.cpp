/**
 * @file external_power.cpp
 * @brief Third-party power block registry
 */

#include "conduit/external_power.h"
#include "conduit/error.h"
#include "conduit/log.h"
#include "conduit/validate.h"

#include <new>
#include <unordered_map>

struct ExternalBlock {
    Conduit_ExternalAmountFunc amount_fn;
    void *userdata;
};

struct Conduit_ExternalPowerRegistry {
    std::unordered_map<uint32_t, ExternalBlock> blocks;
};

Conduit_ExternalPowerRegistry *conduit_external_power_create(void) {
    Conduit_ExternalPowerRegistry *ext = new (std::nothrow) Conduit_ExternalPowerRegistry();
    if (!ext) {
        conduit_set_error("External power: failed to allocate registry");
        return nullptr;
    }
    return ext;
}

void conduit_external_power_destroy(Conduit_ExternalPowerRegistry *ext) {
    if (!ext) return;
    delete ext;
}

bool conduit_external_power_register_block(Conduit_ExternalPowerRegistry *ext,
                                           uint32_t block_id,
                                           Conduit_ExternalAmountFunc amount_fn,
                                           void *userdata) {
    CONDUIT_VALIDATE_PTRS2_RET(ext, amount_fn, false);
    if (block_id == CONDUIT_BLOCK_NONE) {
        conduit_set_error("External power: block ID %u is reserved", (unsigned)block_id);
        return false;
    }

    ExternalBlock block;
    block.amount_fn = amount_fn;
    block.userdata = userdata;
    ext->blocks[block_id] = block;

    conduit_log_debug(CONDUIT_LOG_REGISTRY, "Registered external power block %u", (unsigned)block_id);
    return true;
}

bool conduit_external_power_unregister_block(Conduit_ExternalPowerRegistry *ext, uint32_t block_id) {
    CONDUIT_VALIDATE_PTR_RET(ext, false);
    return ext->blocks.erase(block_id) > 0;
}

bool conduit_external_power_is_power_block(const Conduit_ExternalPowerRegistry *ext, uint32_t block_id) {
    CONDUIT_VALIDATE_PTR_RET(ext, false);
    return ext->blocks.find(block_id) != ext->blocks.end();
}

float conduit_external_power_get_requested_amount(const Conduit_ExternalPowerRegistry *ext,
                                                  const Conduit_World *world,
                                                  Conduit_BlockPos4D pos,
                                                  uint32_t block_id,
                                                  const Conduit_Type *energy_type) {
    CONDUIT_VALIDATE_PTRS2_RET(ext, energy_type, 0.0f);

    std::unordered_map<uint32_t, ExternalBlock>::const_iterator it = ext->blocks.find(block_id);
    if (it == ext->blocks.end()) return 0.0f;

    return it->second.amount_fn(world, pos, energy_type, it->second.userdata);
}

int conduit_external_power_count(const Conduit_ExternalPowerRegistry *ext) {
    CONDUIT_VALIDATE_PTR_RET(ext, 0);
    return (int)ext->blocks.size();
}
