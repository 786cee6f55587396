#ifndef CONDUIT_H
#define CONDUIT_H

#include <stdbool.h>
#include <stdint.h>

// Version info
#define CONDUIT_VERSION_MAJOR 0
#define CONDUIT_VERSION_MINOR 1
#define CONDUIT_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * 1. CREATE/DESTROY PAIRS:
 *    `conduit_*_create()` allocates. The caller OWNS the result and MUST
 *    call the matching `conduit_*_destroy()`.
 *
 *      Conduit_Registry *reg = conduit_registry_create(&cfg);  // Caller owns
 *      conduit_registry_destroy(reg);                          // Must call
 *
 * 2. GET FUNCTIONS:
 *    `conduit_*_get_*()` returns pointers to internally-owned data. Do NOT
 *    free them. Network managers returned by the registry belong to the
 *    registry.
 *
 * 3. BORROWED POINTERS:
 *    Objects handed to a setter (e.g. conduit_registry_set_external_power)
 *    are borrowed and must outlive the object they were given to.
 *
 * 4. NULL ON FAILURE:
 *    Allocating functions return NULL on failure. Use
 *    conduit_get_last_error() for details.
 *
 * 5. ONE REGISTRY PER SIMULATION:
 *    Create the registry once when the world or server starts, on the
 *    simulation thread, and pass it to every call site. Nothing inside
 *    is synchronized.
 *
 *============================================================================*/

// Core infrastructure
#include "conduit/error.h"
#include "conduit/log.h"
#include "conduit/validate.h"
#include "conduit/config.h"

// Coordinates and world interface
#include "conduit/block_pos.h"
#include "conduit/conduit_type.h"
#include "conduit/world.h"

// Networks
#include "conduit/power_request.h"
#include "conduit/network_manager.h"
#include "conduit/external_power.h"
#include "conduit/registry.h"

#endif /* CONDUIT_H */
