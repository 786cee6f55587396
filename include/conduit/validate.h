/**
 * @file validate.h
 * @brief Argument checks for public entry points
 *
 * Each macro sets the thread's error, prefixed with the calling function,
 * and returns early. The _RET forms return the given value.
 *
 * Usage:
 *   int conduit_registry_manager_count(const Conduit_Registry *registry) {
 *       CONDUIT_VALIDATE_PTR_RET(registry, 0);
 *       ...
 *   }
 */

#ifndef CONDUIT_VALIDATE_H
#define CONDUIT_VALIDATE_H

#include "conduit/error.h"
#include "conduit/conduit_type.h"

/* Report "<function>: <what>: <name>" and return */
#define CONDUIT_FAIL_RET(what, name, ret) \
    do { conduit_set_error("%s: %s: %s", __func__, (what), (name)); return ret; } while (0)

/* ============================================================================
 * Pointers
 * ========================================================================= */

#define CONDUIT_VALIDATE_PTR(ptr) \
    do { if (!(ptr)) CONDUIT_FAIL_RET("null pointer", #ptr, ); } while (0)

#define CONDUIT_VALIDATE_PTR_RET(ptr, ret) \
    do { if (!(ptr)) CONDUIT_FAIL_RET("null pointer", #ptr, (ret)); } while (0)

#define CONDUIT_VALIDATE_PTRS2(p1, p2) \
    do { CONDUIT_VALIDATE_PTR(p1); CONDUIT_VALIDATE_PTR(p2); } while (0)

#define CONDUIT_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { CONDUIT_VALIDATE_PTR_RET(p1, ret); CONDUIT_VALIDATE_PTR_RET(p2, ret); } while (0)

/* ============================================================================
 * Values
 * ========================================================================= */

#define CONDUIT_VALIDATE_NON_NEGATIVE(val) \
    do { if ((val) < 0) CONDUIT_FAIL_RET("must be non-negative", #val, ); } while (0)

#define CONDUIT_VALIDATE_NON_NEGATIVE_RET(val, ret) \
    do { if ((val) < 0) CONDUIT_FAIL_RET("must be non-negative", #val, (ret)); } while (0)

/* Not NULL and not "" */
#define CONDUIT_VALIDATE_STRING_RET(str, ret) \
    do { if (!(str) || (str)[0] == '\0') CONDUIT_FAIL_RET("null or empty string", #str, (ret)); } while (0)

/* Not NULL and named */
#define CONDUIT_VALIDATE_TYPE_RET(type, ret) \
    do { \
        CONDUIT_VALIDATE_PTR_RET(type, ret); \
        if (!conduit_type_is_valid(type)) CONDUIT_FAIL_RET("unnamed conduit type", #type, (ret)); \
    } while (0)

#endif /* CONDUIT_VALIDATE_H */
