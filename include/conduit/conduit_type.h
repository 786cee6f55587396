/**
 * @file conduit_type.h
 * @brief Value token naming an energy or fluid network type
 *
 * Two types are equal when their names are equal. Types are small values
 * and are passed by value or const pointer.
 *
 * Usage:
 *   Conduit_Type electricity = conduit_type_make("electricity");
 *   Conduit_Type water = conduit_type_make("water");
 */

#ifndef CONDUIT_CONDUIT_TYPE_H
#define CONDUIT_CONDUIT_TYPE_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Maximum type name length including terminator */
#ifndef CONDUIT_TYPE_NAME_MAX
#define CONDUIT_TYPE_NAME_MAX 32
#endif

/**
 * @brief Conduit/energy type token
 */
typedef struct Conduit_Type {
    uint32_t id;                        /**< FNV-1a of name, 0 for invalid */
    char name[CONDUIT_TYPE_NAME_MAX];   /**< Type name */
} Conduit_Type;

/**
 * @brief Create a type token from a name
 *
 * @param name Type name (truncated to CONDUIT_TYPE_NAME_MAX - 1 chars)
 * @return Type token; invalid (empty name, id 0) if name is NULL or empty
 */
Conduit_Type conduit_type_make(const char *name);

/**
 * @brief Compare two types by name
 */
bool conduit_type_equals(const Conduit_Type *a, const Conduit_Type *b);

/**
 * @brief Check a type has a name
 */
bool conduit_type_is_valid(const Conduit_Type *type);

/**
 * @brief Get a type's name ("" for NULL)
 */
const char *conduit_type_name(const Conduit_Type *type);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_CONDUIT_TYPE_H */
