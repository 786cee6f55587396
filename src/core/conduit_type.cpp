#include "conduit/conduit_type.h"

#include <string.h>

static uint32_t hash_name(const char *name) {
    /* FNV-1a */
    uint32_t hash = 2166136261u;
    for (const char *p = name; *p; p++) {
        hash ^= (uint8_t)*p;
        hash *= 16777619u;
    }
    /* 0 is reserved for the invalid type */
    return hash ? hash : 1u;
}

Conduit_Type conduit_type_make(const char *name) {
    Conduit_Type type;
    memset(&type, 0, sizeof(type));

    if (!name || name[0] == '\0') {
        return type;
    }

    strncpy(type.name, name, CONDUIT_TYPE_NAME_MAX - 1);
    type.name[CONDUIT_TYPE_NAME_MAX - 1] = '\0';
    type.id = hash_name(type.name);
    return type;
}

bool conduit_type_equals(const Conduit_Type *a, const Conduit_Type *b) {
    if (!a || !b) return false;
    if (a->id != b->id) return false;
    return strcmp(a->name, b->name) == 0;
}

bool conduit_type_is_valid(const Conduit_Type *type) {
    return type && type->id != 0 && type->name[0] != '\0';
}

const char *conduit_type_name(const Conduit_Type *type) {
    return type ? type->name : "";
}
