/**
 * @file config.h
 * @brief Registry configuration and its TOML loader
 *
 * Usage:
 *   Conduit_Config cfg = CONDUIT_CONFIG_DEFAULT;
 *   if (!conduit_config_load_file("conduit.toml", &cfg)) {
 *       conduit_log_warning(CONDUIT_LOG_CONFIG, "%s", conduit_get_last_error());
 *   }
 *   Conduit_Registry *reg = conduit_registry_create(&cfg);
 *
 * File format:
 *   [conduit]
 *   extended_mod_compatibility = true
 *   log_level = "debug"            # error | warning | info | debug
 *   initial_cache_capacity = 1024
 */

#ifndef CONDUIT_CONFIG_H
#define CONDUIT_CONFIG_H

#include "conduit/log.h"

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CONDUIT_CONFIG_DEFAULT_CACHE_CAPACITY 256

typedef struct Conduit_Config {
    bool extended_mod_compatibility;    /* Ask the external power registry about foreign blocks */
    Conduit_LogLevel log_level;         /* Level applied by conduit_config_apply_logging() */
    int initial_cache_capacity;         /* Coordinates reserved per network manager */
} Conduit_Config;

#define CONDUIT_CONFIG_DEFAULT { \
    .extended_mod_compatibility = false, \
    .log_level = CONDUIT_LOG_LEVEL_INFO, \
    .initial_cache_capacity = CONDUIT_CONFIG_DEFAULT_CACHE_CAPACITY \
}

/**
 * Load settings from a TOML file into cfg.
 * Keys missing from the file keep their current value in cfg.
 *
 * @return false if the file cannot be read or a key has the wrong type
 */
bool conduit_config_load_file(const char *path, Conduit_Config *cfg);

/**
 * Load settings from a TOML string into cfg.
 */
bool conduit_config_load_string(const char *toml_string, Conduit_Config *cfg);

/**
 * Set the global log level from cfg.
 */
void conduit_config_apply_logging(const Conduit_Config *cfg);

/**
 * Parse "error", "warning", "info" or "debug".
 *
 * @return true if name was recognized
 */
bool conduit_config_parse_log_level(const char *name, Conduit_LogLevel *out_level);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_CONFIG_H */
