/**
 * @file config.cpp
 * @brief TOML configuration loading
 */

#include "conduit/config.h"
#include "conduit/error.h"
#include "conduit/log.h"
#include "conduit/validate.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <vector>

#include "toml.h"

bool conduit_config_parse_log_level(const char *name, Conduit_LogLevel *out_level) {
    if (!name || !out_level) return false;

    for (int i = 0; i < CONDUIT_LOG_LEVEL_COUNT; i++) {
        Conduit_LogLevel level = (Conduit_LogLevel)i;
        if (strcmp(name, conduit_log_level_name(level)) == 0) {
            *out_level = level;
            return true;
        }
    }
    return false;
}

/**
 * Read the [conduit] table into a copy of cfg, committing only on success.
 */
static bool apply_table(toml_table_t *root, const char *source, Conduit_Config *cfg) {
    toml_table_t *table = toml_table_in(root, "conduit");
    if (!table) {
        /* Nothing to override */
        return true;
    }

    Conduit_Config result = *cfg;

    if (toml_key_exists(table, "extended_mod_compatibility")) {
        toml_datum_t datum = toml_bool_in(table, "extended_mod_compatibility");
        if (!datum.ok) {
            conduit_set_error("config: %s: extended_mod_compatibility must be a boolean", source);
            return false;
        }
        result.extended_mod_compatibility = datum.u.b != 0;
    }

    if (toml_key_exists(table, "log_level")) {
        toml_datum_t datum = toml_string_in(table, "log_level");
        if (!datum.ok) {
            conduit_set_error("config: %s: log_level must be a string", source);
            return false;
        }
        bool known = conduit_config_parse_log_level(datum.u.s, &result.log_level);
        if (!known) {
            conduit_set_error("config: %s: unknown log_level '%s'", source, datum.u.s);
        }
        free(datum.u.s);
        if (!known) return false;
    }

    if (toml_key_exists(table, "initial_cache_capacity")) {
        toml_datum_t datum = toml_int_in(table, "initial_cache_capacity");
        if (!datum.ok || datum.u.i < 0 || datum.u.i > 0x7fffffff) {
            conduit_set_error("config: %s: initial_cache_capacity must be a non-negative integer", source);
            return false;
        }
        result.initial_cache_capacity = (int)datum.u.i;
    }

    *cfg = result;
    return true;
}

bool conduit_config_load_file(const char *path, Conduit_Config *cfg) {
    CONDUIT_VALIDATE_STRING_RET(path, false);
    CONDUIT_VALIDATE_PTR_RET(cfg, false);

    FILE *fp = fopen(path, "r");
    if (!fp) {
        conduit_set_error("config: failed to open %s", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        conduit_set_error("config: failed to parse %s: %s", path, errbuf);
        return false;
    }

    bool ok = apply_table(root, path, cfg);
    toml_free(root);

    if (ok) {
        conduit_log_info(CONDUIT_LOG_CONFIG, "Loaded %s (extended compatibility %s)",
                         path, cfg->extended_mod_compatibility ? "on" : "off");
    }
    return ok;
}

bool conduit_config_load_string(const char *toml_string, Conduit_Config *cfg) {
    CONDUIT_VALIDATE_PTRS2_RET(toml_string, cfg, false);

    /* toml_parse() needs a writable buffer */
    std::vector<char> buffer(toml_string, toml_string + strlen(toml_string) + 1);

    char errbuf[256];
    toml_table_t *root = toml_parse(buffer.data(), errbuf, sizeof(errbuf));
    if (!root) {
        conduit_set_error("config: failed to parse string: %s", errbuf);
        return false;
    }

    bool ok = apply_table(root, "<string>", cfg);
    toml_free(root);
    return ok;
}

void conduit_config_apply_logging(const Conduit_Config *cfg) {
    CONDUIT_VALIDATE_PTR(cfg);
    conduit_log_set_level(cfg->log_level);
}
