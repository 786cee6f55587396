/**
 * @file log.h
 * @brief Leveled, subsystem-tagged logging
 *
 * Lines go to an optional log file, to SDL's console log and to any
 * registered callbacks. Logging works before conduit_log_init(); only the
 * file output needs it.
 *
 * Usage:
 *   conduit_log_init();     // /tmp/conduit.log on Unix, conduit.log on Windows
 *   conduit_log_info(CONDUIT_LOG_REGISTRY, "Created network manager for %s", name);
 *   conduit_log_debug(CONDUIT_LOG_NETWORK, "%s network %u: %d blocks", name, id, n);
 *   conduit_log_shutdown();
 *
 * File line format:
 *   [2026-03-02 18:04:51] [INFO   ] [Registry  ] Created network manager for electricity
 */

#ifndef CONDUIT_LOG_H
#define CONDUIT_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Log levels. A level filter lets through its own level and everything
 * below it; errors always pass.
 */
typedef enum {
    CONDUIT_LOG_LEVEL_ERROR = 0,
    CONDUIT_LOG_LEVEL_WARNING = 1,
    CONDUIT_LOG_LEVEL_INFO = 2,
    CONDUIT_LOG_LEVEL_DEBUG = 3
} Conduit_LogLevel;

#define CONDUIT_LOG_LEVEL_COUNT 4

/* Subsystem tags */
#define CONDUIT_LOG_CORE        "Core"
#define CONDUIT_LOG_NETWORK     "Network"
#define CONDUIT_LOG_REGISTRY    "Registry"
#define CONDUIT_LOG_WORLD       "World"
#define CONDUIT_LOG_CONFIG      "Config"

/* Callback slots available to conduit_log_add_callback() */
#define CONDUIT_LOG_MAX_CALLBACKS 8

/**
 * Receives every line that passes the level filter.
 * subsystem is padded to 10 characters.
 */
typedef void (*Conduit_LogCallback)(Conduit_LogLevel level,
                                    const char *subsystem,
                                    const char *message,
                                    void *userdata);

/* ============================================================================
 * Lifecycle
 * ========================================================================= */

bool conduit_log_init(void);

/**
 * Open the log file in append mode and write a session banner.
 * Does nothing if logging is already initialized.
 *
 * @param path Log file path (NULL for the default)
 * @return false if the file cannot be opened
 */
bool conduit_log_init_with_path(const char *path);

/**
 * Write the closing banner and close the log file.
 */
void conduit_log_shutdown(void);

bool conduit_log_is_initialized(void);

/**
 * @return Path of the open log file, or NULL if not initialized
 */
const char *conduit_log_get_path(void);

/* ============================================================================
 * Settings
 * ========================================================================= */

void conduit_log_set_level(Conduit_LogLevel level);
Conduit_LogLevel conduit_log_get_level(void);

/**
 * Lower-case name of a level ("error", "warning", "info", "debug")
 */
const char *conduit_log_level_name(Conduit_LogLevel level);

/**
 * Toggle the SDL console echo (on by default).
 */
void conduit_log_set_console_output(bool enabled);

/* ============================================================================
 * Output
 * ========================================================================= */

void conduit_log_error(const char *subsystem, const char *fmt, ...);
void conduit_log_warning(const char *subsystem, const char *fmt, ...);
void conduit_log_info(const char *subsystem, const char *fmt, ...);
void conduit_log_debug(const char *subsystem, const char *fmt, ...);
void conduit_log_v(Conduit_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/**
 * Flush the log file. Error lines flush on their own.
 */
void conduit_log_flush(void);

/**
 * @return Handle for conduit_log_remove_callback(), 0 if callback is NULL
 *         or every slot is taken
 */
uint32_t conduit_log_add_callback(Conduit_LogCallback callback, void *userdata);
void conduit_log_remove_callback(uint32_t handle);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_LOG_H */
