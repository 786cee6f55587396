/**
 * @file error.h
 * @brief Last-error reporting
 *
 * Functions that fail return NULL, false or 0 and leave a message here.
 * Each thread has its own message; "nothing found" results are not
 * failures and leave it untouched.
 *
 * Usage:
 *   Conduit_NetworkManager *mgr = conduit_network_manager_create(&type);
 *   if (!mgr) {
 *       conduit_log_and_clear_error();
 *   }
 */

#ifndef CONDUIT_ERROR_H
#define CONDUIT_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Longest stored message, including the terminator */
#define CONDUIT_ERROR_MESSAGE_MAX 1024

/**
 * Replace the calling thread's error message (printf-style).
 * A NULL format clears it.
 */
void conduit_set_error(const char *fmt, ...);
void conduit_set_error_v(const char *fmt, va_list args);

/**
 * @return The calling thread's message, "" if none (do not free)
 */
const char *conduit_get_last_error(void);

void conduit_clear_error(void);
bool conduit_has_error(void);

/**
 * Write the pending message to the log at error level, then clear it.
 */
void conduit_log_and_clear_error(void);

#ifdef __cplusplus
}
#endif

#endif /* CONDUIT_ERROR_H */
