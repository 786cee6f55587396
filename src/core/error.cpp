/**
 * @file error.cpp
 * @brief Per-thread error message storage
 */

#include "conduit/error.h"
#include "conduit/log.h"
#include <stdio.h>

#if defined(_MSC_VER)
    #define CONDUIT_THREAD_LOCAL __declspec(thread)
#else
    #define CONDUIT_THREAD_LOCAL thread_local
#endif

static CONDUIT_THREAD_LOCAL char t_message[CONDUIT_ERROR_MESSAGE_MAX] = {0};

void conduit_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    conduit_set_error_v(fmt, args);
    va_end(args);
}

void conduit_set_error_v(const char *fmt, va_list args) {
    t_message[0] = '\0';
    if (fmt) vsnprintf(t_message, sizeof(t_message), fmt, args);
}

const char *conduit_get_last_error(void) {
    return t_message;
}

void conduit_clear_error(void) {
    t_message[0] = '\0';
}

bool conduit_has_error(void) {
    return t_message[0] != '\0';
}

void conduit_log_and_clear_error(void) {
    if (!conduit_has_error()) return;
    conduit_log_error(CONDUIT_LOG_CORE, "%s", t_message);
    conduit_clear_error();
}
