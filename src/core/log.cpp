/**
 * @file log.cpp
 * @brief Logging implementation
 *
 * All state lives in one static LogState. Every line is formatted once and
 * then fanned out to the file, the SDL console and the callbacks.
 */

#include "conduit/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#if defined(_WIN32)
    #define CONDUIT_DEFAULT_LOG_PATH "conduit.log"
#else
    #define CONDUIT_DEFAULT_LOG_PATH "/tmp/conduit.log"
#endif

#define LOG_MESSAGE_MAX 1024
#define LOG_SUBSYSTEM_WIDTH 10

/* ============================================================================
 * Internal State
 * ========================================================================= */

struct CallbackSlot {
    Conduit_LogCallback callback;
    void *userdata;
    uint32_t handle;        /* 0 while the slot is free */
};

struct LogState {
    FILE *file;
    char path[512];
    Conduit_LogLevel level;
    bool console;
    CallbackSlot slots[CONDUIT_LOG_MAX_CALLBACKS];
    uint32_t next_handle;
};

static LogState s_log = {
    NULL, {0}, CONDUIT_LOG_LEVEL_INFO, true, {}, 1
};

struct LevelInfo {
    const char *name;           /* Config spelling */
    const char *label;          /* File column, 7 wide */
    SDL_LogPriority priority;   /* Console priority */
};

static const LevelInfo k_levels[CONDUIT_LOG_LEVEL_COUNT] = {
    { "error",   "ERROR  ", SDL_LOG_PRIORITY_ERROR },
    { "warning", "WARNING", SDL_LOG_PRIORITY_WARN },
    { "info",    "INFO   ", SDL_LOG_PRIORITY_INFO },
    { "debug",   "DEBUG  ", SDL_LOG_PRIORITY_DEBUG },
};

static bool level_in_range(Conduit_LogLevel level) {
    return (int)level >= 0 && (int)level < CONDUIT_LOG_LEVEL_COUNT;
}

/* ============================================================================
 * File Output
 * ========================================================================= */

static void format_now(char *buf, size_t size) {
    time_t now = time(NULL);
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", localtime(&now));
}

static void write_banner(const char *title) {
    if (!s_log.file) return;

    static const char rule[] =
        "================================================================================";
    char when[32];
    format_now(when, sizeof(when));

    fprintf(s_log.file, "%s\n=== %s: %s\n%s\n", rule, title, when, rule);
    fflush(s_log.file);
}

/* ============================================================================
 * Lifecycle
 * ========================================================================= */

bool conduit_log_init(void) {
    return conduit_log_init_with_path(NULL);
}

bool conduit_log_init_with_path(const char *path) {
    if (s_log.file) return true;

    snprintf(s_log.path, sizeof(s_log.path), "%s", path ? path : CONDUIT_DEFAULT_LOG_PATH);

    s_log.file = fopen(s_log.path, "a");
    if (!s_log.file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot open log file %s", s_log.path);
        s_log.path[0] = '\0';
        return false;
    }

    fputc('\n', s_log.file);
    write_banner("Conduit - Session Start");
    return true;
}

void conduit_log_shutdown(void) {
    if (!s_log.file) return;

    write_banner("Session End");
    fputc('\n', s_log.file);
    fclose(s_log.file);

    s_log.file = NULL;
    s_log.path[0] = '\0';
}

bool conduit_log_is_initialized(void) {
    return s_log.file != NULL;
}

const char *conduit_log_get_path(void) {
    return s_log.file ? s_log.path : NULL;
}

/* ============================================================================
 * Settings
 * ========================================================================= */

void conduit_log_set_level(Conduit_LogLevel level) {
    if (level_in_range(level)) s_log.level = level;
}

Conduit_LogLevel conduit_log_get_level(void) {
    return s_log.level;
}

const char *conduit_log_level_name(Conduit_LogLevel level) {
    return level_in_range(level) ? k_levels[level].name : "unknown";
}

void conduit_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

/* ============================================================================
 * Output
 * ========================================================================= */

void conduit_log_v(Conduit_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    if (!level_in_range(level)) return;
    if (level != CONDUIT_LOG_LEVEL_ERROR && level > s_log.level) return;

    char message[LOG_MESSAGE_MAX];
    vsnprintf(message, sizeof(message), fmt ? fmt : "", args);

    char tag[LOG_SUBSYSTEM_WIDTH + 1];
    snprintf(tag, sizeof(tag), "%-*s", LOG_SUBSYSTEM_WIDTH, subsystem ? subsystem : "Unknown");

    if (s_log.file) {
        char when[32];
        format_now(when, sizeof(when));
        fprintf(s_log.file, "[%s] [%s] [%s] %s\n", when, k_levels[level].label, tag, message);
        if (level == CONDUIT_LOG_LEVEL_ERROR) fflush(s_log.file);
    }

    if (s_log.console) {
        SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, k_levels[level].priority, "[%s] %s", tag, message);
    }

    for (int i = 0; i < CONDUIT_LOG_MAX_CALLBACKS; i++) {
        const CallbackSlot &slot = s_log.slots[i];
        if (slot.handle != 0) {
            slot.callback(level, tag, message, slot.userdata);
        }
    }
}

#define CONDUIT_LOG_FORWARD(level) \
    do { \
        va_list args; \
        va_start(args, fmt); \
        conduit_log_v((level), subsystem, fmt, args); \
        va_end(args); \
    } while (0)

void conduit_log_error(const char *subsystem, const char *fmt, ...) {
    CONDUIT_LOG_FORWARD(CONDUIT_LOG_LEVEL_ERROR);
}

void conduit_log_warning(const char *subsystem, const char *fmt, ...) {
    CONDUIT_LOG_FORWARD(CONDUIT_LOG_LEVEL_WARNING);
}

void conduit_log_info(const char *subsystem, const char *fmt, ...) {
    CONDUIT_LOG_FORWARD(CONDUIT_LOG_LEVEL_INFO);
}

void conduit_log_debug(const char *subsystem, const char *fmt, ...) {
    CONDUIT_LOG_FORWARD(CONDUIT_LOG_LEVEL_DEBUG);
}

void conduit_log_flush(void) {
    if (s_log.file) fflush(s_log.file);
}

/* ============================================================================
 * Callbacks
 * ========================================================================= */

uint32_t conduit_log_add_callback(Conduit_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < CONDUIT_LOG_MAX_CALLBACKS; i++) {
        CallbackSlot &slot = s_log.slots[i];
        if (slot.handle == 0) {
            slot.callback = callback;
            slot.userdata = userdata;
            slot.handle = s_log.next_handle++;
            return slot.handle;
        }
    }
    return 0;
}

void conduit_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < CONDUIT_LOG_MAX_CALLBACKS; i++) {
        CallbackSlot &slot = s_log.slots[i];
        if (slot.handle == handle) {
            slot = CallbackSlot();
            return;
        }
    }
}
