/*
 * Conduit Logging Tests
 *
 * Tests for level filtering, log callbacks and the log file.
 */

#include <catch2/catch_test_macros.hpp>
#include "conduit/log.h"
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

struct CapturedLine {
    Conduit_LogLevel level;
    std::string subsystem;
    std::string message;
};

static void capture_callback(Conduit_LogLevel level, const char *subsystem,
                             const char *message, void *userdata) {
    std::vector<CapturedLine> *lines = static_cast<std::vector<CapturedLine> *>(userdata);
    CapturedLine line;
    line.level = level;
    line.subsystem = subsystem;
    line.message = message;
    lines->push_back(line);
}

/* ============================================================================
 * Level Filtering
 * ============================================================================ */

TEST_CASE("Log level filtering", "[log][level]") {
    conduit_log_set_console_output(false);
    Conduit_LogLevel saved = conduit_log_get_level();

    std::vector<CapturedLine> lines;
    uint32_t handle = conduit_log_add_callback(capture_callback, &lines);
    REQUIRE(handle != 0);

    SECTION("Info level drops debug") {
        conduit_log_set_level(CONDUIT_LOG_LEVEL_INFO);
        conduit_log_debug(CONDUIT_LOG_NETWORK, "hidden");
        conduit_log_info(CONDUIT_LOG_NETWORK, "shown %d", 1);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].level == CONDUIT_LOG_LEVEL_INFO);
        REQUIRE(lines[0].message == "shown 1");
    }

    SECTION("Debug level keeps everything") {
        conduit_log_set_level(CONDUIT_LOG_LEVEL_DEBUG);
        conduit_log_debug(CONDUIT_LOG_NETWORK, "a");
        conduit_log_info(CONDUIT_LOG_NETWORK, "b");
        conduit_log_warning(CONDUIT_LOG_NETWORK, "c");
        REQUIRE(lines.size() == 3);
    }

    SECTION("Errors pass any level") {
        conduit_log_set_level(CONDUIT_LOG_LEVEL_ERROR);
        conduit_log_warning(CONDUIT_LOG_REGISTRY, "hidden");
        conduit_log_error(CONDUIT_LOG_REGISTRY, "shown");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].level == CONDUIT_LOG_LEVEL_ERROR);
    }

    SECTION("Subsystem is padded") {
        conduit_log_set_level(CONDUIT_LOG_LEVEL_INFO);
        conduit_log_info(CONDUIT_LOG_WORLD, "x");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].subsystem.size() == 10);
        REQUIRE(lines[0].subsystem.compare(0, 5, "World") == 0);
    }

    conduit_log_remove_callback(handle);
    conduit_log_set_level(saved);
}

TEST_CASE("Log level names", "[log][level]") {
    REQUIRE(strcmp(conduit_log_level_name(CONDUIT_LOG_LEVEL_ERROR), "error") == 0);
    REQUIRE(strcmp(conduit_log_level_name(CONDUIT_LOG_LEVEL_DEBUG), "debug") == 0);
    REQUIRE(strcmp(conduit_log_level_name((Conduit_LogLevel)7), "unknown") == 0);

    /* Out-of-range levels are not applied */
    Conduit_LogLevel saved = conduit_log_get_level();
    conduit_log_set_level((Conduit_LogLevel)7);
    REQUIRE(conduit_log_get_level() == saved);
}

/* ============================================================================
 * Callbacks
 * ============================================================================ */

TEST_CASE("Log callbacks", "[log][callback]") {
    conduit_log_set_console_output(false);

    SECTION("NULL callback is rejected") {
        REQUIRE(conduit_log_add_callback(nullptr, nullptr) == 0);
    }

    SECTION("Removed callback stops receiving") {
        std::vector<CapturedLine> lines;
        uint32_t handle = conduit_log_add_callback(capture_callback, &lines);
        conduit_log_error(CONDUIT_LOG_CORE, "one");
        conduit_log_remove_callback(handle);
        conduit_log_error(CONDUIT_LOG_CORE, "two");
        REQUIRE(lines.size() == 1);
    }

    SECTION("Slots run out") {
        std::vector<uint32_t> handles;
        for (int i = 0; i < 16; i++) {
            uint32_t h = conduit_log_add_callback(capture_callback, nullptr);
            if (h == 0) break;
            handles.push_back(h);
        }
        REQUIRE(handles.size() == CONDUIT_LOG_MAX_CALLBACKS);
        for (size_t i = 0; i < handles.size(); i++) {
            conduit_log_remove_callback(handles[i]);
        }
    }

    SECTION("Removing unknown handles is safe") {
        conduit_log_remove_callback(0);
        conduit_log_remove_callback(999999);
    }
}

/* ============================================================================
 * Log File
 * ============================================================================ */

TEST_CASE("Log file lifecycle", "[log][file]") {
    conduit_log_set_console_output(false);
    conduit_log_shutdown();

    const char *path = "conduit_test_log.txt";
    std::remove(path);

    REQUIRE(conduit_log_init_with_path(path));
    REQUIRE(conduit_log_is_initialized());
    REQUIRE(strcmp(conduit_log_get_path(), path) == 0);

    /* Second init is a no-op */
    REQUIRE(conduit_log_init_with_path("ignored.txt"));
    REQUIRE(strcmp(conduit_log_get_path(), path) == 0);

    conduit_log_error(CONDUIT_LOG_CORE, "written to file");
    conduit_log_flush();
    conduit_log_shutdown();
    REQUIRE_FALSE(conduit_log_is_initialized());
    REQUIRE(conduit_log_get_path() == nullptr);

    FILE *fp = std::fopen(path, "r");
    REQUIRE(fp != nullptr);
    std::string contents;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), fp)) {
        contents += buf;
    }
    std::fclose(fp);
    std::remove(path);

    REQUIRE(contents.find("Session Start") != std::string::npos);
    REQUIRE(contents.find("written to file") != std::string::npos);
    REQUIRE(contents.find("Session End") != std::string::npos);
}
