/**
 * @file logger.h
 * @brief Tagged, levelled logging for the TeleSqueeze engine
 *
 * Lines go to stderr as `[hh:mm:ss.mmm] [TAG       ] symbol message`.
 * Session workers log from several threads, so every line is formatted
 * first and written under one lock; lines never interleave.
 *
 * The level is one process-wide setting, changed at runtime with
 * setLogLevel(). Disabled levels cost a single atomic load.
 *
 * @author Team PowerPort
 * @date 2025-11-05
 */

#ifndef LOGGER_H
#define LOGGER_H

#include <stdint.h>

// ============================================
// Log Levels
// ============================================
enum LogLevel {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO = 1,
    LOG_LEVEL_WARN = 2,
    LOG_LEVEL_ERROR = 3,
    LOG_LEVEL_NONE = 4  // Disable all logging
};

// ============================================
// Module Tags
// ============================================
#define LOG_TAG_BOOT        "BOOT"
#define LOG_TAG_SEGMENT     "SEGMENT"
#define LOG_TAG_SIMILAR     "SIMILAR"
#define LOG_TAG_POOL        "POOL"
#define LOG_TAG_THRESH      "THRESH"
#define LOG_TAG_COMPRESS    "COMPRESS"
#define LOG_TAG_DECOMP      "DECOMP"
#define LOG_TAG_SESSION     "SESSION"
#define LOG_TAG_CODEC       "CODEC"
#define LOG_TAG_CONFIG      "CONFIG"
#define LOG_TAG_STATS       "STATS"
#define LOG_TAG_SIM         "SIM"

// ============================================
// Level Control
// ============================================
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

/**
 * @brief True when messages of `level` are currently printed
 */
bool logEnabled(LogLevel level);

// ============================================
// Output
// ============================================

/**
 * @brief Format and write one log line
 *
 * @param tag Module tag, padded to 10 columns
 * @param symbol Four-column marker printed before the message
 * @param format printf-style format
 */
void logWrite(const char* tag, const char* symbol, const char* format, ...);

/**
 * @brief Write a boxed section title
 */
void logSection(const char* title);

/**
 * @brief Write a horizontal divider line
 */
void logDivider();

/**
 * @brief Print the logger banner with the active level
 */
void initLogger();

// ============================================
// Logging Macros
// ============================================
#define _LOG(level, tag, symbol, format, ...) \
    do { \
        if (logEnabled(level)) { \
            logWrite(tag, symbol, format, ##__VA_ARGS__); \
        } \
    } while (0)

#define LOG_DEBUG(tag, format, ...)   _LOG(LOG_LEVEL_DEBUG, tag, "    ", format, ##__VA_ARGS__)
#define LOG_INFO(tag, format, ...)    _LOG(LOG_LEVEL_INFO,  tag, "    ", format, ##__VA_ARGS__)
#define LOG_WARN(tag, format, ...)    _LOG(LOG_LEVEL_WARN,  tag, "[!] ", format, ##__VA_ARGS__)
#define LOG_ERROR(tag, format, ...)   _LOG(LOG_LEVEL_ERROR, tag, "✗   ", format, ##__VA_ARGS__)

// Printed at INFO level with a check mark
#define LOG_SUCCESS(tag, format, ...) _LOG(LOG_LEVEL_INFO,  tag, "✓   ", format, ##__VA_ARGS__)

#define LOG_SECTION(title) \
    do { \
        if (logEnabled(LOG_LEVEL_INFO)) { \
            logSection(title); \
        } \
    } while (0)

#define LOG_DIVIDER() \
    do { \
        if (logEnabled(LOG_LEVEL_INFO)) { \
            logDivider(); \
        } \
    } while (0)

#endif // LOGGER_H
