/**
 * @file logger.cpp
 * @brief Implementation of the TeleSqueeze logging system
 *
 * @author Team PowerPort
 * @date 2025-11-05
 */

#include "peripheral/logger.h"

#include <stdarg.h>
#include <stdio.h>

#include <atomic>
#include <chrono>
#include <mutex>

namespace {

// Default level; tests and the demo lower or raise it with setLogLevel()
std::atomic<int> currentLevel{LOG_LEVEL_INFO};

std::mutex outputMutex;

const std::chrono::steady_clock::time_point loggerEpoch = std::chrono::steady_clock::now();

// Milliseconds since start-up as hh:mm:ss.mmm
void formatElapsed(char* out, size_t outSize) {
    auto elapsed = std::chrono::steady_clock::now() - loggerEpoch;
    unsigned long long ms = (unsigned long long)
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    unsigned long long seconds = ms / 1000;
    unsigned long long minutes = seconds / 60;
    unsigned long long hours = minutes / 60;

    snprintf(out, outSize, "[%02llu:%02llu:%02llu.%03llu]",
             hours, minutes % 60, seconds % 60, ms % 1000);
}

const char* levelName(int level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "DEBUG";
        case LOG_LEVEL_INFO:  return "INFO";
        case LOG_LEVEL_WARN:  return "WARN";
        case LOG_LEVEL_ERROR: return "ERROR";
        case LOG_LEVEL_NONE:  return "NONE";
    }
    return "?";
}

} // namespace

void setLogLevel(LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return (LogLevel)currentLevel.load(std::memory_order_relaxed);
}

bool logEnabled(LogLevel level) {
    return currentLevel.load(std::memory_order_relaxed) <= level;
}

void logWrite(const char* tag, const char* symbol, const char* format, ...) {
    char stamp[24];
    formatElapsed(stamp, sizeof(stamp));

    char message[512];
    va_list args;
    va_start(args, format);
    int length = vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(outputMutex);
    fprintf(stderr, "%s [%-10s] %s %s%s\n", stamp, tag, symbol, message,
            length >= (int)sizeof(message) ? "..." : "");
}

void logSection(const char* title) {
    char stamp[24];
    formatElapsed(stamp, sizeof(stamp));

    std::lock_guard<std::mutex> lock(outputMutex);
    fprintf(stderr, "%s ═══════════════════════════════════════════\n", stamp);
    fprintf(stderr, "%s %s\n", stamp, title);
    fprintf(stderr, "%s ═══════════════════════════════════════════\n", stamp);
}

void logDivider() {
    std::lock_guard<std::mutex> lock(outputMutex);
    fprintf(stderr, "────────────────────────────────────────────────────────────\n");
}

void initLogger() {
    std::lock_guard<std::mutex> lock(outputMutex);
    fprintf(stderr, "\n");
    fprintf(stderr, "╔════════════════════════════════════════════════════════════╗\n");
    fprintf(stderr, "║                  TeleSqueeze engine logger                 ║\n");
    fprintf(stderr, "╚════════════════════════════════════════════════════════════╝\n");
    fprintf(stderr, "Log level: %s\n\n", levelName(currentLevel.load(std::memory_order_relaxed)));
}
