#pragma once
/*
 * Logging macros shared by all modules. Each translation unit defines its own
 * `TAG` and passes it as the first argument, e.g.:
 *
 *   #define TAG "board"
 *   LOG_DEBUG(TAG, "Revealed %d cells", count);
 *
 * Debug messages are compiled out unless `MINEFIELD_DEBUG_LOGGING` is defined
 * (controlled by the CMake option of the same name).
 */

enum class LogLevel : int {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
};

const char *log_level_to_str(LogLevel level);

/**
 * Messages below the given level are dropped at runtime. Defaults to
 * `LogLevel::Debug` so that a debug build prints everything.
 */
void set_log_level(LogLevel level);
LogLevel get_log_level();

void log_message(LogLevel level, const char *tag, const char *format, ...)
    __attribute__((format(printf, 3, 4)));

#ifdef MINEFIELD_DEBUG_LOGGING
#define LOG_DEBUG(tag, ...) log_message(LogLevel::Debug, tag, __VA_ARGS__)
#else
// Keeps the arguments type-checked without emitting anything.
#define LOG_DEBUG(tag, ...)                                                    \
        do {                                                                   \
                if (false)                                                     \
                        log_message(LogLevel::Debug, tag, __VA_ARGS__);        \
        } while (0)
#endif

#define LOG_INFO(tag, ...) log_message(LogLevel::Info, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...) log_message(LogLevel::Warn, tag, __VA_ARGS__)
#define LOG_ERROR(tag, ...) log_message(LogLevel::Error, tag, __VA_ARGS__)
