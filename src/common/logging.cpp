#include "logging.hpp"
#include <cstdarg>
#include <cstdio>

static LogLevel current_level = LogLevel::Debug;

const char *log_level_to_str(LogLevel level)
{
        switch (level) {
        case LogLevel::Debug:
                return "DEBUG";
        case LogLevel::Info:
                return "INFO";
        case LogLevel::Warn:
                return "WARN";
        case LogLevel::Error:
                return "ERROR";
        default:
                return "UNKNOWN";
        }
}

void set_log_level(LogLevel level) { current_level = level; }

LogLevel get_log_level() { return current_level; }

void log_message(LogLevel level, const char *tag, const char *format, ...)
{
        if (static_cast<int>(level) < static_cast<int>(current_level)) {
                return;
        }

        std::fprintf(stderr, "[%s] %s: ", log_level_to_str(level), tag);

        va_list args;
        va_start(args, format);
        std::vfprintf(stderr, format, args);
        va_end(args);

        std::fputc('\n', stderr);
}
