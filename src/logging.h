#ifndef REVERIE_LOGGING_H
#define REVERIE_LOGGING_H

#include <cstdarg>
#include <cstdint>
#include <cstdio>

// Platform output: Serial on the device, stdout on host builds
#ifdef ARDUINO
    #include <Arduino.h>
    #define REVERIE_LOG_MILLIS()    ::millis()
    #define REVERIE_LOG_WRITE(str)  Serial.println(str)
#else
    #include <ctime>
    #define REVERIE_LOG_MILLIS()    static_cast<uint32_t>(std::clock() / (CLOCKS_PER_SEC / 1000))
    #define REVERIE_LOG_WRITE(str)  printf("%s\n", str)
#endif

// ============================================
// Structured Logging System
// ============================================

// Log levels (can be filtered at compile time)
enum class LogLevel : uint8_t {
    DEBUG = 0,   // Verbose debugging info
    INFO = 1,    // Normal operational messages
    WARN = 2,    // Warning conditions
    ERROR = 3,   // Error conditions
    NONE = 4     // Disable all logging
};

// Set minimum log level (compile-time filter)
#ifndef LOG_LEVEL
#define LOG_LEVEL LogLevel::DEBUG
#endif

// Component tags for filtering/identification
namespace LogTag {
    constexpr const char* MAIN = "MAIN";
    constexpr const char* ENGINE = "ENG";
    constexpr const char* MEMORY = "MEM";
    constexpr const char* EFFECT = "FX";
    constexpr const char* DISPLAY = "TFT";
    constexpr const char* CONFIG = "CFG";
}

class Logger {
public:
    static void log(LogLevel level, const char* tag, const char* format, ...) {
        if (level < LOG_LEVEL) return;

        char line[256];
        int used = snprintf(line, sizeof(line), "[%8lu] [%c] [%-4s] ",
                            static_cast<unsigned long>(REVERIE_LOG_MILLIS()),
                            levelChar(level), tag);
        if (used < 0 || used >= static_cast<int>(sizeof(line))) {
            used = 0;
        }

        va_list args;
        va_start(args, format);
        vsnprintf(line + used, sizeof(line) - used, format, args);
        va_end(args);

        REVERIE_LOG_WRITE(line);
    }

private:
    static char levelChar(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return 'D';
            case LogLevel::INFO:  return 'I';
            case LogLevel::WARN:  return 'W';
            case LogLevel::ERROR: return 'E';
            default:              return '?';
        }
    }
};

// Convenience macros for logging
#define LOG_DEBUG(tag, fmt, ...) Logger::log(LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  Logger::log(LogLevel::INFO, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  Logger::log(LogLevel::WARN, tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...) Logger::log(LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)

#endif // REVERIE_LOGGING_H
