#pragma once

#include <iostream>
#include <string>

// Undefine Windows macros that conflict with our enums
#ifdef ERROR
#undef ERROR
#endif

namespace trayhost {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

namespace log {

// Accepts the same names as the --log-level option
LogLevel parse_level(const std::string& name);
std::string level_name(LogLevel level);

void set_level(LogLevel level);
void set_level(const std::string& name);
LogLevel level();

inline bool is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(::trayhost::log::level());
}

} // namespace log
} // namespace trayhost

// Helper macros for logging, streamed like std::cout
#define TRAYHOST_LOG_DEBUG(msg) \
    do { \
        if (::trayhost::log::is_enabled(::trayhost::LogLevel::DEBUG)) { \
            std::cout << "DEBUG: " << msg << std::endl; \
        } \
    } while (0)

#define TRAYHOST_LOG_INFO(msg) \
    do { \
        if (::trayhost::log::is_enabled(::trayhost::LogLevel::INFO)) { \
            std::cout << msg << std::endl; \
        } \
    } while (0)

#define TRAYHOST_LOG_WARNING(msg) \
    do { \
        if (::trayhost::log::is_enabled(::trayhost::LogLevel::WARNING)) { \
            std::cerr << "WARNING: " << msg << std::endl; \
        } \
    } while (0)

#define TRAYHOST_LOG_ERROR(msg) \
    do { \
        if (::trayhost::log::is_enabled(::trayhost::LogLevel::ERROR)) { \
            std::cerr << "ERROR: " << msg << std::endl; \
        } \
    } while (0)
