#include "trayhost/utils/logging.h"
#include "trayhost/error_types.h"
#include <atomic>

namespace trayhost {
namespace log {

namespace {
    std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
}

LogLevel parse_level(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    throw InvalidConfigException("unknown log level '" + name + "'");
}

std::string level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
    }
    return "info";
}

void set_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

void set_level(const std::string& name) {
    set_level(parse_level(name));
}

LogLevel level() {
    return static_cast<LogLevel>(g_level.load());
}

} // namespace log
} // namespace trayhost
