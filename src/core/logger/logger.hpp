#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace Strider {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_DEBUG   = 1 << 4,
    LOG_ALL     = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS | LOG_DEBUG
};

class Logger {
public:
    static void set_level(int level);
    static int  level();

    // "none", "error", "warn", "info", "debug" or "all". Each level includes the
    // ones above it. Throws ConfigError on anything else.
    static int parse_level(const std::string& name);

    // Mirror every emitted line (without colors) into a file. Empty path closes it.
    static bool set_file(const std::string& path);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static int           level_;
    static std::mutex    mutex_;
    static std::ofstream file_;

    static void write_file(const char* tag, const std::string& message);
};

}  // namespace Core
}  // namespace Strider
