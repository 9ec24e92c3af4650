/**
 * @file Logger.h
 * @brief Minimal file logger writing to ./<command>.log
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <exception>
#include <optional>
#include <string>

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Initialize using argv[0] to derive <command>.log path.
    static void initFromArgv0(const char* argv0);
    // Initialize explicitly with a filename (relative or absolute).
    static void init(const std::string& filename);
    // Flush and close the log file; safe to call multiple times.
    static void shutdown();
    // Whether a log file is currently open.
    static bool isOpen();

    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void debug(const std::string& msg);

    // Convenience helpers for exception logging
    static void logException(const std::string& where, const std::exception& e);
    static void logUnknownException(const std::string& where);

    // Control log level (default: Info). Also honors SANDGLASS_LOG_LEVEL, then LOG_LEVEL.
    static void setLevel(Level lvl);
    static Level level();
    static bool enabled(Level lvl);

    /** @brief Parse "debug", "info", "warn"/"warning", "error", "none"/"off" (case-insensitive). */
    static std::optional<Level> parseLevel(const std::string& text);

private:
    static void logImpl(Level lvl, const std::string& msg);
};
