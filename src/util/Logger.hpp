#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace gitsync {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide logger
 *
 * Lines look like:
 *   2026-10-19 12:00:03 [info ] [cycle] upload: committed and pushed main
 *
 * Level comes from GITSYNC_LOG (error|warn|info|debug or 0-3) and can be
 * overridden from the command line. Error and warn go to stderr, the rest to
 * stdout. When a log file is attached every line is also appended there.
 * Safe to call from several threads.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Append all output to a file in addition to the console
    bool attachFile(const std::filesystem::path& path);
    void detachFile();

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Same as above with a component tag ("lock", "upload", ...)
    void error(const std::string& component, const std::string& msg) const;
    void warn(const std::string& component, const std::string& msg) const;
    void info(const std::string& component, const std::string& msg) const;
    void debug(const std::string& component, const std::string& msg) const;

    /// Parse a level name, returns false for unknown names
    static bool parseLevel(const std::string& text, LogLevel& out);

private:
    Logger();
    void write(LogLevel lvl, const std::string& component, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;
    mutable std::ofstream file;
};

}
