#include "util/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gitsync {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("GITSYNC_LOG");
    if (!env) return LogLevel::Info;
    LogLevel lvl = LogLevel::Info;
    Logger::parseLevel(env, lvl);
    return lvl;
}

static const char* levelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "[error] ";
        case LogLevel::Warn: return "[warn ] ";
        case LogLevel::Info: return "[info ] ";
        case LogLevel::Debug: return "[debug] ";
    }
    return "[?    ] ";
}

static std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

bool Logger::parseLevel(const std::string& v, LogLevel& out) {
    if (v == "debug" || v == "3") { out = LogLevel::Debug; return true; }
    if (v == "info" || v == "2") { out = LogLevel::Info; return true; }
    if (v == "warn" || v == "1") { out = LogLevel::Warn; return true; }
    if (v == "error" || v == "0") { out = LogLevel::Error; return true; }
    return false;
}

void Logger::setLevel(LogLevel level) {
    std::scoped_lock lock(mtx);
    currentLevel = level;
}

LogLevel Logger::level() const {
    std::scoped_lock lock(mtx);
    return currentLevel;
}

bool Logger::attachFile(const std::filesystem::path& path) {
    std::scoped_lock lock(mtx);
    if (file.is_open()) file.close();
    file.open(path, std::ios::app);
    return file.is_open();
}

void Logger::detachFile() {
    std::scoped_lock lock(mtx);
    if (file.is_open()) file.close();
}

void Logger::write(LogLevel lvl, const std::string& component, const std::string& msg) const {
    std::scoped_lock lock(mtx);
    if (currentLevel < lvl) return;
    std::string line = timestamp() + " " + levelTag(lvl);
    if (!component.empty()) line += "[" + component + "] ";
    line += msg;
    std::ostream& out = (lvl <= LogLevel::Warn) ? std::cerr : std::cout;
    out << line << "\n";
    out.flush();
    if (file.is_open()) {
        file << line << "\n";
        file.flush();
    }
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "", msg); }

void Logger::error(const std::string& c, const std::string& msg) const { write(LogLevel::Error, c, msg); }
void Logger::warn(const std::string& c, const std::string& msg) const { write(LogLevel::Warn, c, msg); }
void Logger::info(const std::string& c, const std::string& msg) const { write(LogLevel::Info, c, msg); }
void Logger::debug(const std::string& c, const std::string& msg) const { write(LogLevel::Debug, c, msg); }

}
