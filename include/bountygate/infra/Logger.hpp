#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace bountygate {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* to_string(LogLevel l);
std::optional<LogLevel> log_level_from_string(const std::string& s);

enum class LogFormat : uint8_t {
    Text,
    Json
};

// ---------------------------------------------------------------------------
// Process logger. Constructed once in main() and handed to every component
// by reference; there is no global instance.
//
// Console sink: "[TAG] message" (text) or one JSON object per line.
// File sink (optional): always JSON lines, always from DEBUG upward.
// ---------------------------------------------------------------------------
class Logger {
public:
    Logger(LogLevel console_level, LogFormat format, std::ostream& console);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Opens <dir>/bountygate_<YYYYMMDD>.log in append mode. Returns false and
    // keeps logging to the console when the file cannot be opened.
    bool open_file(const std::string& dir);

    void log(LogLevel level, const std::string& tag, const std::string& msg);

    void debug(const std::string& tag, const std::string& msg) { log(LogLevel::Debug, tag, msg); }
    void info(const std::string& tag, const std::string& msg)  { log(LogLevel::Info, tag, msg); }
    void warn(const std::string& tag, const std::string& msg)  { log(LogLevel::Warn, tag, msg); }
    void error(const std::string& tag, const std::string& msg) { log(LogLevel::Error, tag, msg); }

    std::string file_path() const;

private:
    LogLevel console_level_;
    LogFormat format_;
    std::ostream& console_;
    std::ofstream file_;
    std::string file_path_;
    mutable std::mutex mtx_;
};

} // namespace bountygate
