#include "bountygate/infra/Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace bountygate {

const char* to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> log_level_from_string(const std::string& s) {
    if (s == "DEBUG") return LogLevel::Debug;
    if (s == "INFO") return LogLevel::Info;
    if (s == "WARNING" || s == "WARN") return LogLevel::Warn;
    if (s == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

static std::string utc_iso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return os.str();
}

static std::string local_date_stamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y%m%d");
    return os.str();
}

static std::string json_line(LogLevel level, const std::string& tag, const std::string& msg) {
    nlohmann::json j{
        {"timestamp", utc_iso8601()},
        {"level", to_string(level)},
        {"component", tag},
        {"message", msg}
    };
    // Replace invalid UTF-8 coming from external tool output instead of throwing.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Logger::Logger(LogLevel console_level, LogFormat format, std::ostream& console)
    : console_level_(console_level), format_(format), console_(console) {}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

bool Logger::open_file(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        log(LogLevel::Warn, "LOG", "cannot create log directory " + dir + ": " + ec.message());
        return false;
    }

    std::string path = (fs::path(dir) / ("bountygate_" + local_date_stamp() + ".log")).string();
    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        file_.open(path, std::ios::out | std::ios::app);
        opened = file_.is_open();
        if (opened) {
            file_path_ = path;
        }
    }
    if (!opened) {
        log(LogLevel::Warn, "LOG", "cannot open log file " + path);
        return false;
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (level >= console_level_) {
        if (format_ == LogFormat::Json) {
            console_ << json_line(level, tag, msg) << "\n";
        } else {
            console_ << "[" << tag << "] ";
            if (level == LogLevel::Warn) console_ << "WARNING: ";
            if (level == LogLevel::Error) console_ << "ERROR: ";
            console_ << msg << "\n";
        }
        console_.flush();
    }

    if (file_.is_open()) {
        file_ << json_line(level, tag, msg) << "\n";
        file_.flush();
    }
}

std::string Logger::file_path() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return file_path_;
}

} // namespace bountygate
