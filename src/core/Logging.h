#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <ostream>

namespace sb_modsign {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Diagnostic log (stderr). Operator-facing status lines go through Console.
class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    void set_stream(std::ostream* os);
    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m) { log(LogLevel::Error, m); }
    void warn(const std::string& m) { log(LogLevel::Warn, m); }
    void info(const std::string& m) { log(LogLevel::Info, m); }
    void debug(const std::string& m) { log(LogLevel::Debug, m); }
    void trace(const std::string& m) { log(LogLevel::Trace, m); }
private:
    Logger() = default;
    const char* prefix(LogLevel lvl) const;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::ostream* out_ = nullptr; // nullptr = std::cerr
    std::mutex mutex_;
};

bool parse_log_level(const std::string& s, LogLevel& out);

}
