// include/sim_log.hh
#ifndef SIM_LOG_HH
#define SIM_LOG_HH

#include "sim_core.hh"
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <string>

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Off = 255,
};

const char* logLevelName(LogLevel lvl);
bool parseLogLevel(const std::string& s, LogLevel& out);

/**
 * Per-run logging sink.
 *
 * One SimLog belongs to one simulation run and is handed to every
 * component through its EventQueue. open()/close() bracket the run;
 * lines are written as "[LEVEL][t=<sim time>][<tag>] message".
 */
class SimLog {
private:
    LogLevel level = LogLevel::Warn;
    FILE* sink = stderr;
    bool owns_sink = false;
    std::function<SimTime()> clock;
    uint64_t counts[4] = {0, 0, 0, 0};

public:
    SimLog() = default;
    explicit SimLog(LogLevel lvl) : level(lvl) {}
    ~SimLog() { close(); }

    SimLog(const SimLog&) = delete;
    SimLog& operator=(const SimLog&) = delete;

    // Redirect output to a file; empty path keeps stderr.
    bool open(const std::string& path);
    void close();

    void setLevel(LogLevel lvl) { level = lvl; }
    LogLevel getLevel() const { return level; }
    void setSink(FILE* f);
    void setClock(std::function<SimTime()> c) { clock = std::move(c); }

    bool enabled(LogLevel lvl) const {
        if (level == LogLevel::Off || lvl == LogLevel::Off) return false;
        return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level);
    }

    void logf(LogLevel lvl, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    // Messages seen at a level, counted even when filtered out
    uint64_t count(LogLevel lvl) const {
        return lvl == LogLevel::Off ? 0 : counts[static_cast<uint8_t>(lvl)];
    }
    void resetCounts();
};

#define SLOG_ERROR(log, tag, fmt, ...) (log).logf(LogLevel::Error, #tag, fmt, ##__VA_ARGS__)
#define SLOG_WARN(log, tag, fmt, ...)  (log).logf(LogLevel::Warn,  #tag, fmt, ##__VA_ARGS__)
#define SLOG_INFO(log, tag, fmt, ...)  (log).logf(LogLevel::Info,  #tag, fmt, ##__VA_ARGS__)
#define SLOG_DEBUG(log, tag, fmt, ...) (log).logf(LogLevel::Debug, #tag, fmt, ##__VA_ARGS__)

#endif // SIM_LOG_HH
