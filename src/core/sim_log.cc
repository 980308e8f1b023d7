// src/core/sim_log.cc
#include "sim_log.hh"

const char* logLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

bool parseLogLevel(const std::string& s, LogLevel& out) {
    if (s == "error") out = LogLevel::Error;
    else if (s == "warn" || s == "warning") out = LogLevel::Warn;
    else if (s == "info") out = LogLevel::Info;
    else if (s == "debug") out = LogLevel::Debug;
    else if (s == "off") out = LogLevel::Off;
    else return false;
    return true;
}

bool SimLog::open(const std::string& path) {
    close();
    if (path.empty()) {
        sink = stderr;
        return true;
    }
    FILE* f = std::fopen(path.c_str(), "w");
    if (!f) {
        std::fprintf(stderr, "[ERROR] Cannot open log file: %s\n", path.c_str());
        return false;
    }
    sink = f;
    owns_sink = true;
    return true;
}

void SimLog::close() {
    if (!sink) return;
    std::fflush(sink);
    if (owns_sink) {
        std::fclose(sink);
        sink = stderr;
        owns_sink = false;
    }
}

void SimLog::setSink(FILE* f) {
    close();
    sink = f;
}

void SimLog::resetCounts() {
    for (auto& c : counts) c = 0;
}

void SimLog::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    if (lvl == LogLevel::Off) return;
    counts[static_cast<uint8_t>(lvl)]++;
    if (!enabled(lvl) || !sink) return;

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    double t = clock ? clock() : 0.0;
    std::fprintf(sink, "[%s][t=%.4f][%s] %s\n", logLevelName(lvl), t, tag, buf);
}
