// =============================================================================
// CastLink - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging. Every line goes through one formatter
// and then to stderr, the optional log file and an optional sink.
// Usage: CLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>
#include <functional>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#endif

namespace castlink::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

// One formatted log entry, as handed to a sink
struct Record {
    Level level = Level::Info;
    std::string tag;
    std::string message;
    unsigned long thread = 0;
    std::string line;   // the full text written to stderr / file, no newline
};

using Sink = std::function<void(const Record&)>;

inline std::atomic<Level> g_min_level{Level::Info};
inline std::atomic<bool> g_to_stderr{true};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;
inline Sink g_sink;

static constexpr size_t MAX_MESSAGE = 2048;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "trace" / "debug" / "info" / "warn" / "error" / "fatal"; unknown -> Info
inline Level parseLevel(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(); }
inline bool enabled(Level l) { return l >= g_min_level.load(std::memory_order_relaxed); }

inline void setStderrEnabled(bool on) { g_to_stderr = on; }

// Receives every record that passes the level filter; empty sink disables it.
// Called under the log mutex, so it must not log.
inline void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite: one log per process run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline unsigned long currentThreadTag() {
#ifdef _WIN32
    return static_cast<unsigned long>(GetCurrentThreadId());
#else
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFFFF);
#endif
}

// "HH:MM:SS.mmm [LEVEL] [tag] (Ttid) message"
inline std::string formatLine(std::chrono::system_clock::time_point when, Level level,
                              const char* tag, unsigned long tid, const std::string& msg) {
    auto time_t_now = std::chrono::system_clock::to_time_t(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    char prefix[96];
    snprintf(prefix, sizeof(prefix), "%02d:%02d:%02d.%03d [%s] [%s] (T%lu) ",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()),
             levelStr(level), tag, tid);
    return prefix + msg;
}

inline void vwrite(Level level, const char* tag, const char* fmt, va_list args) {
    if (!enabled(level)) return;

    char msg[MAX_MESSAGE];
    vsnprintf(msg, sizeof(msg), fmt, args);

    Record rec;
    rec.level = level;
    rec.tag = tag;
    rec.message = msg;
    rec.thread = currentThreadTag();
    rec.line = formatLine(std::chrono::system_clock::now(), level, tag, rec.thread, rec.message);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_to_stderr.load(std::memory_order_relaxed)) {
        fprintf(stderr, "%s\n", rec.line.c_str());
    }
    if (g_log_file) {
        fprintf(g_log_file, "%s\n", rec.line.c_str());
        fflush(g_log_file);
    }
    if (g_sink) g_sink(rec);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(level, tag, fmt, args);
    va_end(args);
}

} // namespace castlink::log

#define CLOG_TRACE(tag, fmt, ...) castlink::log::write(castlink::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define CLOG_DEBUG(tag, fmt, ...) castlink::log::write(castlink::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define CLOG_INFO(tag, fmt, ...)  castlink::log::write(castlink::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define CLOG_WARN(tag, fmt, ...)  castlink::log::write(castlink::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define CLOG_ERROR(tag, fmt, ...) castlink::log::write(castlink::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define CLOG_FATAL(tag, fmt, ...) castlink::log::write(castlink::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
