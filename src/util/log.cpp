#include <aarc/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace aarc::log {

static std::atomic<Level> s_level{Info};
static std::mutex s_write_mutex;
static std::FILE* s_output = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* output_stream() {
    return s_output ? s_output : stderr;
}

// Callers hold s_write_mutex
static void init_color_locked() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(output_stream()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

bool parse_level(const std::string& name, Level& out) {
    static const Level all[] = {Trace, Debug, Info, Warn, Error};
    for (Level lvl : all) {
        if (name == level_name(lvl)) {
            out = lvl;
            return true;
        }
    }
    return false;
}

void set_color_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(s_write_mutex);
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> lock(s_write_mutex);
    init_color_locked();
    return s_color_enabled;
}

void set_output(std::FILE* out) {
    std::lock_guard<std::mutex> lock(s_write_mutex);
    s_output = out;
    s_color_initialized = false;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;

    // Format outside the lock so slow callers don't serialize each other
    va_list sizing;
    va_copy(sizing, args);
    int len = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (len < 0) return;
    std::string buf(static_cast<size_t>(len) + 1, '\0');
    std::vsnprintf(&buf[0], buf.size(), fmt, args);
    buf.resize(static_cast<size_t>(len));

    std::lock_guard<std::mutex> lock(s_write_mutex);
    init_color_locked();
    std::FILE* out = output_stream();
    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl), buf.c_str());
    } else {
        std::fprintf(out, "%s: %s\n", level_name(lvl), buf.c_str());
    }
    std::fflush(out);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace aarc::log
