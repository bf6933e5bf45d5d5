#include <muster/log.hpp>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace muster::log {

static Level s_level = Info;
static std::FILE* s_sink = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* sink() {
    return s_sink ? s_sink : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(sink()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    return lvl != Off && lvl >= s_level;
}

void set_color_enabled(bool on) {
    s_color_enabled = on;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_sink(std::FILE* f) {
    s_sink = f;
    // A new stream may or may not be a terminal
    s_color_initialized = false;
}

std::FILE* get_sink() {
    return sink();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

bool parse_level(const std::string& name, Level& out) {
    static const Level all[] = {Trace, Debug, Info, Warn, Error, Off};
    for (Level lvl : all) {
        if (name == level_name(lvl)) {
            out = lvl;
            return true;
        }
    }
    return false;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        case Off:   return "";
    }
    return "";
}

static void vwrite(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    init_color();

    std::FILE* out = sink();
    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
}

void write(Level lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(lvl, fmt, args);
    va_end(args);
}

#define MUSTER_LOG_AT(name, lvl)              \
    void name(const char* fmt, ...) {         \
        va_list args;                         \
        va_start(args, fmt);                  \
        vwrite(lvl, fmt, args);               \
        va_end(args);                         \
    }

MUSTER_LOG_AT(trace, Trace)
MUSTER_LOG_AT(debug, Debug)
MUSTER_LOG_AT(info, Info)
MUSTER_LOG_AT(warn, Warn)
MUSTER_LOG_AT(error, Error)

#undef MUSTER_LOG_AT

} // namespace muster::log
