#include <ghostcomment/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ghostcomment::log {

struct LevelStyle {
    const char* name;
    const char* color;
};

// Indexed by Level
static const LevelStyle kStyles[] = {
    {"trace", "\033[90m"},   // gray
    {"debug", "\033[36m"},   // cyan
    {"info",  "\033[32m"},   // green
    {"warn",  "\033[33m"},   // yellow
    {"error", "\033[31m"},   // red
};

static const char* const kReset = "\033[0m";

static Level s_level = Info;

// -1 until the first write decides from isatty(stderr)
static int s_color = -1;

static bool use_color() {
    if (s_color < 0) s_color = isatty(fileno(stderr)) ? 1 : 0;
    return s_color == 1;
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color = enabled ? 1 : 0;
}

bool is_color_enabled() {
    return use_color();
}

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return kStyles[lvl].name;
}

static std::string vformat(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return "";

    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

std::string format(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat(fmt, args);
    va_end(args);
    return out;
}

// ---- Sinks ----

void StderrSink::write(Level lvl, const std::string& msg) {
    if (lvl < s_level) return;
    if (use_color()) {
        std::fprintf(stderr, "%s%s%s: %s\n", kStyles[lvl].color, kStyles[lvl].name,
                     kReset, msg.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", kStyles[lvl].name, msg.c_str());
    }
}

StderrSink& stderr_sink() {
    static StderrSink sink;
    return sink;
}

// ---- Process-wide logger ----

// Skip the formatting work for suppressed levels
static void vlog(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    stderr_sink().write(lvl, vformat(fmt, args));
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Error, fmt, args);
    va_end(args);
}

} // namespace ghostcomment::log
