#pragma once

#include <string>
#include <cstdio>

namespace ghostcomment::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// printf-style; formatted and written through stderr_sink()
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// printf-style formatting into a std::string
std::string format(const char* fmt, ...);

// Destination for diagnostics emitted by the scanner and cleaner.
// Components take a Sink at construction instead of writing to stderr
// directly, so callers decide where warnings end up.
class Sink {
public:
    virtual ~Sink() = default;
    virtual void write(Level lvl, const std::string& msg) = 0;
};

// Writes "level: msg" to stderr, colored on a TTY. Respects set_level.
class StderrSink : public Sink {
public:
    void write(Level lvl, const std::string& msg) override;
};

StderrSink& stderr_sink();

} // namespace ghostcomment::log
