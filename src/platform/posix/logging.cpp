#include "fonalink/core/logging.h"

#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace fonalink::log {

void early_logf(const char* fmt, ...)
{
    if (!fmt) {
        return;
    }

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

#if !defined(FL_DEBUG)

// Non-debug build: nothing else here. Inline stubs in the header handle log calls.

#else

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

static FILE* stream_for(Level level)
{
    return (level == Level::Error || level == Level::Warn) ? stderr : stdout;
}

// Wall clock prefix, HH:MM:SS local time.
static void write_prefix(FILE* out, Level level, const char* tag)
{
    char stamp[16] = "--:--:--";
    const std::time_t now = std::time(nullptr);
    std::tm tmv{};
    if (::localtime_r(&now, &tmv)) {
        std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tmv);
    }
    std::fprintf(out, "[%s] [%s] %s: ", stamp, level_to_str(level), tag ? tag : "log");
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    FILE* out = stream_for(level);

    write_prefix(out, level, tag);
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    FILE* out = stream_for(level);

    write_prefix(out, level, tag);
    std::fprintf(out, "%.*s\n",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // defined(FL_DEBUG)

} // namespace fonalink::log
