#pragma once

#include <cstdarg>
#include <string_view>

namespace fonalink::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

#if defined(FL_DEBUG)

// Real functions exist only in debug builds.
void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

// In non-debug builds, provide inline no-op stubs so
// any direct calls still compile but vanish.
inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // FL_DEBUG

} // namespace fonalink::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------


#if defined(FL_DEBUG)

#define FL_ELOG(fmt, ...) ::fonalink::log::early_logf(fmt "\n", ##__VA_ARGS__)

#define FL_LOGE(tag, fmt, ...) \
    ::fonalink::log::logf(::fonalink::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define FL_LOGW(tag, fmt, ...) \
    ::fonalink::log::logf(::fonalink::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define FL_LOGI(tag, fmt, ...) \
    ::fonalink::log::logf(::fonalink::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define FL_LOGD(tag, fmt, ...) \
    ::fonalink::log::logf(::fonalink::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define FL_LOGV(tag, fmt, ...) \
    ::fonalink::log::logf(::fonalink::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// In non-debug builds they compile to a single no-op expression.
// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time, so no strings or code remain.

#define FL_ELOG(fmt, ...) ((void)0)
#define FL_LOGE(tag, fmt, ...) ((void)0)
#define FL_LOGW(tag, fmt, ...) ((void)0)
#define FL_LOGI(tag, fmt, ...) ((void)0)
#define FL_LOGD(tag, fmt, ...) ((void)0)
#define FL_LOGV(tag, fmt, ...) ((void)0)

#endif // FL_DEBUG
