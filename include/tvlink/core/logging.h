#pragma once

#include <cstdarg>
#include <string_view>

namespace tvlink::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

#if defined(TL_DEBUG)

// Minimum level that is printed; anything more verbose is dropped.
void set_level(Level level);
Level level();

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

inline void set_level(Level) {}
inline Level level() { return Level::Error; }

inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // TL_DEBUG

} // namespace tvlink::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#if defined(TL_DEBUG)

#define TL_ELOG(fmt, ...) ::tvlink::log::early_logf(fmt "\n", ##__VA_ARGS__)

#define TL_LOGE(tag, fmt, ...) \
    ::tvlink::log::logf(::tvlink::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define TL_LOGW(tag, fmt, ...) \
    ::tvlink::log::logf(::tvlink::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define TL_LOGI(tag, fmt, ...) \
    ::tvlink::log::logf(::tvlink::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define TL_LOGD(tag, fmt, ...) \
    ::tvlink::log::logf(::tvlink::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define TL_LOGV(tag, fmt, ...) \
    ::tvlink::log::logf(::tvlink::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time.

#define TL_ELOG(fmt, ...) ::tvlink::log::early_logf(fmt "\n", ##__VA_ARGS__)
#define TL_LOGE(tag, fmt, ...) ((void)0)
#define TL_LOGW(tag, fmt, ...) ((void)0)
#define TL_LOGI(tag, fmt, ...) ((void)0)
#define TL_LOGD(tag, fmt, ...) ((void)0)
#define TL_LOGV(tag, fmt, ...) ((void)0)

#endif // TL_DEBUG
