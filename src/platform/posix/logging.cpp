#include "tvlink/core/logging.h"

#include <cstdarg>
#include <cstdio>

#if defined(TL_DEBUG)
#include <atomic>
#include <mutex>
#endif

namespace tvlink::log {

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

#if defined(TL_DEBUG)

namespace {

// Poll workers log from their own threads; keep lines whole.
std::mutex g_out_mutex;
std::atomic<int> g_level{static_cast<int>(Level::Info)};

const char* level_to_str(Level lvl)
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

bool enabled(Level lvl)
{
    return static_cast<int>(lvl) <= g_level.load(std::memory_order_relaxed);
}

FILE* stream_for(Level lvl)
{
    return (lvl == Level::Error || lvl == Level::Warn) ? stderr : stdout;
}

} // namespace

void set_level(Level lvl)
{
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level level()
{
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void vlogf(Level lvl, const char* tag, const char* fmt, std::va_list args)
{
    if (!enabled(lvl)) {
        return;
    }

    FILE* out = stream_for(lvl);

    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::fprintf(out, "[%s] %s: ", level_to_str(lvl), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
    std::fflush(out);
}

void logf(Level lvl, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(lvl, tag, fmt, args);
    va_end(args);
}

void log(Level lvl, const char* tag, std::string_view message)
{
    if (!enabled(lvl)) {
        return;
    }

    FILE* out = stream_for(lvl);

    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::fprintf(out, "[%s] %s: %.*s\n",
                 level_to_str(lvl),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
    std::fflush(out);
}

#endif // defined(TL_DEBUG)

} // namespace tvlink::log
