#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace blobcast
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // user-facing status lines (CLI output that must always print)
};

// Pipeline stage a message belongs to; printed as a tag after the level
enum class Stage
{
    Image,
    Encode,
    Encrypt,
    Chunk,
    Broadcast,
    Scan,
    Reassemble,
    Verify,
    Decrypt
};

inline const char *stage_tag(Stage s)
{
    switch (s)
    {
        case Stage::Image:
            return "[IMAGE]";
        case Stage::Encode:
            return "[ENCODE]";
        case Stage::Encrypt:
            return "[ENCRYPT]";
        case Stage::Chunk:
            return "[CHUNK]";
        case Stage::Broadcast:
            return "[BROADCAST]";
        case Stage::Scan:
            return "[SCAN]";
        case Stage::Reassemble:
            return "[REASSEMBLE]";
        case Stage::Verify:
            return "[VERIFY]";
        case Stage::Decrypt:
            return "[DECRYPT]";
    }
    return "[?]";
}

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline void set_log_level_by_name(const char *name)
{
    const std::string level = name ? std::string(name) : std::string();
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

// BLOBCAST_LOG_LEVEL, if set; leaves the current level untouched otherwise
inline void set_log_level_from_env()
{
    if (const char *lv = std::getenv("BLOBCAST_LOG_LEVEL"); lv && *lv)
        set_log_level_by_name(lv);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void vlogf(Level lv, const char *tag, const char *func, const char *fmt, va_list ap)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    if (tag)
        std::fprintf(stderr, "%s %s %s %s: ", ts, level_name(lv), tag, func ? func : "?");
    else
        std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");
    std::vfprintf(stderr, fmt, ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vlogf(lv, nullptr, func, fmt, ap);
    va_end(ap);
}

inline void logf(Level lv, Stage st, const char *func, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vlogf(lv, stage_tag(st), func, fmt, ap);
    va_end(ap);
}

#define LOG_DEBUG(...) ::blobcast::logf(::blobcast::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::blobcast::logf(::blobcast::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::blobcast::logf(::blobcast::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::blobcast::logf(::blobcast::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::blobcast::logf(::blobcast::Level::System, __func__, __VA_ARGS__)

// Stage-tagged: TLOG_INFO(Chunk, "%zu chunks", n) -> "... [INFO] [CHUNK] split: 3 chunks"
#define TLOG_DEBUG(stage, ...) \
    ::blobcast::logf(::blobcast::Level::Debug, ::blobcast::Stage::stage, __func__, __VA_ARGS__)
#define TLOG_INFO(stage, ...) \
    ::blobcast::logf(::blobcast::Level::Info, ::blobcast::Stage::stage, __func__, __VA_ARGS__)
#define TLOG_WARN(stage, ...) \
    ::blobcast::logf(::blobcast::Level::Warning, ::blobcast::Stage::stage, __func__, __VA_ARGS__)
#define TLOG_ERROR(stage, ...) \
    ::blobcast::logf(::blobcast::Level::Error, ::blobcast::Stage::stage, __func__, __VA_ARGS__)

}  // namespace blobcast
