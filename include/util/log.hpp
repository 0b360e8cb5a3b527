#pragma once
#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace sdosrv
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // highest level, so no threshold filters it out (operator status lines)
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Returns false (and leaves the level untouched) for unknown names.
inline bool set_log_level_by_name(const char *name)
{
    if (!name)
        return false;
    std::string level = std::string(name);
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        return false;
    return true;
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

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

// "0x43 0x00 0x10 ..." for frame dumps
inline std::string hex_bytes(const std::uint8_t *data, std::size_t n)
{
    std::string out;
    out.reserve(n * 5);
    char tmp[8];
    for (std::size_t i = 0; i < n; ++i)
    {
        std::snprintf(tmp, sizeof(tmp), i ? " 0x%02X" : "0x%02X", (unsigned)data[i]);
        out += tmp;
    }
    return out;
}

#define LOG_DEBUG(...) ::sdosrv::logf(::sdosrv::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::sdosrv::logf(::sdosrv::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::sdosrv::logf(::sdosrv::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::sdosrv::logf(::sdosrv::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::sdosrv::logf(::sdosrv::Level::System, __func__, __VA_ARGS__)

}  // namespace sdosrv
