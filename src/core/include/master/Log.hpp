#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mpi.h>
#include <string>

/**
 * @file Log.hpp
 * @brief Levelled printf-style logging to stderr, tagged by MPI rank.
 *
 * @details
 * @rst
 * The level is chosen by :cpp:func:`disagg::master::logx::init` or, when the caller keeps the
 * default, by the ``DISAGG_LOG`` environment variable (``quiet|error|warn|info|debug``).
 * With ``rank0_only`` info/debug lines of ranks other than 0 are dropped; warnings and errors
 * are always printed, prefixed with ``[rN]`` on non-zero ranks.
 *
 * .. code-block:: cpp
 *
 *   disagg::master::logx::init({disagg::master::logx::Level::Info, true});
 *   LOGI("Found %zu ruptures, sending up to %zu per task\n", U, blocksize);
 * @endrst
 */

namespace disagg::master::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // Info defers to DISAGG_LOG
    bool rank0_only = false;
};

inline int g_rank = 0;
inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_rank0_only{false};

inline Level level_from_env()
{
    const char* v = std::getenv("DISAGG_LOG");
    if (!v)
        return Level::Info;
    std::string s(v);
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "debug")
        return Level::Debug;
    return Level::Info;
}

inline void init(const Config& cfg = {})
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (inited)
        MPI_Comm_rank(MPI_COMM_WORLD, &g_rank);
    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
    g_rank0_only.store(cfg.rank0_only);
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

inline bool gate(Level L)
{
    if (L > g_level.load())
        return true;
    if (g_rank0_only.load() && g_rank != 0 && L >= Level::Info)
        return true;
    return false;
}

inline void vprint(Level L, const char* fmt, va_list ap)
{
    if (gate(L))
        return;
    // one buffered write per line so OpenMP threads do not interleave
    char buf[2048];
    int n = 0;
    if (g_rank != 0)
        n = std::snprintf(buf, sizeof(buf), "%s[r%d] ", level_tag(L), g_rank);
    else
        n = std::snprintf(buf, sizeof(buf), "%s", level_tag(L));
    if (n < 0)
        return;
    if (static_cast<std::size_t>(n) < sizeof(buf))
        std::vsnprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), fmt, ap);
    std::fputs(buf, stderr);
    std::fflush(stderr);
}

inline void print(Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, fmt, ap);
    va_end(ap);
}

#define LOGD(...) ::disagg::master::logx::print(::disagg::master::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::disagg::master::logx::print(::disagg::master::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::disagg::master::logx::print(::disagg::master::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::disagg::master::logx::print(::disagg::master::logx::Level::Error, __VA_ARGS__)

} // namespace disagg::master::logx
