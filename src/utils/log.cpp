#include "cw/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace cw {

namespace {
std::atomic<LogLevel> g_level{LogLevel::Warn};
}

const char* level_name(LogLevel lvl)
{
    switch (lvl)
    {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void set_log_level(LogLevel lvl)
{
    g_level.store(lvl, std::memory_order_relaxed);
}

LogLevel log_level()
{
    return g_level.load(std::memory_order_relaxed);
}

std::mutex& print_mutex()
{
    static std::mutex mtx;
    return mtx;
}

void log(LogLevel lvl, const std::string& msg)
{
    if (static_cast<int>(lvl) < static_cast<int>(log_level())) return;

    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);

    std::lock_guard<std::mutex> lk(print_mutex());
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}

} // namespace cw
