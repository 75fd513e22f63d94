/**
 * @file logging.cpp
 */
#include "resq/common/logging.hpp"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace resq
{

namespace
{

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;
LogSink g_sink;

std::string utc_timestamp()
{
    using clock = std::chrono::system_clock;
    std::time_t tt = clock::to_time_t(clock::now());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

const char* to_string(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "INFO";
}

void set_log_level(LogLevel level) noexcept
{
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept
{
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

void log(LogLevel level, const std::string& message) noexcept
{
    if (level == LogLevel::Off ||
        static_cast<int>(level) < g_level.load(std::memory_order_relaxed))
    {
        return;
    }

    std::string line = "[" + utc_timestamp() + "][" + to_string(level) + "] " + message;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_sink)
    {
        g_sink(level, line);
        return;
    }
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << line << "\n";
    out.flush();
}

} // namespace resq
