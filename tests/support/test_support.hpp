/**
 * @file test_support.hpp
 * @brief Builders and fakes shared by the unit tests.
 */
#pragma once
#include "resq/common/domain_types.hpp"
#include "resq/common/logging.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace resq_test
{

inline resq::ResourceCandidate make_candidate(
    const std::string& id,
    std::set<std::string> capabilities,
    int rescue_capacity,
    double eta_minutes = 10.0,
    double risk = 0.0,
    double cost = 1.0,
    double availability = 1.0)
{
    resq::ResourceCandidate c;
    c.id = id;
    c.name = id;
    c.resource_type = "structural_rescue";
    c.capabilities = std::move(capabilities);
    c.available_personnel = rescue_capacity;
    c.rescue_capacity = rescue_capacity;
    c.eta_minutes = eta_minutes;
    c.risk = risk;
    c.cost = cost;
    c.availability = availability;
    return c;
}

inline resq::Requirement make_requirement(
    const std::string& task_type,
    std::set<std::string> capabilities,
    std::set<std::string> critical = {},
    resq::Priority priority = resq::Priority::High)
{
    resq::Requirement r;
    r.task_type = task_type;
    r.priority = priority;
    r.required_capabilities = std::move(capabilities);
    r.critical_capabilities = std::move(critical);
    return r;
}

/**
 * @brief Routes log lines into memory for the lifetime of the object.
 * @details Restores the default sink and the previous level on destruction.
 */
class LogCapture
{
public:
    explicit LogCapture(resq::LogLevel level = resq::LogLevel::Debug)
        : m_previous_level(resq::get_log_level())
    {
        resq::set_log_level(level);
        resq::set_log_sink([this](resq::LogLevel lvl, const std::string& line) {
            std::lock_guard<std::mutex> guard(m_mutex);
            m_lines.emplace_back(lvl, line);
        });
    }

    ~LogCapture()
    {
        resq::set_log_sink({});
        resq::set_log_level(m_previous_level);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    size_t count(resq::LogLevel level) const
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        return static_cast<size_t>(std::count_if(
            m_lines.begin(), m_lines.end(), [level](const auto& l) { return l.first == level; }));
    }

    bool contains(resq::LogLevel level, const std::string& fragment) const
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        return std::any_of(m_lines.begin(), m_lines.end(), [&](const auto& l) {
            return l.first == level && l.second.find(fragment) != std::string::npos;
        });
    }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        std::vector<std::string> out;
        for (const auto& l : m_lines)
        {
            out.push_back(l.second);
        }
        return out;
    }

private:
    resq::LogLevel m_previous_level;
    mutable std::mutex m_mutex;
    std::vector<std::pair<resq::LogLevel, std::string>> m_lines;
};

/**
 * @brief Manually advanced steady-clock stand-in. Copies share the same time.
 */
class FakeClock
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    TimePoint operator()() const
    {
        return TimePoint(std::chrono::milliseconds(m_now_ms->load()));
    }

    void advance(std::chrono::milliseconds delta)
    {
        m_now_ms->fetch_add(delta.count());
    }

    /// Advance by `step` on every read; models a slow computation.
    std::function<TimePoint()> ticking(std::chrono::milliseconds step) const
    {
        auto now = m_now_ms;
        return [now, step]() { return TimePoint(std::chrono::milliseconds(now->fetch_add(step.count()))); };
    }

private:
    std::shared_ptr<std::atomic<int64_t>> m_now_ms{std::make_shared<std::atomic<int64_t>>(1000000)};
};

} // namespace resq_test
