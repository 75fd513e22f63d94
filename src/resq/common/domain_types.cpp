/**
 * @file domain_types.cpp
 */
#include "resq/common/domain_types.hpp"
#include "resq/common/errors.hpp"

#include <cmath>
#include <sstream>
#include <iomanip>

namespace resq
{

const char* to_string(Priority priority) noexcept
{
    switch (priority)
    {
    case Priority::Critical:
        return "critical";
    case Priority::High:
        return "high";
    case Priority::Medium:
        return "medium";
    case Priority::Low:
        return "low";
    }
    return "medium";
}

Priority parse_priority(const std::string& text)
{
    if (text == "critical")
        return Priority::Critical;
    if (text == "high")
        return Priority::High;
    if (text == "medium")
        return Priority::Medium;
    if (text == "low")
        return Priority::Low;
    throw ConfigError("Unknown priority '" + text + "'");
}

double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept
{
    constexpr double earth_radius_km = 6371.0;
    constexpr double deg_to_rad = 3.14159265358979323846 / 180.0;

    double dlat = (b.latitude - a.latitude) * deg_to_rad;
    double dlng = (b.longitude - a.longitude) * deg_to_rad;
    double s = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(a.latitude * deg_to_rad) * std::cos(b.latitude * deg_to_rad) *
                   std::sin(dlng / 2) * std::sin(dlng / 2);
    return 2.0 * earth_radius_km * std::asin(std::min(1.0, std::sqrt(s)));
}

std::set<CapabilityCode> collect_required_capabilities(const std::vector<Requirement>& requirements)
{
    std::set<CapabilityCode> out;
    for (const auto& req : requirements)
    {
        out.insert(req.required_capabilities.begin(), req.required_capabilities.end());
    }
    return out;
}

std::set<CapabilityCode> collect_critical_capabilities(const std::vector<Requirement>& requirements)
{
    std::set<CapabilityCode> out;
    for (const auto& req : requirements)
    {
        out.insert(req.critical_capabilities.begin(), req.critical_capabilities.end());
    }
    return out;
}

const char* to_string(ResourceStatus status) noexcept
{
    switch (status)
    {
    case ResourceStatus::Available:
        return "available";
    case ResourceStatus::Deployed:
        return "deployed";
    case ResourceStatus::Unavailable:
        return "unavailable";
    }
    return "unavailable";
}

ResourceStatus parse_resource_status(const std::string& text)
{
    if (text == "available")
        return ResourceStatus::Available;
    if (text == "deployed")
        return ResourceStatus::Deployed;
    if (text == "unavailable")
        return ResourceStatus::Unavailable;
    throw ConfigError("Unknown resource status '" + text + "'");
}

const char* to_string(ViolationKind kind) noexcept
{
    switch (kind)
    {
    case ViolationKind::StrictDependency:
        return "strict_dependency";
    case ViolationKind::AdvisoryDependency:
        return "advisory_dependency";
    case ViolationKind::UnmappedTaskType:
        return "unmapped_task_type";
    case ViolationKind::ParallelGroupConflict:
        return "parallel_group_conflict";
    case ViolationKind::InsufficientCapacity:
        return "insufficient_capacity";
    case ViolationKind::CriticalCapabilityUncovered:
        return "critical_capability_uncovered";
    case ViolationKind::HardRule:
        return "hard_rule";
    case ViolationKind::ReviewOverride:
        return "review_override";
    }
    return "unknown";
}

const char* to_string(ViolationSeverity severity) noexcept
{
    return severity == ViolationSeverity::Error ? "error" : "warning";
}

std::string format_decimal(double value, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos)
    {
        while (!s.empty() && s.back() == '0')
        {
            s.pop_back();
        }
        if (!s.empty() && s.back() == '.')
        {
            s.pop_back();
        }
    }
    if (s == "-0")
    {
        s = "0";
    }
    return s;
}

} // namespace resq
