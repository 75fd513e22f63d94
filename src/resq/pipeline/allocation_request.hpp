/**
 * @file allocation_request.hpp
 */
#pragma once
#include "resq/allocation/allocation_optimizer.hpp"
#include "resq/common/json_value.hpp"
#include "resq/rules/event_context.hpp"

namespace resq
{

/**
 * @brief One incoming allocation request.
 */
struct AllocationRequest
{
    /// Identifies the run in locks, commits, audit records and notifications.
    std::string run_id;

    EventContext event;

    /// Where candidate resources are searched.
    Area area;

    OptimizationMode mode{OptimizationMode::Auto};

    /// Overrides `PipelineConfig::catalog_max_results` for this run.
    std::optional<size_t> max_results;
};

/**
 * @brief Read a request document.
 *
 * @details
 * @code{.json}
 * {
 *   "run_id": "run-1",
 *   "event": {
 *     "event_id": "EQ-2024-001", "disaster_type": "earthquake",
 *     "estimated_affected": 3000, "scene_codes": ["building_collapse"],
 *     "golden_hour_deadline_minutes": 90,
 *     "attributes": {"magnitude": 6.8, "has_building_collapse": true}
 *   },
 *   "area": {"lat": 30.6, "lng": 104.0, "radius_km": 150},
 *   "mode": "auto",
 *   "max_results": 1000
 * }
 * @endcode
 * Attribute values may be booleans, numbers, strings or arrays of strings.
 *
 * @throw ConfigError on any structural problem.
 */
AllocationRequest load_allocation_request(const JsonValue& doc);

AllocationRequest load_allocation_request_file(const std::string& path);

} // namespace resq
