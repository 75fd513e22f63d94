/**
 * @file allocation_solution.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"

namespace resq
{

/**
 * @brief Graded capacity sufficiency of a solution.
 *
 * @details
 * With `threshold` the greedy coverage target (default 0.8):
 * - `NotApplicable`: no affected-count estimate (zero affected).
 * - `Sufficient`: rate >= 1.
 * - `Partial`: threshold <= rate < 1.
 * - `Insufficient`: 0.5 <= rate < threshold.
 * - `Critical`: rate < 0.5.
 */
enum class CapacityStatus
{
    NotApplicable,
    Sufficient,
    Partial,
    Insufficient,
    Critical
};

const char* to_string(CapacityStatus status) noexcept;

enum class AllocationAlgorithm
{
    Greedy,
    Nsga2,
    Manual
};

const char* to_string(AllocationAlgorithm algorithm) noexcept;

/**
 * @brief Objective values of a solution.
 *
 * @details
 * - `response_time`: largest ETA among selected resources, in minutes.
 * - `coverage_rate`: covered required capabilities / required capabilities.
 * - `cost`: sum of selected resource costs.
 * - `risk`: max(largest selected resource risk, 1 - coverage_rate).
 * - `total_rescue_capacity`: sum of selected rescue capacities.
 */
struct ObjectiveValues
{
    double response_time{0.0};
    double coverage_rate{0.0};
    double cost{0.0};
    double risk{0.0};
    int64_t total_rescue_capacity{0};
};

/**
 * @brief One candidate allocation produced by the optimizer.
 *
 * @details
 * `capacity_coverage_rate` is always
 * `total_rescue_capacity / max(estimated_affected, 1)`. `capacity_warning`
 * is non-empty whenever capacity falls short of the affected count.
 */
struct AllocationSolution
{
    std::string solution_id;
    AllocationAlgorithm algorithm{AllocationAlgorithm::Greedy};

    /// Selected resources in selection order, without duplicates.
    std::vector<ResourceId> selected_resources;

    std::set<CapabilityCode> covered_capabilities;
    std::set<CapabilityCode> uncovered_capabilities;
    std::set<CapabilityCode> uncovered_critical_capabilities;

    /// Number of selected resources covering each required capability.
    std::map<CapabilityCode, int> capability_cover_counts;

    int64_t total_rescue_capacity{0};
    int estimated_affected{0};
    double capacity_coverage_rate{0.0};
    CapacityStatus capacity_status{CapacityStatus::NotApplicable};
    std::string capacity_warning;

    ObjectiveValues objectives;
    double average_match_score{0.0};

    std::vector<Violation> violations;
    bool requires_human_review{false};

    bool is_fully_satisfied() const noexcept
    {
        return uncovered_capabilities.empty() &&
               (capacity_status == CapacityStatus::NotApplicable ||
                capacity_status == CapacityStatus::Sufficient);
    }
};

} // namespace resq
