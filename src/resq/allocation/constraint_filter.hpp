/**
 * @file constraint_filter.hpp
 */
#pragma once
#include "resq/allocation/allocation_solution.hpp"
#include "resq/common/config.hpp"
#include "resq/rules/hard_rule.hpp"

namespace resq
{

/**
 * @brief Event facts the hard rules and scores need besides the solution.
 */
struct FilterContext
{
    int estimated_affected{0};
    std::optional<int> golden_hour_deadline_minutes;
    std::string disaster_type;
};

/**
 * @brief A solution removed by one or more rejecting hard rules.
 */
struct Rejection
{
    std::string solution_id;
    std::vector<std::string> rule_ids;
    std::vector<std::string> reasons;
};

struct FilterOutcome
{
    std::vector<AllocationSolution> accepted;
    std::vector<Rejection> rejected;
};

/**
 * @brief Normalized soft-score dimensions, each in [0, 1].
 */
struct DimensionScores
{
    double success_rate{0.0};
    double response_time{0.0};
    double coverage_rate{0.0};
    double risk{0.0};
    double redundancy{0.0};
};

struct ScoredSolution
{
    AllocationSolution solution;
    DimensionScores dimensions;
    double total_score{0.0};
    /// 1-based rank after sorting.
    size_t rank{0};
};

/**
 * @brief Hard-rule veto followed by weighted soft scoring.
 *
 * @details
 * `filter()` evaluates every hard rule against every solution independently.
 * Any failing `Reject` rule removes the solution and the reasons are kept in
 * a `Rejection`. Failing `Warn` rules attach a `HardRule` violation instead.
 * Surviving solutions are marked `requires_human_review` according to the
 * review policy.
 *
 * `score()` combines five dimensions with the weights of the event's
 * disaster type and sorts by total score descending, then lower risk, then
 * solution id.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent calls are safe.
 */
class ConstraintFilter
{
public:
    /**
     * @throw ConfigError if the scoring or review configuration is invalid.
     * @throw RuleLoadError if a hard rule is malformed.
     */
    ConstraintFilter(std::vector<HardRule> hard_rules, ScoringConfig scoring, ReviewPolicy review);

    const std::vector<HardRule>& hard_rules() const noexcept;

    /**
     * @brief Metrics the hard rules test for one solution.
     *
     * @details
     * rescue_risk, response_time_min, coverage_rate, capacity_coverage_rate,
     * total_rescue_capacity, estimated_affected, uncovered_critical_capabilities,
     * selected_count, cost, and golden_hour_deadline when the event has one.
     */
    static MetricMap metrics_for(const AllocationSolution& solution, const FilterContext& context);

    FilterOutcome filter(std::vector<AllocationSolution> solutions, const FilterContext& context) const;

    DimensionScores score_dimensions(const AllocationSolution& solution) const;

    std::vector<ScoredSolution> score(
        const std::vector<AllocationSolution>& solutions, const FilterContext& context) const;

private:
    bool review_required(const AllocationSolution& solution, bool critical_warning) const;

    std::vector<HardRule> m_hard_rules;
    ScoringConfig m_scoring;
    ReviewPolicy m_review;
};

} // namespace resq
