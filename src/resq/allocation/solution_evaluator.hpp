/**
 * @file solution_evaluator.hpp
 */
#pragma once
#include "resq/allocation/allocation_solution.hpp"
#include "resq/common/config.hpp"

namespace resq
{

/**
 * @brief Input of one optimization: what is needed and what is available.
 */
struct AllocationProblem
{
    std::vector<Requirement> requirements;
    std::vector<ResourceCandidate> candidates;
    int estimated_affected{0};
};

/**
 * @brief Computes metrics of candidate subsets for one problem.
 *
 * @details
 * Shared by the greedy and multi-objective allocators so both report the same
 * numbers for the same selection.
 *
 * @par Thread safety
 * - Immutable after construction; const methods are safe to call concurrently.
 * - Holds its own copy of the problem.
 */
class SolutionEvaluator
{
public:
    /**
     * @throw InvalidInputError if `estimated_affected` is negative or any
     *        candidate's rescue capacity is unset or negative.
     */
    SolutionEvaluator(const AllocationProblem& problem, const OptimizerConfig& config);

    const AllocationProblem& problem() const noexcept;
    const std::set<CapabilityCode>& required_capabilities() const noexcept;
    const std::set<CapabilityCode>& critical_capabilities() const noexcept;

    size_t candidate_count() const noexcept;

    /// Rescue capacity of candidate `idx`.
    int capacity_of(size_t idx) const;

    /// Required capabilities candidate `idx` provides.
    const std::set<CapabilityCode>& useful_capabilities(size_t idx) const;

    /**
     * @brief Greedy ordering score: overlap fraction x availability x proximity.
     * @details Proximity is `1 / (1 + eta / proximity_scale_minutes)`. With no
     *          required capabilities the overlap fraction is 1.
     */
    double match_score(size_t idx) const;

    /// Capacity the greedy allocator aims for: threshold x affected.
    double capacity_target() const noexcept;

    /// `total / max(affected, 1)`.
    double capacity_coverage_rate(int64_t total_capacity) const noexcept;

    CapacityStatus classify_capacity(int64_t total_capacity) const noexcept;

    /**
     * @brief Build a full solution from candidate indices.
     * @param selected Indices into the problem's candidates, in selection order.
     */
    AllocationSolution evaluate(
        const std::vector<size_t>& selected,
        AllocationAlgorithm algorithm,
        std::string solution_id) const;

private:
    std::string capacity_warning(int64_t total_capacity, CapacityStatus status) const;

    AllocationProblem m_problem;
    OptimizerConfig m_config;
    std::set<CapabilityCode> m_required;
    std::set<CapabilityCode> m_critical;
    std::vector<std::set<CapabilityCode>> m_useful;
    std::vector<double> m_match_scores;
};

} // namespace resq
