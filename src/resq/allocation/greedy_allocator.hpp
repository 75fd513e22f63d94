/**
 * @file greedy_allocator.hpp
 */
#pragma once
#include "resq/allocation/solution_evaluator.hpp"

namespace resq
{

/**
 * @brief Candidate ordering used by one greedy pass.
 */
enum class GreedyStrategy
{
    /// Descending match score.
    MatchScore,
    /// Ascending ETA.
    ResponseTime,
    /// Descending availability weight.
    Availability
};

const char* to_string(GreedyStrategy strategy) noexcept;

/**
 * @brief Capacity-aware greedy allocation.
 *
 * @details
 * Candidates are visited in strategy order (ties by match score, then id). A
 * candidate is taken when it adds an uncovered required capability, or when
 * people are affected, capacity is still below the target and the candidate
 * brings capacity.
 *
 * The pass stops only when every required capability is covered AND either
 * nobody is affected or total capacity has reached
 * `coverage_threshold * estimated_affected`. Capability coverage alone never
 * ends the pass. If the candidates run out first the solution is still
 * returned, carrying its capacity warning.
 *
 * When `redundancy_backups` is positive, up to that many extra candidates are
 * added afterwards, each backing up a capability covered by a single resource.
 *
 * The allocator borrows the evaluator, which must outlive it.
 */
class GreedyAllocator
{
public:
    GreedyAllocator(const SolutionEvaluator& evaluator, const OptimizerConfig& config);

    /**
     * @brief Candidate indices chosen by one pass, in selection order.
     */
    std::vector<size_t> select(GreedyStrategy strategy) const;

    /**
     * @brief Run one pass and evaluate its selection.
     */
    AllocationSolution allocate(GreedyStrategy strategy) const;

    /**
     * @brief Run every strategy and drop passes that selected the same set.
     * @details Solutions are returned in strategy declaration order.
     */
    std::vector<AllocationSolution> allocate_all() const;

    static const std::vector<GreedyStrategy>& all_strategies();

private:
    std::vector<size_t> ordered_candidates(GreedyStrategy strategy) const;
    void add_backups(std::vector<size_t>& selected) const;

    const SolutionEvaluator& m_evaluator;
    OptimizerConfig m_config;
};

} // namespace resq
