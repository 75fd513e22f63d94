/**
 * @file allocation_optimizer.hpp
 */
#pragma once
#include "resq/allocation/greedy_allocator.hpp"
#include "resq/allocation/nsga2_optimizer.hpp"

namespace resq
{

enum class OptimizationMode
{
    /// Multi-objective above `multi_objective_threshold` candidates, greedy otherwise.
    Auto,
    Greedy,
    MultiObjective
};

const char* to_string(OptimizationMode mode) noexcept;

/**
 * @brief Parse "auto", "greedy" or "multi_objective".
 * @throw InvalidInputError for any other text.
 */
OptimizationMode parse_optimization_mode(const std::string& text);

/**
 * @brief Entry point of the allocation engine.
 *
 * @details
 * Greedy mode runs every greedy strategy and returns the distinct
 * selections. Multi-objective mode seeds NSGA-II with those selections and
 * returns its feasible Pareto front. A multi-objective failure propagates to
 * the caller; retrying in greedy mode is the caller's decision.
 *
 * @par Thread safety
 * - `optimize()` is const and safe to call concurrently.
 */
class AllocationOptimizer
{
public:
    explicit AllocationOptimizer(OptimizerConfig config, Nsga2Optimizer::Clock clock = {});

    const OptimizerConfig& config() const noexcept;

    /// Mode actually used for `candidate_count` candidates.
    OptimizationMode resolve_mode(OptimizationMode requested, size_t candidate_count) const noexcept;

    /**
     * @brief Produce allocation solutions.
     * @return At least one solution in greedy mode; the feasible front otherwise.
     * @throw InvalidInputError on negative affected counts or candidates
     *        without a rescue capacity.
     * @throw OptimizerTimeoutError, OptimizerNonConvergenceError in multi-objective mode.
     * @throw RunCancelledError if `token` requests a stop during the search.
     */
    std::vector<AllocationSolution> optimize(
        const std::vector<Requirement>& requirements,
        const std::vector<ResourceCandidate>& candidates,
        int estimated_affected,
        OptimizationMode mode,
        const CancellationToken* token = nullptr) const;

private:
    OptimizerConfig m_config;
    Nsga2Optimizer::Clock m_clock;
};

} // namespace resq
