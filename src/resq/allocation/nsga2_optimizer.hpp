/**
 * @file nsga2_optimizer.hpp
 * @brief Multi-objective subset search over candidate resources.
 */
#pragma once
#include "resq/allocation/solution_evaluator.hpp"
#include "resq/common/cancellation_token.hpp"

#include <array>

namespace resq
{

/**
 * @brief NSGA-II over candidate-subset bit vectors.
 *
 * @details
 * Objectives, all minimized:
 * 1. largest ETA of the selection,
 * 2. negated capability coverage rate,
 * 3. negated total rescue capacity,
 * 4. total cost,
 * 5. risk, `max(largest candidate risk, 1 - coverage)`.
 *
 * Feasibility is enforced through Deb's constraint domination. The constraint
 * violation of a selection is `max(0, min_capacity_coverage - capacity rate)`
 * when people are affected, plus 1 for an empty selection. A feasible
 * selection dominates every infeasible one; infeasible selections compare by
 * violation only. Only feasible selections are ever returned.
 *
 * The search uses binary tournament selection, uniform crossover, bit-flip
 * mutation, fast non-dominated sorting and crowding distance. Seed selections
 * (typically the greedy passes) are injected into the initial population; the
 * rest of it is random. Randomness comes from a `std::mt19937` seeded from the
 * configuration, so a run is reproducible.
 *
 * Before each generation the optimizer checks the cancellation token and the
 * time budget `OptimizerConfig::timeout_for(candidate_count)`:
 * - cancellation throws `RunCancelledError`;
 * - an expired budget with no feasible individual throws `OptimizerTimeoutError`;
 * - an expired budget with feasible individuals returns the current front.
 * A completed generation budget without any feasible individual throws
 * `OptimizerNonConvergenceError`. There is no fallback to another method.
 *
 * The optimizer borrows the evaluator, which must outlive it.
 *
 * @par Thread safety
 * - `optimize()` is const and keeps all search state local; concurrent calls are safe.
 */
class Nsga2Optimizer
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /**
     * @param clock Time source for the budget; empty means `steady_clock::now`.
     */
    Nsga2Optimizer(const SolutionEvaluator& evaluator, const OptimizerConfig& config, Clock clock = {});

    /**
     * @brief Run the search.
     * @param seeds Candidate index selections injected into the first population.
     * @param token Optional cancellation token polled between generations.
     * @return The feasible first front, at most `max_alternatives` solutions,
     *         with ids `nsga2-01`, `nsga2-02`, ...
     * @throw InvalidInputError if there are no candidates.
     * @throw OptimizerTimeoutError, OptimizerNonConvergenceError, RunCancelledError
     */
    std::vector<AllocationSolution> optimize(
        const std::vector<std::vector<size_t>>& seeds,
        const CancellationToken* token = nullptr) const;

    /// Number of generations the last search completed. For diagnostics and tests.
    size_t last_generation_count() const noexcept;

private:
    static constexpr size_t objective_count = 5;

    struct Individual
    {
        std::vector<char> genes;
        std::array<double, objective_count> objectives{};
        double violation{0.0};
        size_t rank{0};
        double crowding{0.0};
    };

    void evaluate_individual(Individual& ind) const;
    static bool constrained_dominates(const Individual& a, const Individual& b) noexcept;
    static std::vector<std::vector<size_t>> non_dominated_sort(std::vector<Individual>& pop);
    static void assign_crowding(std::vector<Individual>& pop, const std::vector<size_t>& front);

    std::vector<AllocationSolution> extract_front(std::vector<Individual>& pop) const;

    const SolutionEvaluator& m_evaluator;
    OptimizerConfig m_config;
    Clock m_clock;
    mutable std::atomic<size_t> m_last_generation_count{0};
};

} // namespace resq
