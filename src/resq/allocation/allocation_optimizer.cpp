/**
 * @file allocation_optimizer.cpp
 */
#include "resq/allocation/allocation_optimizer.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

const char* to_string(OptimizationMode mode) noexcept
{
    switch (mode)
    {
    case OptimizationMode::Auto:
        return "auto";
    case OptimizationMode::Greedy:
        return "greedy";
    case OptimizationMode::MultiObjective:
        return "multi_objective";
    }
    return "unknown";
}

OptimizationMode parse_optimization_mode(const std::string& text)
{
    if (text == "auto")
        return OptimizationMode::Auto;
    if (text == "greedy")
        return OptimizationMode::Greedy;
    if (text == "multi_objective")
        return OptimizationMode::MultiObjective;
    throw InvalidInputError("Unknown optimization mode '" + text + "'");
}

AllocationOptimizer::AllocationOptimizer(OptimizerConfig config, Nsga2Optimizer::Clock clock)
    : m_config(std::move(config))
    , m_clock(std::move(clock))
{
    m_config.validate_or_throw();
}

const OptimizerConfig& AllocationOptimizer::config() const noexcept
{
    return m_config;
}

OptimizationMode AllocationOptimizer::resolve_mode(
    OptimizationMode requested, size_t candidate_count) const noexcept
{
    if (requested != OptimizationMode::Auto)
    {
        return requested;
    }
    return candidate_count > m_config.multi_objective_threshold ? OptimizationMode::MultiObjective
                                                                : OptimizationMode::Greedy;
}

std::vector<AllocationSolution> AllocationOptimizer::optimize(
    const std::vector<Requirement>& requirements,
    const std::vector<ResourceCandidate>& candidates,
    int estimated_affected,
    OptimizationMode mode,
    const CancellationToken* token) const
{
    AllocationProblem problem{requirements, candidates, estimated_affected};
    SolutionEvaluator evaluator(problem, m_config);
    GreedyAllocator greedy(evaluator, m_config);

    OptimizationMode resolved = resolve_mode(mode, candidates.size());
    log(LogLevel::Info,
        std::string("Optimizing ") + std::to_string(candidates.size()) + " candidates for " +
            std::to_string(evaluator.required_capabilities().size()) + " capabilities and " +
            std::to_string(estimated_affected) + " affected in " + to_string(resolved) + " mode");

    if (resolved == OptimizationMode::Greedy)
    {
        return greedy.allocate_all();
    }

    std::vector<std::vector<size_t>> seeds;
    for (GreedyStrategy strategy : GreedyAllocator::all_strategies())
    {
        seeds.push_back(greedy.select(strategy));
    }
    Nsga2Optimizer nsga2(evaluator, m_config, m_clock);
    return nsga2.optimize(seeds, token);
}

} // namespace resq
