/**
 * @file nsga2_optimizer.cpp
 */
#include "resq/allocation/nsga2_optimizer.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

#include <cstdio>
#include <iterator>
#include <random>

namespace resq
{

namespace
{

std::string front_solution_id(size_t position)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "nsga2-%02zu", position);
    return buf;
}

} // namespace

Nsga2Optimizer::Nsga2Optimizer(
    const SolutionEvaluator& evaluator, const OptimizerConfig& config, Clock clock)
    : m_evaluator(evaluator)
    , m_config(config)
    , m_clock(std::move(clock))
{
    if (!m_clock)
    {
        m_clock = [] { return std::chrono::steady_clock::now(); };
    }
}

size_t Nsga2Optimizer::last_generation_count() const noexcept
{
    return m_last_generation_count.load();
}

void Nsga2Optimizer::evaluate_individual(Individual& ind) const
{
    const auto& candidates = m_evaluator.problem().candidates;
    const size_t required = m_evaluator.required_capabilities().size();

    std::set<CapabilityCode> covered;
    double max_eta = 0.0;
    double max_risk = 0.0;
    double cost = 0.0;
    int64_t capacity = 0;
    size_t count = 0;
    for (size_t i = 0; i < ind.genes.size(); ++i)
    {
        if (!ind.genes[i])
        {
            continue;
        }
        ++count;
        const auto& useful = m_evaluator.useful_capabilities(i);
        covered.insert(useful.begin(), useful.end());
        max_eta = std::max(max_eta, candidates[i].eta_minutes);
        max_risk = std::max(max_risk, candidates[i].risk);
        cost += candidates[i].cost;
        capacity += m_evaluator.capacity_of(i);
    }

    double coverage = required == 0 ? 1.0 : static_cast<double>(covered.size()) / required;
    ind.objectives = {max_eta, -coverage, -static_cast<double>(capacity), cost,
                      std::max(max_risk, 1.0 - coverage)};

    ind.violation = 0.0;
    if (m_evaluator.problem().estimated_affected > 0)
    {
        double rate = m_evaluator.capacity_coverage_rate(capacity);
        ind.violation = std::max(0.0, m_config.min_capacity_coverage - rate);
    }
    if (count == 0)
    {
        ind.violation += 1.0;
    }
}

bool Nsga2Optimizer::constrained_dominates(const Individual& a, const Individual& b) noexcept
{
    bool a_feasible = a.violation <= 0.0;
    bool b_feasible = b.violation <= 0.0;
    if (a_feasible != b_feasible)
    {
        return a_feasible;
    }
    if (!a_feasible)
    {
        return a.violation < b.violation;
    }

    bool strictly_better = false;
    for (size_t k = 0; k < objective_count; ++k)
    {
        if (a.objectives[k] > b.objectives[k])
        {
            return false;
        }
        if (a.objectives[k] < b.objectives[k])
        {
            strictly_better = true;
        }
    }
    return strictly_better;
}

std::vector<std::vector<size_t>> Nsga2Optimizer::non_dominated_sort(std::vector<Individual>& pop)
{
    const size_t n = pop.size();
    std::vector<std::vector<size_t>> dominated_by(n);
    std::vector<size_t> domination_count(n, 0);
    std::vector<std::vector<size_t>> fronts(1);

    for (size_t p = 0; p < n; ++p)
    {
        for (size_t q = p + 1; q < n; ++q)
        {
            if (constrained_dominates(pop[p], pop[q]))
            {
                dominated_by[p].push_back(q);
                ++domination_count[q];
            }
            else if (constrained_dominates(pop[q], pop[p]))
            {
                dominated_by[q].push_back(p);
                ++domination_count[p];
            }
        }
    }
    for (size_t p = 0; p < n; ++p)
    {
        if (domination_count[p] == 0)
        {
            pop[p].rank = 0;
            fronts[0].push_back(p);
        }
    }

    size_t current = 0;
    while (!fronts[current].empty())
    {
        std::vector<size_t> next;
        for (size_t p : fronts[current])
        {
            for (size_t q : dominated_by[p])
            {
                if (--domination_count[q] == 0)
                {
                    pop[q].rank = current + 1;
                    next.push_back(q);
                }
            }
        }
        ++current;
        fronts.push_back(std::move(next));
    }
    fronts.pop_back();
    return fronts;
}

void Nsga2Optimizer::assign_crowding(std::vector<Individual>& pop, const std::vector<size_t>& front)
{
    for (size_t i : front)
    {
        pop[i].crowding = 0.0;
    }
    if (front.size() <= 2)
    {
        for (size_t i : front)
        {
            pop[i].crowding = std::numeric_limits<double>::infinity();
        }
        return;
    }

    std::vector<size_t> order(front);
    for (size_t k = 0; k < objective_count; ++k)
    {
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return pop[a].objectives[k] < pop[b].objectives[k];
        });
        double lo = pop[order.front()].objectives[k];
        double hi = pop[order.back()].objectives[k];
        pop[order.front()].crowding = std::numeric_limits<double>::infinity();
        pop[order.back()].crowding = std::numeric_limits<double>::infinity();
        if (hi - lo <= 0.0)
        {
            continue;
        }
        for (size_t i = 1; i + 1 < order.size(); ++i)
        {
            pop[order[i]].crowding +=
                (pop[order[i + 1]].objectives[k] - pop[order[i - 1]].objectives[k]) / (hi - lo);
        }
    }
}

std::vector<AllocationSolution> Nsga2Optimizer::optimize(
    const std::vector<std::vector<size_t>>& seeds,
    const CancellationToken* token) const
{
    const size_t n = m_evaluator.candidate_count();
    if (n == 0)
    {
        throw InvalidInputError("Multi-objective search needs at least one candidate");
    }

    size_t pop_size = std::max<size_t>(m_config.population_size, 4);
    if (pop_size % 2 != 0)
    {
        ++pop_size;
    }
    const double mutation = m_config.mutation_probability.value_or(1.0 / static_cast<double>(n));
    const auto timeout = m_config.timeout_for(n);

    std::mt19937 rng(m_config.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<size_t> pick_gene(0, n - 1);

    const TimePoint start = m_clock();
    m_last_generation_count.store(0);

    // ============================================================================
    // Initial population: seeds first, then random subsets of varying density
    // ============================================================================

    std::vector<Individual> pop;
    pop.reserve(pop_size);
    std::set<std::vector<char>> seen;
    for (const auto& seed : seeds)
    {
        if (pop.size() >= pop_size)
        {
            break;
        }
        Individual ind;
        ind.genes.assign(n, 0);
        for (size_t idx : seed)
        {
            if (idx >= n)
            {
                throw InvalidInputError(
                    "Seed selection index " + std::to_string(idx) + " out of range");
            }
            ind.genes[idx] = 1;
        }
        if (!seen.insert(ind.genes).second)
        {
            continue;
        }
        pop.push_back(std::move(ind));
    }
    while (pop.size() < pop_size)
    {
        Individual ind;
        ind.genes.assign(n, 0);
        double density = unit(rng);
        for (size_t i = 0; i < n; ++i)
        {
            ind.genes[i] = unit(rng) < density ? 1 : 0;
        }
        ind.genes[pick_gene(rng)] = 1;
        pop.push_back(std::move(ind));
    }
    for (auto& ind : pop)
    {
        evaluate_individual(ind);
    }
    for (const auto& front : non_dominated_sort(pop))
    {
        assign_crowding(pop, front);
    }

    auto has_feasible = [](const std::vector<Individual>& p) {
        return std::any_of(p.begin(), p.end(), [](const Individual& ind) {
            return ind.violation <= 0.0;
        });
    };

    std::uniform_int_distribution<size_t> pick_parent(0, pop_size - 1);
    auto tournament = [&]() -> const Individual& {
        const Individual& a = pop[pick_parent(rng)];
        const Individual& b = pop[pick_parent(rng)];
        if (a.rank != b.rank)
            return a.rank < b.rank ? a : b;
        return a.crowding >= b.crowding ? a : b;
    };
    auto mutate = [&](Individual& ind) {
        for (auto& gene : ind.genes)
        {
            if (unit(rng) < mutation)
            {
                gene = gene ? 0 : 1;
            }
        }
    };

    // ============================================================================
    // Generations
    // ============================================================================

    size_t generation = 0;
    for (; generation < m_config.generations; ++generation)
    {
        if (token)
        {
            token->throw_if_stop_requested("multi_objective_search");
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(m_clock() - start);
        if (elapsed >= timeout)
        {
            if (!has_feasible(pop))
            {
                m_last_generation_count.store(generation);
                throw OptimizerTimeoutError(
                    "Multi-objective search over " + std::to_string(n) +
                    " candidates timed out after " + std::to_string(elapsed.count()) + " ms (" +
                    std::to_string(generation) + " generations) without a feasible allocation");
            }
            log(LogLevel::Warn,
                "Multi-objective search timed out after " + std::to_string(generation) +
                    " generations; returning the current feasible front");
            break;
        }

        std::vector<Individual> offspring;
        offspring.reserve(pop_size);
        while (offspring.size() < pop_size)
        {
            Individual c1 = tournament();
            Individual c2 = tournament();
            if (unit(rng) < m_config.crossover_probability)
            {
                for (size_t i = 0; i < n; ++i)
                {
                    if (unit(rng) < 0.5)
                    {
                        std::swap(c1.genes[i], c2.genes[i]);
                    }
                }
            }
            mutate(c1);
            mutate(c2);
            evaluate_individual(c1);
            evaluate_individual(c2);
            offspring.push_back(std::move(c1));
            offspring.push_back(std::move(c2));
        }

        std::vector<Individual> combined;
        combined.reserve(pop.size() + offspring.size());
        std::move(pop.begin(), pop.end(), std::back_inserter(combined));
        std::move(offspring.begin(), offspring.end(), std::back_inserter(combined));

        std::vector<Individual> next;
        next.reserve(pop_size);
        for (auto& front : non_dominated_sort(combined))
        {
            assign_crowding(combined, front);
            if (next.size() + front.size() <= pop_size)
            {
                for (size_t i : front)
                {
                    next.push_back(std::move(combined[i]));
                }
                continue;
            }
            std::sort(front.begin(), front.end(), [&](size_t a, size_t b) {
                return combined[a].crowding > combined[b].crowding;
            });
            for (size_t i = 0; next.size() < pop_size; ++i)
            {
                next.push_back(std::move(combined[front[i]]));
            }
            break;
        }
        pop = std::move(next);
    }
    m_last_generation_count.store(generation);

    if (!has_feasible(pop))
    {
        throw OptimizerNonConvergenceError(
            "Multi-objective search over " + std::to_string(n) + " candidates found no allocation "
            "reaching capacity coverage " + format_decimal(m_config.min_capacity_coverage) +
            " within " + std::to_string(generation) + " generations");
    }
    return extract_front(pop);
}

std::vector<AllocationSolution> Nsga2Optimizer::extract_front(std::vector<Individual>& pop) const
{
    std::vector<size_t> members;
    std::set<std::vector<char>> seen;
    auto fronts = non_dominated_sort(pop);
    for (size_t i : fronts.front())
    {
        if (pop[i].violation > 0.0 || !seen.insert(pop[i].genes).second)
        {
            continue;
        }
        members.push_back(i);
    }
    const size_t front_size = members.size();

    if (members.size() > m_config.max_alternatives)
    {
        assign_crowding(pop, members);
        std::sort(members.begin(), members.end(), [&](size_t a, size_t b) {
            if (pop[a].crowding != pop[b].crowding)
                return pop[a].crowding > pop[b].crowding;
            return pop[a].objectives < pop[b].objectives;
        });
        members.resize(m_config.max_alternatives);
    }
    std::sort(members.begin(), members.end(), [&](size_t a, size_t b) {
        if (pop[a].objectives != pop[b].objectives)
            return pop[a].objectives < pop[b].objectives;
        return pop[a].genes < pop[b].genes;
    });

    std::vector<AllocationSolution> out;
    out.reserve(members.size());
    for (size_t pos = 0; pos < members.size(); ++pos)
    {
        std::vector<size_t> selected;
        const auto& genes = pop[members[pos]].genes;
        for (size_t i = 0; i < genes.size(); ++i)
        {
            if (genes[i])
            {
                selected.push_back(i);
            }
        }
        out.push_back(
            m_evaluator.evaluate(selected, AllocationAlgorithm::Nsga2, front_solution_id(pos + 1)));
    }

    log(LogLevel::Info,
        "Multi-objective search finished after " + std::to_string(m_last_generation_count.load()) +
            " generations: " + std::to_string(front_size) + " feasible front members, returning " +
            std::to_string(out.size()));
    return out;
}

} // namespace resq
