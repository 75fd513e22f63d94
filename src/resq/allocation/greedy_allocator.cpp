/**
 * @file greedy_allocator.cpp
 */
#include "resq/allocation/greedy_allocator.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

const char* to_string(GreedyStrategy strategy) noexcept
{
    switch (strategy)
    {
    case GreedyStrategy::MatchScore:
        return "match_score";
    case GreedyStrategy::ResponseTime:
        return "response_time";
    case GreedyStrategy::Availability:
        return "availability";
    }
    return "unknown";
}

GreedyAllocator::GreedyAllocator(const SolutionEvaluator& evaluator, const OptimizerConfig& config)
    : m_evaluator(evaluator)
    , m_config(config)
{
}

const std::vector<GreedyStrategy>& GreedyAllocator::all_strategies()
{
    static const std::vector<GreedyStrategy> strategies{
        GreedyStrategy::MatchScore, GreedyStrategy::ResponseTime, GreedyStrategy::Availability};
    return strategies;
}

std::vector<size_t> GreedyAllocator::ordered_candidates(GreedyStrategy strategy) const
{
    const auto& candidates = m_evaluator.problem().candidates;
    std::vector<size_t> order(candidates.size());
    for (size_t i = 0; i < order.size(); ++i)
    {
        order[i] = i;
    }

    auto by_match_then_id = [&](size_t a, size_t b) {
        double ma = m_evaluator.match_score(a);
        double mb = m_evaluator.match_score(b);
        if (ma != mb)
            return ma > mb;
        return candidates[a].id < candidates[b].id;
    };

    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        switch (strategy)
        {
        case GreedyStrategy::MatchScore:
            break;
        case GreedyStrategy::ResponseTime:
            if (candidates[a].eta_minutes != candidates[b].eta_minutes)
                return candidates[a].eta_minutes < candidates[b].eta_minutes;
            break;
        case GreedyStrategy::Availability:
            if (candidates[a].availability != candidates[b].availability)
                return candidates[a].availability > candidates[b].availability;
            break;
        }
        return by_match_then_id(a, b);
    });
    return order;
}

std::vector<size_t> GreedyAllocator::select(GreedyStrategy strategy) const
{
    const auto& required = m_evaluator.required_capabilities();
    const int affected = m_evaluator.problem().estimated_affected;
    const double target = m_evaluator.capacity_target();

    std::set<CapabilityCode> covered;
    int64_t total_capacity = 0;
    std::vector<size_t> selected;

    auto capability_done = [&]() { return covered.size() == required.size(); };
    auto capacity_done = [&]() {
        return affected == 0 || static_cast<double>(total_capacity) >= target;
    };

    bool terminated = capability_done() && capacity_done();
    for (size_t idx : ordered_candidates(strategy))
    {
        if (terminated)
        {
            break;
        }

        bool adds_capability = false;
        for (const auto& cap : m_evaluator.useful_capabilities(idx))
        {
            if (covered.count(cap) == 0)
            {
                adds_capability = true;
                break;
            }
        }
        bool adds_capacity = !capacity_done() && m_evaluator.capacity_of(idx) > 0;
        if (!adds_capability && !adds_capacity)
        {
            continue;
        }

        selected.push_back(idx);
        const auto& useful = m_evaluator.useful_capabilities(idx);
        covered.insert(useful.begin(), useful.end());
        total_capacity += m_evaluator.capacity_of(idx);
        terminated = capability_done() && capacity_done();
    }

    if (!terminated)
    {
        log(LogLevel::Warn,
            std::string("Greedy pass '") + to_string(strategy) + "' exhausted " +
                std::to_string(m_evaluator.candidate_count()) + " candidates: covered " +
                std::to_string(covered.size()) + "/" + std::to_string(required.size()) +
                " capabilities, capacity " + std::to_string(total_capacity) + " for " +
                std::to_string(affected) + " affected");
    }

    add_backups(selected);
    return selected;
}

void GreedyAllocator::add_backups(std::vector<size_t>& selected) const
{
    if (m_config.redundancy_backups == 0)
    {
        return;
    }

    std::map<CapabilityCode, int> cover_counts;
    std::set<size_t> chosen(selected.begin(), selected.end());
    for (size_t idx : selected)
    {
        for (const auto& cap : m_evaluator.useful_capabilities(idx))
        {
            ++cover_counts[cap];
        }
    }

    size_t added = 0;
    for (size_t idx : ordered_candidates(GreedyStrategy::MatchScore))
    {
        if (added >= m_config.redundancy_backups)
        {
            break;
        }
        if (chosen.count(idx) != 0)
        {
            continue;
        }
        bool backs_up = false;
        for (const auto& cap : m_evaluator.useful_capabilities(idx))
        {
            auto it = cover_counts.find(cap);
            if (it != cover_counts.end() && it->second == 1)
            {
                backs_up = true;
                break;
            }
        }
        if (!backs_up)
        {
            continue;
        }
        selected.push_back(idx);
        chosen.insert(idx);
        for (const auto& cap : m_evaluator.useful_capabilities(idx))
        {
            ++cover_counts[cap];
        }
        ++added;
    }
}

AllocationSolution GreedyAllocator::allocate(GreedyStrategy strategy) const
{
    return m_evaluator.evaluate(
        select(strategy), AllocationAlgorithm::Greedy, std::string("greedy-") + to_string(strategy));
}

std::vector<AllocationSolution> GreedyAllocator::allocate_all() const
{
    std::vector<AllocationSolution> out;
    std::set<std::set<ResourceId>> seen;
    for (GreedyStrategy strategy : all_strategies())
    {
        AllocationSolution solution = allocate(strategy);
        std::set<ResourceId> key(
            solution.selected_resources.begin(), solution.selected_resources.end());
        if (!seen.insert(key).second)
        {
            log(LogLevel::Debug,
                std::string("Greedy pass '") + to_string(strategy) +
                    "' duplicates an earlier selection");
            continue;
        }
        out.push_back(std::move(solution));
    }
    return out;
}

} // namespace resq
