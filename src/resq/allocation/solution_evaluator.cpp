/**
 * @file solution_evaluator.cpp
 */
#include "resq/allocation/solution_evaluator.hpp"
#include "resq/common/errors.hpp"

namespace resq
{

const char* to_string(CapacityStatus status) noexcept
{
    switch (status)
    {
    case CapacityStatus::NotApplicable:
        return "not_applicable";
    case CapacityStatus::Sufficient:
        return "sufficient";
    case CapacityStatus::Partial:
        return "partial";
    case CapacityStatus::Insufficient:
        return "insufficient";
    case CapacityStatus::Critical:
        return "critical";
    }
    return "unknown";
}

const char* to_string(AllocationAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case AllocationAlgorithm::Greedy:
        return "greedy";
    case AllocationAlgorithm::Nsga2:
        return "nsga2";
    case AllocationAlgorithm::Manual:
        return "manual";
    }
    return "unknown";
}

SolutionEvaluator::SolutionEvaluator(const AllocationProblem& problem, const OptimizerConfig& config)
    : m_problem(problem)
    , m_config(config)
    , m_required(collect_required_capabilities(problem.requirements))
    , m_critical(collect_critical_capabilities(problem.requirements))
{
    if (m_problem.estimated_affected < 0)
    {
        throw InvalidInputError(
            "Estimated affected count is negative: " +
            std::to_string(m_problem.estimated_affected));
    }

    m_useful.reserve(m_problem.candidates.size());
    m_match_scores.reserve(m_problem.candidates.size());
    std::set<ResourceId> seen_ids;
    for (const auto& c : m_problem.candidates)
    {
        if (!c.rescue_capacity)
        {
            throw InvalidInputError(
                "Resource '" + c.id + "' reached the optimizer without a rescue capacity");
        }
        if (*c.rescue_capacity < 0)
        {
            throw InvalidInputError("Resource '" + c.id + "' has negative rescue capacity");
        }
        if (!seen_ids.insert(c.id).second)
        {
            throw InvalidInputError("Duplicate candidate '" + c.id + "'");
        }

        std::set<CapabilityCode> useful;
        for (const auto& cap : c.capabilities)
        {
            if (m_required.count(cap) != 0)
            {
                useful.insert(cap);
            }
        }

        double overlap = m_required.empty()
                             ? 1.0
                             : static_cast<double>(useful.size()) / m_required.size();
        double eta = std::max(0.0, c.eta_minutes);
        double proximity = 1.0 / (1.0 + eta / m_config.proximity_scale_minutes);
        double availability = std::min(1.0, std::max(0.0, c.availability));
        m_match_scores.push_back(overlap * availability * proximity);
        m_useful.push_back(std::move(useful));
    }
}

const AllocationProblem& SolutionEvaluator::problem() const noexcept
{
    return m_problem;
}

const std::set<CapabilityCode>& SolutionEvaluator::required_capabilities() const noexcept
{
    return m_required;
}

const std::set<CapabilityCode>& SolutionEvaluator::critical_capabilities() const noexcept
{
    return m_critical;
}

size_t SolutionEvaluator::candidate_count() const noexcept
{
    return m_problem.candidates.size();
}

int SolutionEvaluator::capacity_of(size_t idx) const
{
    return *m_problem.candidates.at(idx).rescue_capacity;
}

const std::set<CapabilityCode>& SolutionEvaluator::useful_capabilities(size_t idx) const
{
    return m_useful.at(idx);
}

double SolutionEvaluator::match_score(size_t idx) const
{
    return m_match_scores.at(idx);
}

double SolutionEvaluator::capacity_target() const noexcept
{
    return m_config.coverage_threshold * m_problem.estimated_affected;
}

double SolutionEvaluator::capacity_coverage_rate(int64_t total_capacity) const noexcept
{
    return static_cast<double>(total_capacity) / std::max(m_problem.estimated_affected, 1);
}

CapacityStatus SolutionEvaluator::classify_capacity(int64_t total_capacity) const noexcept
{
    if (m_problem.estimated_affected == 0)
    {
        return CapacityStatus::NotApplicable;
    }
    double rate = capacity_coverage_rate(total_capacity);
    if (rate >= 1.0)
        return CapacityStatus::Sufficient;
    if (rate >= m_config.coverage_threshold)
        return CapacityStatus::Partial;
    if (rate >= m_config.min_capacity_coverage)
        return CapacityStatus::Insufficient;
    return CapacityStatus::Critical;
}

std::string SolutionEvaluator::capacity_warning(int64_t total_capacity, CapacityStatus status) const
{
    int64_t gap = m_problem.estimated_affected - total_capacity;
    std::string numbers = "capacity " + std::to_string(total_capacity) + " for " +
                          std::to_string(m_problem.estimated_affected) + " affected (" +
                          format_decimal(capacity_coverage_rate(total_capacity) * 100.0, 1) +
                          "%)";
    switch (status)
    {
    case CapacityStatus::Critical:
        return "Critical shortfall: " + numbers + "; request national-level reinforcement";
    case CapacityStatus::Insufficient:
        return "Insufficient: " + numbers + "; request provincial reinforcement";
    case CapacityStatus::Partial:
        return "Partial: " + numbers + "; gap of " + std::to_string(gap) + " people";
    case CapacityStatus::NotApplicable:
    case CapacityStatus::Sufficient:
        break;
    }
    return std::string{};
}

AllocationSolution SolutionEvaluator::evaluate(
    const std::vector<size_t>& selected,
    AllocationAlgorithm algorithm,
    std::string solution_id) const
{
    AllocationSolution s;
    s.solution_id = std::move(solution_id);
    s.algorithm = algorithm;
    s.estimated_affected = m_problem.estimated_affected;

    for (const auto& cap : m_required)
    {
        s.capability_cover_counts[cap] = 0;
    }

    std::set<size_t> seen;
    double max_eta = 0.0;
    double max_risk = 0.0;
    double match_sum = 0.0;
    for (size_t idx : selected)
    {
        if (idx >= m_problem.candidates.size())
        {
            throw InvalidInputError(
                "Candidate index " + std::to_string(idx) + " out of range");
        }
        if (!seen.insert(idx).second)
        {
            continue;
        }
        const ResourceCandidate& c = m_problem.candidates[idx];
        s.selected_resources.push_back(c.id);
        for (const auto& cap : m_useful[idx])
        {
            s.covered_capabilities.insert(cap);
            ++s.capability_cover_counts[cap];
        }
        s.total_rescue_capacity += *c.rescue_capacity;
        s.objectives.cost += c.cost;
        max_eta = std::max(max_eta, c.eta_minutes);
        max_risk = std::max(max_risk, c.risk);
        match_sum += m_match_scores[idx];
    }

    for (const auto& cap : m_required)
    {
        if (s.covered_capabilities.count(cap) == 0)
        {
            s.uncovered_capabilities.insert(cap);
            if (m_critical.count(cap) != 0)
            {
                s.uncovered_critical_capabilities.insert(cap);
            }
        }
    }

    double coverage = m_required.empty()
                          ? 1.0
                          : static_cast<double>(s.covered_capabilities.size()) / m_required.size();

    s.capacity_coverage_rate = capacity_coverage_rate(s.total_rescue_capacity);
    s.capacity_status = classify_capacity(s.total_rescue_capacity);
    s.capacity_warning = capacity_warning(s.total_rescue_capacity, s.capacity_status);

    s.objectives.response_time = max_eta;
    s.objectives.coverage_rate = coverage;
    s.objectives.risk = std::max(max_risk, 1.0 - coverage);
    s.objectives.total_rescue_capacity = s.total_rescue_capacity;
    s.average_match_score = seen.empty() ? 0.0 : match_sum / seen.size();

    if (!s.capacity_warning.empty())
    {
        Violation v;
        v.kind = ViolationKind::InsufficientCapacity;
        v.severity = ViolationSeverity::Warning;
        v.subject = "capacity";
        v.message = s.capacity_warning;
        s.violations.push_back(std::move(v));
    }
    for (const auto& cap : s.uncovered_critical_capabilities)
    {
        Violation v;
        v.kind = ViolationKind::CriticalCapabilityUncovered;
        v.severity = ViolationSeverity::Error;
        v.strict = true;
        v.subject = cap;
        v.message = "Critical capability '" + cap + "' is not covered by any selected resource";
        s.violations.push_back(std::move(v));
    }
    return s;
}

} // namespace resq
