/**
 * @file constraint_filter.cpp
 */
#include "resq/allocation/constraint_filter.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

ConstraintFilter::ConstraintFilter(
    std::vector<HardRule> hard_rules, ScoringConfig scoring, ReviewPolicy review)
    : m_hard_rules(std::move(hard_rules))
    , m_scoring(std::move(scoring))
    , m_review(review)
{
    m_scoring.validate_or_throw();
    m_review.validate_or_throw();
    for (const auto& rule : m_hard_rules)
    {
        validate_hard_rule(rule);
    }
}

const std::vector<HardRule>& ConstraintFilter::hard_rules() const noexcept
{
    return m_hard_rules;
}

MetricMap ConstraintFilter::metrics_for(
    const AllocationSolution& solution, const FilterContext& context)
{
    MetricMap m;
    m["rescue_risk"] = solution.objectives.risk;
    m["response_time_min"] = solution.objectives.response_time;
    m["coverage_rate"] = solution.objectives.coverage_rate;
    m["capacity_coverage_rate"] = solution.capacity_coverage_rate;
    m["total_rescue_capacity"] = static_cast<double>(solution.total_rescue_capacity);
    m["estimated_affected"] = context.estimated_affected;
    m["uncovered_critical_capabilities"] =
        static_cast<double>(solution.uncovered_critical_capabilities.size());
    m["selected_count"] = static_cast<double>(solution.selected_resources.size());
    m["cost"] = solution.objectives.cost;
    if (context.golden_hour_deadline_minutes)
    {
        m["golden_hour_deadline"] = *context.golden_hour_deadline_minutes;
    }
    return m;
}

bool ConstraintFilter::review_required(const AllocationSolution& solution, bool critical_warning) const
{
    if (critical_warning)
        return true;
    if (solution.objectives.risk >= m_review.risk_threshold)
        return true;
    if (m_review.review_insufficient_capacity &&
        (solution.capacity_status == CapacityStatus::Insufficient ||
         solution.capacity_status == CapacityStatus::Critical))
        return true;
    if (m_review.review_uncovered_critical && !solution.uncovered_critical_capabilities.empty())
        return true;
    return false;
}

FilterOutcome ConstraintFilter::filter(
    std::vector<AllocationSolution> solutions, const FilterContext& context) const
{
    FilterOutcome outcome;
    for (auto& solution : solutions)
    {
        MetricMap metrics = metrics_for(solution, context);
        Rejection rejection;
        bool critical_warning = false;

        for (const auto& rule : m_hard_rules)
        {
            std::optional<std::string> message = evaluate_hard_rule(rule, metrics);
            if (!message)
            {
                continue;
            }
            if (rule.action == HardRuleAction::Reject)
            {
                rejection.rule_ids.push_back(rule.id);
                rejection.reasons.push_back(*message);
                continue;
            }
            Violation v;
            v.kind = ViolationKind::HardRule;
            v.severity = ViolationSeverity::Warning;
            v.subject = rule.id;
            v.message = *message;
            solution.violations.push_back(std::move(v));
            critical_warning = critical_warning || rule.severity == HardRuleSeverity::Critical;
        }

        if (!rejection.rule_ids.empty())
        {
            rejection.solution_id = solution.solution_id;
            std::string ids;
            for (const auto& id : rejection.rule_ids)
            {
                ids += (ids.empty() ? "" : ", ") + id;
            }
            log(LogLevel::Info, "Hard rules rejected solution '" + solution.solution_id + "': " + ids);
            outcome.rejected.push_back(std::move(rejection));
            continue;
        }

        solution.requires_human_review = review_required(solution, critical_warning);
        outcome.accepted.push_back(std::move(solution));
    }
    return outcome;
}

DimensionScores ConstraintFilter::score_dimensions(const AllocationSolution& solution) const
{
    DimensionScores d;
    const double coverage = solution.objectives.coverage_rate;
    d.success_rate = 0.6 * m_scoring.baseline_success_rate +
                     0.4 * (coverage + solution.average_match_score) / 2.0;
    d.response_time = std::max(
        0.0, 1.0 - solution.objectives.response_time / m_scoring.response_time_reference_minutes);
    d.coverage_rate = coverage;
    d.risk = std::min(1.0, std::max(0.0, 1.0 - solution.objectives.risk));

    size_t required = solution.capability_cover_counts.size();
    if (required == 0)
    {
        d.redundancy = 1.0;
    }
    else
    {
        size_t backed = 0;
        for (const auto& [cap, count] : solution.capability_cover_counts)
        {
            (void)cap;
            if (count >= 2)
            {
                ++backed;
            }
        }
        d.redundancy = static_cast<double>(backed) / required;
    }
    return d;
}

std::vector<ScoredSolution> ConstraintFilter::score(
    const std::vector<AllocationSolution>& solutions, const FilterContext& context) const
{
    const ScoringWeights& w = m_scoring.weights_for(context.disaster_type);

    std::vector<ScoredSolution> scored;
    scored.reserve(solutions.size());
    for (const auto& solution : solutions)
    {
        ScoredSolution s;
        s.solution = solution;
        s.dimensions = score_dimensions(solution);
        s.total_score = w.success_rate * s.dimensions.success_rate +
                        w.response_time * s.dimensions.response_time +
                        w.coverage_rate * s.dimensions.coverage_rate +
                        w.risk * s.dimensions.risk + w.redundancy * s.dimensions.redundancy;
        scored.push_back(std::move(s));
    }

    std::sort(scored.begin(), scored.end(), [](const ScoredSolution& a, const ScoredSolution& b) {
        if (a.total_score != b.total_score)
            return a.total_score > b.total_score;
        if (a.solution.objectives.risk != b.solution.objectives.risk)
            return a.solution.objectives.risk < b.solution.objectives.risk;
        return a.solution.solution_id < b.solution.solution_id;
    });
    for (size_t i = 0; i < scored.size(); ++i)
    {
        scored[i].rank = i + 1;
    }
    return scored;
}

} // namespace resq
