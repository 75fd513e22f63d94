/**
 * @file pipeline_result.cpp
 */
#include "resq/pipeline/pipeline_result.hpp"

namespace resq
{

const char* to_string(PipelineStatus status) noexcept
{
    switch (status)
    {
    case PipelineStatus::Committed:
        return "committed";
    case PipelineStatus::NoFeasibleSolution:
        return "no_feasible_solution";
    case PipelineStatus::PendingReview:
        return "pending_review";
    case PipelineStatus::RejectedByReview:
        return "rejected_by_review";
    }
    return "unknown";
}

const char* to_string(ReviewVerdict verdict) noexcept
{
    switch (verdict)
    {
    case ReviewVerdict::Approve:
        return "approve";
    case ReviewVerdict::Reject:
        return "reject";
    case ReviewVerdict::Modify:
        return "modify";
    }
    return "unknown";
}

std::string PipelineResult::summary() const
{
    std::string result;
    switch (status)
    {
    case PipelineStatus::Committed:
        result = fully_satisfied() ? "Run committed" : "Run committed (under-resourced)";
        break;
    case PipelineStatus::NoFeasibleSolution:
        result = "Run found no feasible solution";
        break;
    case PipelineStatus::PendingReview:
        result = "Run awaits human review";
        break;
    case PipelineStatus::RejectedByReview:
        result = "Run rejected by review";
        break;
    }
    result += " (run=" + run_id;
    result += ", mode=" + std::string(to_string(mode_used));
    result += ", rules=" + std::to_string(matched_rules.size());
    result += ", tasks=" + std::to_string(task_plan.sequence.size());
    result += ", candidates=" + std::to_string(candidate_count);
    result += ", solutions=" + std::to_string(solutions.size());
    result += ", rejected=" + std::to_string(rejections.size());
    result += ", violations=" + std::to_string(violations.size()) + ")";
    if (committed)
    {
        result += "\n  committed " + committed->solution_id + ": " +
                  std::to_string(committed->selected_resources.size()) + " resources, capacity " +
                  std::to_string(committed->total_rescue_capacity) + "/" +
                  std::to_string(committed->estimated_affected) + " (" +
                  to_string(committed->capacity_status) + ")";
        if (!committed->capacity_warning.empty())
        {
            result += "\n  warning: " + committed->capacity_warning;
        }
    }
    return result;
}

} // namespace resq
