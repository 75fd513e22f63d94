/**
 * @file pipeline_result.hpp
 * @brief Definition of PipelineResult returned by AllocationPipeline::run().
 */
#pragma once
#include "resq/allocation/allocation_optimizer.hpp"
#include "resq/allocation/constraint_filter.hpp"
#include "resq/rules/rule_engine.hpp"
#include "resq/tasks/task_decomposer.hpp"

namespace resq
{

enum class PipelineStatus
{
    /// The top-ranked solution was locked, revalidated and committed.
    Committed,
    /// Every candidate solution failed a hard rule.
    NoFeasibleSolution,
    /// The chosen solution needs human review and no review gate is attached.
    PendingReview,
    /// The review gate rejected the plan, or the reviewer's replacement failed a hard rule.
    RejectedByReview
};

const char* to_string(PipelineStatus status) noexcept;

enum class ReviewVerdict
{
    Approve,
    Reject,
    Modify
};

const char* to_string(ReviewVerdict verdict) noexcept;

/**
 * @brief Answer of the external human-review gate.
 */
struct ReviewDecision
{
    ReviewVerdict verdict{ReviewVerdict::Approve};
    std::string reviewer;
    std::string comment;

    /// With `Modify`: the resources to commit instead.
    std::vector<ResourceId> replacement_resources;
};

struct StageTiming
{
    std::string stage;
    std::chrono::nanoseconds duration{0};
};

/**
 * @brief Result of one allocation run.
 *
 * @details
 * PipelineResult captures every stage output of the run:
 * - Matched rules and the requirements derived from them
 * - The task plan
 * - All candidate solutions, hard-rule rejections and the ranked survivors
 * - The committed solution, if any, and the review decision
 * - Violations and per-stage timing
 *
 * A run that ends without commit still returns a result; only errors throw.
 */
struct PipelineResult
{
    std::string run_id;

    PipelineStatus status{PipelineStatus::NoFeasibleSolution};

    /// Mode the optimizer actually ran in.
    OptimizationMode mode_used{OptimizationMode::Greedy};

    std::vector<MatchedRule> matched_rules;

    /// Rule-derived requirements followed by task-implied ones.
    std::vector<Requirement> requirements;

    DecompositionResult task_plan;

    /// Deadline used by the golden-hour hard rule.
    std::optional<int> golden_hour_deadline_minutes;

    /// Candidates returned by the catalog query.
    size_t candidate_count{0};

    /// Candidates whose rescue capacity was estimated.
    size_t estimated_capacity_count{0};

    /// Every solution the optimizer produced, before hard rules.
    std::vector<AllocationSolution> solutions;

    std::vector<Rejection> rejections;

    /// Hard-rule survivors, best first.
    std::vector<ScoredSolution> ranked;

    std::optional<AllocationSolution> committed;

    std::optional<ReviewDecision> review;

    /// Task plan violations followed by those of the chosen solution.
    std::vector<Violation> violations;

    /// Non-empty when the optimizer failed and the run retried in greedy mode.
    std::string optimizer_fallback_reason;

    std::vector<StageTiming> stage_timings;

    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief True if a plan was committed that covers every required
     *        capability and has sufficient capacity.
     */
    bool fully_satisfied() const noexcept
    {
        return committed.has_value() && committed->is_fully_satisfied();
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;
};

} // namespace resq
