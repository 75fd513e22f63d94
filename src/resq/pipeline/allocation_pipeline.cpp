/**
 * @file allocation_pipeline.cpp
 */
#include "resq/pipeline/allocation_pipeline.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

namespace
{

PipelineConfig validated(PipelineConfig config)
{
    config.validate_or_throw();
    return config;
}

PipelineDependencies validated(PipelineDependencies deps)
{
    if (!deps.rule_engine)
        throw InvalidInputError("AllocationPipeline requires a rule engine");
    if (!deps.templates)
        throw InvalidInputError("AllocationPipeline requires a task template library");
    if (!deps.catalog)
        throw InvalidInputError("AllocationPipeline requires a resource catalog");
    if (!deps.locks)
        throw InvalidInputError("AllocationPipeline requires a lock manager");
    return deps;
}

/**
 * @brief Run one stage: cancellation check, then the body, then its timing.
 */
template <typename Fn>
void run_stage(
    PipelineResult& result, const char* stage, const CancellationToken* token, Fn&& body)
{
    if (token)
    {
        token->throw_if_stop_requested(stage);
    }
    log(LogLevel::Debug, "Run '" + result.run_id + "' entering stage " + stage);
    auto start = std::chrono::steady_clock::now();
    body();
    result.stage_timings.push_back(
        StageTiming{stage, std::chrono::duration_cast<std::chrono::nanoseconds>(
                               std::chrono::steady_clock::now() - start)});
}

const char* const unexpected_error_code = "Unexpected";

void append_violations(std::vector<Violation>& out, const std::vector<Violation>& in)
{
    out.insert(out.end(), in.begin(), in.end());
}

} // namespace

AllocationPipeline::AllocationPipeline(
    PipelineConfig config,
    PipelineDependencies dependencies,
    Nsga2Optimizer::Clock optimizer_clock)
    : m_config(validated(std::move(config)))
    , m_deps(validated(std::move(dependencies)))
    , m_decomposer(m_deps.templates)
    , m_estimator(m_config.capacity)
    , m_optimizer(m_config.optimizer, std::move(optimizer_clock))
    , m_filter(m_deps.hard_rules, m_config.scoring, m_config.review)
{
}

const PipelineConfig& AllocationPipeline::config() const noexcept
{
    return m_config;
}

std::future<PipelineResult> AllocationPipeline::submit(
    AllocationRequest request, std::shared_ptr<CancellationToken> token) const
{
    return std::async(std::launch::async, [this, request = std::move(request), token]() {
        return run(request, token.get());
    });
}

void AllocationPipeline::emit_audit(AuditRecord record) const
{
    if (m_deps.audit)
    {
        m_deps.audit->record(record);
    }
}

PipelineResult AllocationPipeline::run(
    const AllocationRequest& request, const CancellationToken* token) const
{
    PipelineResult result;
    result.run_id = request.run_id;
    try
    {
        execute(request, token, result);
    }
    catch (const ResqError& e)
    {
        log(LogLevel::Error,
            "Run '" + request.run_id + "' failed with " + to_string(e.code()) + ": " + e.what());
        emit_audit(AuditRecord{request.run_id, request, result, to_string(e.code()), e.what()});
        throw;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error,
            "Run '" + request.run_id + "' failed with an unexpected error: " + e.what());
        emit_audit(AuditRecord{request.run_id, request, result, unexpected_error_code, e.what()});
        throw;
    }
    emit_audit(AuditRecord{request.run_id, request, result, std::string{}, std::string{}});
    return result;
}

std::vector<std::string> AllocationPipeline::review_reasons(const AllocationSolution& solution) const
{
    std::vector<std::string> reasons;
    if (solution.objectives.risk >= m_config.review.risk_threshold)
    {
        reasons.push_back(
            "Risk " + format_decimal(solution.objectives.risk) + " reaches the review threshold " +
            format_decimal(m_config.review.risk_threshold));
    }
    if (!solution.capacity_warning.empty())
    {
        reasons.push_back(solution.capacity_warning);
    }
    for (const auto& v : solution.violations)
    {
        if (v.kind == ViolationKind::CriticalCapabilityUncovered || v.kind == ViolationKind::HardRule)
        {
            reasons.push_back(v.message);
        }
    }
    return reasons;
}

void AllocationPipeline::execute(
    const AllocationRequest& request, const CancellationToken* token, PipelineResult& result) const
{
    const auto run_start = std::chrono::steady_clock::now();

    if (request.run_id.empty())
    {
        throw InvalidInputError("Allocation request has no run id");
    }
    if (request.event.estimated_affected < 0)
    {
        throw InvalidInputError("Allocation request has a negative affected count");
    }
    if (request.max_results && *request.max_results == 0)
    {
        throw InvalidInputError("Allocation request max_results must be at least 1");
    }

    const EventContext& event = request.event;
    log(LogLevel::Info,
        "Run '" + request.run_id + "' started for event '" + event.event_id + "' (" +
            event.disaster_type + ", " + std::to_string(event.estimated_affected) + " affected)");

    auto finish = [&](PipelineStatus status) {
        result.status = status;
        result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - run_start);
        log(LogLevel::Info, result.summary());
    };

    // ============================================================================
    // Requirements and task plan
    // ============================================================================

    run_stage(result, "rules", token, [&] {
        result.matched_rules = m_deps.rule_engine->evaluate(event);
        result.requirements = RuleEngine::derive_requirements(result.matched_rules);
        if (result.matched_rules.empty())
        {
            log(LogLevel::Warn, "Run '" + request.run_id + "': no trigger rule matched the event");
        }
    });

    run_stage(result, "decomposition", token, [&] {
        result.task_plan = m_decomposer.decompose(result.requirements, event.scene_codes);

        std::set<TaskCode> named;
        for (const auto& req : result.requirements)
        {
            named.insert(req.task_type);
        }
        for (const auto& node : result.task_plan.sequence)
        {
            if (node.required_capabilities.empty() || named.count(node.task_code) != 0)
            {
                continue;
            }
            Requirement implied;
            implied.task_type = node.task_code;
            implied.priority = Priority::Medium;
            implied.required_capabilities = node.required_capabilities;
            result.requirements.push_back(std::move(implied));
        }
        append_violations(result.violations, result.task_plan.violations);
    });

    result.golden_hour_deadline_minutes = event.golden_hour_deadline_minutes
                                              ? event.golden_hour_deadline_minutes
                                              : result.task_plan.earliest_golden_hour();

    // ============================================================================
    // Candidates and solutions
    // ============================================================================

    std::vector<ResourceCandidate> candidates;
    run_stage(result, "catalog_query", token, [&] {
        const size_t max_results = request.max_results.value_or(m_config.catalog_max_results);
        candidates = m_deps.catalog->query(
            collect_required_capabilities(result.requirements), request.area, max_results);
        result.candidate_count = candidates.size();
        result.estimated_capacity_count = m_estimator.apply(candidates);
    });

    run_stage(result, "optimization", token, [&] {
        result.mode_used = m_optimizer.resolve_mode(request.mode, candidates.size());
        try
        {
            result.solutions = m_optimizer.optimize(
                result.requirements, candidates, event.estimated_affected, request.mode, token);
        }
        catch (const ResqError& e)
        {
            bool optimizer_failure = e.code() == ErrorCode::OptimizerTimeout ||
                                     e.code() == ErrorCode::OptimizerNonConvergence;
            if (!optimizer_failure || !m_config.retry_greedy_on_optimizer_failure)
            {
                throw;
            }
            log(LogLevel::Warn,
                "Run '" + request.run_id + "': " + e.what() + "; retrying in greedy mode");
            result.optimizer_fallback_reason = e.what();
            result.mode_used = OptimizationMode::Greedy;
            result.solutions = m_optimizer.optimize(
                result.requirements, candidates, event.estimated_affected,
                OptimizationMode::Greedy, token);
        }
    });

    FilterContext filter_context;
    filter_context.estimated_affected = event.estimated_affected;
    filter_context.golden_hour_deadline_minutes = result.golden_hour_deadline_minutes;
    filter_context.disaster_type = event.disaster_type;

    run_stage(result, "constraint_filter", token, [&] {
        FilterOutcome outcome = m_filter.filter(result.solutions, filter_context);
        result.rejections = std::move(outcome.rejected);
        result.ranked = m_filter.score(outcome.accepted, filter_context);
    });

    if (result.ranked.empty())
    {
        log(LogLevel::Warn,
            "Run '" + request.run_id + "': all " + std::to_string(result.solutions.size()) +
                " solutions were rejected by hard rules");
        return finish(PipelineStatus::NoFeasibleSolution);
    }

    // ============================================================================
    // Review
    // ============================================================================

    ScoredSolution chosen = result.ranked.front();
    if (chosen.solution.requires_human_review)
    {
        if (!m_deps.review_gate)
        {
            append_violations(result.violations, chosen.solution.violations);
            return finish(PipelineStatus::PendingReview);
        }

        std::optional<PipelineStatus> review_outcome;
        run_stage(result, "review", token, [&] {
            ReviewRequest review_request;
            review_request.run_id = request.run_id;
            review_request.event = event;
            review_request.proposed = chosen;
            review_request.alternatives.assign(result.ranked.begin() + 1, result.ranked.end());
            review_request.reasons = review_reasons(chosen.solution);

            ReviewDecision decision = m_deps.review_gate->review(review_request);
            result.review = decision;
            log(LogLevel::Info,
                "Run '" + request.run_id + "': review verdict " + to_string(decision.verdict) +
                    " by '" + decision.reviewer + "'");

            if (decision.verdict == ReviewVerdict::Reject)
            {
                review_outcome = PipelineStatus::RejectedByReview;
                return;
            }
            if (decision.verdict == ReviewVerdict::Approve)
            {
                return;
            }

            if (decision.replacement_resources.empty())
            {
                throw InvalidInputError("Review modification names no replacement resources");
            }
            std::map<ResourceId, size_t> index;
            for (size_t i = 0; i < candidates.size(); ++i)
            {
                index.emplace(candidates[i].id, i);
            }
            std::vector<size_t> selected;
            for (const auto& id : decision.replacement_resources)
            {
                auto it = index.find(id);
                if (it == index.end())
                {
                    throw InvalidInputError(
                        "Review replacement names resource '" + id + "' outside the candidate set");
                }
                selected.push_back(it->second);
            }

            AllocationProblem problem{result.requirements, candidates, event.estimated_affected};
            SolutionEvaluator evaluator(problem, m_config.optimizer);
            AllocationSolution manual =
                evaluator.evaluate(selected, AllocationAlgorithm::Manual, "manual-review");
            Violation override_note;
            override_note.kind = ViolationKind::ReviewOverride;
            override_note.severity = ViolationSeverity::Warning;
            override_note.subject = decision.reviewer;
            override_note.message = "Selection replaced by reviewer '" + decision.reviewer + "'";
            manual.violations.push_back(std::move(override_note));

            FilterOutcome outcome = m_filter.filter({manual}, filter_context);
            if (outcome.accepted.empty())
            {
                result.rejections.insert(
                    result.rejections.end(), outcome.rejected.begin(), outcome.rejected.end());
                review_outcome = PipelineStatus::RejectedByReview;
                return;
            }
            chosen = m_filter.score(outcome.accepted, filter_context).front();
        });

        if (review_outcome)
        {
            append_violations(result.violations, chosen.solution.violations);
            return finish(*review_outcome);
        }
    }

    // ============================================================================
    // Lock, revalidate, commit
    // ============================================================================

    run_stage(result, "commit", token, [&] {
        const std::vector<ResourceId>& ids = chosen.solution.selected_resources;
        if (ids.empty())
        {
            log(LogLevel::Info,
                "Run '" + request.run_id + "': solution '" + chosen.solution.solution_id +
                    "' needs no resources; committing an empty plan without locking");
            return;
        }
        LockHandle handle = m_deps.locks->acquire(ids, request.run_id);
        try
        {
            if (token)
            {
                token->throw_if_stop_requested("commit");
            }
            std::vector<ResourceId> stale = m_deps.catalog->revalidate(ids);
            if (!stale.empty())
            {
                throw StaleResourceError(
                    "Run '" + request.run_id + "': " + std::to_string(stale.size()) +
                        " selected resources changed since the catalog query",
                    std::move(stale));
            }
            m_deps.catalog->commit(request.run_id, ids);
        }
        catch (...)
        {
            handle.release();
            throw;
        }
        handle.release();
    });

    result.committed = chosen.solution;
    append_violations(result.violations, chosen.solution.violations);

    if (m_deps.notifications)
    {
        CommittedPlanEvent plan;
        plan.run_id = request.run_id;
        plan.event_id = event.event_id;
        plan.solution_id = chosen.solution.solution_id;
        plan.resources = chosen.solution.selected_resources;
        for (const auto& node : result.task_plan.sequence)
        {
            plan.task_sequence.push_back(node.task_code);
        }
        plan.total_rescue_capacity = chosen.solution.total_rescue_capacity;
        plan.capacity_coverage_rate = chosen.solution.capacity_coverage_rate;
        plan.capacity_warning = chosen.solution.capacity_warning;
        m_deps.notifications->publish(plan);
    }
    if (!chosen.solution.capacity_warning.empty())
    {
        log(LogLevel::Warn,
            "Run '" + request.run_id + "' committed an under-resourced plan: " +
                chosen.solution.capacity_warning);
    }
    return finish(PipelineStatus::Committed);
}

} // namespace resq
