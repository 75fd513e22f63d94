/**
 * @file allocation_pipeline.hpp
 * @brief The single public entry point of the allocation core.
 */
#pragma once
#include "resq/allocation/allocation_optimizer.hpp"
#include "resq/allocation/constraint_filter.hpp"
#include "resq/common/cancellation_token.hpp"
#include "resq/common/config.hpp"
#include "resq/locking/resource_lock_manager.hpp"
#include "resq/pipeline/allocation_request.hpp"
#include "resq/pipeline/pipeline_result.hpp"
#include "resq/pipeline/pipeline_sinks.hpp"
#include "resq/resources/capacity_estimator.hpp"
#include "resq/resources/resource_catalog.hpp"
#include "resq/rules/rule_engine.hpp"
#include "resq/tasks/task_decomposer.hpp"

#include <future>

namespace resq
{

/**
 * @brief Collaborators of a pipeline.
 *
 * @details
 * `rule_engine`, `templates`, `catalog` and `locks` are required. The sinks
 * and the review gate are optional. Runs of the same pipeline share the
 * catalog and the lock manager and nothing else that is mutable.
 */
struct PipelineDependencies
{
    std::shared_ptr<const RuleEngine> rule_engine;
    std::shared_ptr<const TaskTemplateLibrary> templates;
    std::vector<HardRule> hard_rules;
    std::shared_ptr<ResourceCatalog> catalog;
    std::shared_ptr<ResourceLockManager> locks;
    std::shared_ptr<AuditSink> audit;
    std::shared_ptr<NotificationSink> notifications;
    std::shared_ptr<ReviewGate> review_gate;
};

/**
 * @brief Orchestrates one allocation run end to end.
 *
 * @details
 * Stages, in order:
 * 1. `rules`: evaluate trigger rules and derive requirements.
 * 2. `decomposition`: build the task plan; plan tasks with capabilities that
 *    no requirement names add task-implied requirements.
 * 3. `catalog_query`: query with an explicit `max_results` and estimate
 *    missing rescue capacities.
 * 4. `optimization`: greedy or multi-objective per the request's mode. A
 *    multi-objective failure propagates unless
 *    `retry_greedy_on_optimizer_failure` is set.
 * 5. `constraint_filter`: hard-rule veto, then weighted ranking. No survivor
 *    ends the run with `NoFeasibleSolution`.
 * 6. `review`: only when the top solution requires human review.
 * 7. `commit`: lock the selection, revalidate it against the catalog, commit,
 *    release the lock. Any failure after acquisition releases the lock
 *    before the error propagates.
 *
 * The cancellation token is checked before every stage, between optimizer
 * generations and between lock acquisition and commit. Each run emits one
 * audit record, including runs that end in an error.
 *
 * @par Thread safety
 * - `run()` and `submit()` may be called concurrently from any thread.
 */
class AllocationPipeline
{
public:
    /**
     * @param optimizer_clock Time source for the optimizer budget; empty means steady clock.
     * @throw ConfigError if `config` is invalid.
     * @throw InvalidInputError if a required collaborator is missing.
     */
    AllocationPipeline(
        PipelineConfig config,
        PipelineDependencies dependencies,
        Nsga2Optimizer::Clock optimizer_clock = {});

    const PipelineConfig& config() const noexcept;

    /**
     * @brief Execute one run on the calling thread.
     * @throw RuleLoadError, TemplateError, CyclicDependencyError, InvalidInputError
     * @throw OptimizerTimeoutError, OptimizerNonConvergenceError
     * @throw LockConflictError, StaleResourceError (both retryable)
     * @throw RunCancelledError
     * @details Exceptions thrown by a sink or the review gate propagate after
     *          the audit record is written. A chosen solution that needs no
     *          resources is committed without taking any lock.
     */
    PipelineResult run(const AllocationRequest& request, const CancellationToken* token = nullptr) const;

    /**
     * @brief Execute one run on its own thread.
     * @details The pipeline must outlive the returned future. Errors surface
     *          from `future::get()`.
     */
    std::future<PipelineResult> submit(
        AllocationRequest request, std::shared_ptr<CancellationToken> token = nullptr) const;

private:
    /// Fills `result` stage by stage so a failed run still has its partial trail.
    void execute(
        const AllocationRequest& request, const CancellationToken* token, PipelineResult& result) const;
    std::vector<std::string> review_reasons(const AllocationSolution& solution) const;
    void emit_audit(AuditRecord record) const;

    PipelineConfig m_config;
    PipelineDependencies m_deps;
    TaskDecomposer m_decomposer;
    CapacityEstimator m_estimator;
    AllocationOptimizer m_optimizer;
    ConstraintFilter m_filter;
};

} // namespace resq
