#include <gtest/gtest.h>
#include "resq/common/errors.hpp"
#include "resq/pipeline/allocation_pipeline.hpp"
#include "resq/resources/in_memory_resource_catalog.hpp"
#include "support/test_support.hpp"

#include <sstream>

using namespace resq;
using resq_test::LogCapture;
using resq_test::make_candidate;

namespace
{

// ============================================================================
// Recording sinks and gates
// ============================================================================

class RecordingAuditSink : public AuditSink
{
public:
    void record(const AuditRecord& record) override
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_records.push_back(record);
    }

    std::vector<AuditRecord> records() const
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        return m_records;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<AuditRecord> m_records;
};

class RecordingNotificationSink : public NotificationSink
{
public:
    void publish(const CommittedPlanEvent& event) override
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_events.push_back(event);
    }

    std::vector<CommittedPlanEvent> events() const
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        return m_events;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<CommittedPlanEvent> m_events;
};

/// Returns a fixed decision; `on_review` runs first when set.
class ScriptedReviewGate : public ReviewGate
{
public:
    explicit ScriptedReviewGate(ReviewDecision decision)
        : m_decision(std::move(decision))
    {
    }

    ReviewDecision review(const ReviewRequest& request) override
    {
        requests.push_back(request);
        if (on_review)
        {
            on_review();
        }
        return m_decision;
    }

    std::function<void()> on_review;
    std::vector<ReviewRequest> requests;

private:
    ReviewDecision m_decision;
};

ReviewDecision decision(ReviewVerdict verdict, std::vector<ResourceId> replacements = {})
{
    ReviewDecision d;
    d.verdict = verdict;
    d.reviewer = "duty-officer";
    d.comment = "checked";
    d.replacement_resources = std::move(replacements);
    return d;
}

// ============================================================================
// Fixture pieces
// ============================================================================

std::shared_ptr<const RuleEngine> quake_rules()
{
    TriggerRule rule;
    rule.id = "R-QUAKE";
    rule.name = "Collapsed buildings";
    rule.condition = Condition{AllOf{{Condition{make_comparison(
        "disaster_type", ComparisonOperator::Eq, FieldValue{std::string("earthquake")})}}}};
    rule.actions.task_types = {"search_rescue"};
    rule.actions.required_capabilities = {CapabilityNeed{"structural_rescue", Priority::High, 1}};
    rule.priority = Priority::High;
    rule.weight = 0.9;
    return std::make_shared<const RuleEngine>(std::vector<TriggerRule>{rule});
}

TaskDefinition task(const std::string& code, std::vector<CapabilityCode> caps)
{
    TaskDefinition def;
    def.code = code;
    def.name = code;
    def.phase = "response";
    def.golden_hour_minutes = 90;
    def.required_capabilities = std::move(caps);
    return def;
}

std::shared_ptr<const TaskTemplateLibrary> collapse_templates()
{
    TaskChainTemplate collapse;
    collapse.scene_code = "collapse";
    collapse.chain_name = "Collapse";
    collapse.tasks = {task("search_rescue", {"structural_rescue"})};

    TaskChainTemplate with_medical;
    with_medical.scene_code = "collapse_medical";
    with_medical.chain_name = "Collapse with casualties";
    with_medical.tasks = {task("search_rescue", {"structural_rescue"}),
                          task("medical_triage", {"medical_triage"})};
    with_medical.dependencies = {DependencyDeclaration{"medical_triage", "search_rescue", true}};

    return std::make_shared<const TaskTemplateLibrary>(
        std::vector<TaskChainTemplate>{collapse, with_medical});
}

/// Three 200-capacity teams in range and one beyond any golden hour.
std::vector<ResourceCandidate> rescue_pool(double risk = 0.02)
{
    return {
        make_candidate("usar-1", {"structural_rescue"}, 200, 10.0, risk),
        make_candidate("usar-2", {"structural_rescue"}, 200, 20.0, risk),
        make_candidate("usar-3", {"structural_rescue"}, 200, 30.0, risk),
        make_candidate("usar-slow", {"structural_rescue"}, 200, 200.0, 0.0),
    };
}

AllocationRequest quake_request(const std::string& run_id, int affected = 400)
{
    AllocationRequest request;
    request.run_id = run_id;
    request.event.event_id = "EQ-1";
    request.event.disaster_type = "earthquake";
    request.event.estimated_affected = affected;
    request.event.scene_codes = {"collapse"};
    request.event.golden_hour_deadline_minutes = 120;
    request.mode = OptimizationMode::Greedy;
    return request;
}

/// Everything one pipeline under test talks to.
struct Harness
{
    std::shared_ptr<InMemoryResourceCatalog> catalog;
    std::shared_ptr<ResourceLockManager> locks;
    std::shared_ptr<RecordingAuditSink> audit = std::make_shared<RecordingAuditSink>();
    std::shared_ptr<RecordingNotificationSink> notifications =
        std::make_shared<RecordingNotificationSink>();
    std::shared_ptr<ScriptedReviewGate> gate;

    explicit Harness(std::vector<ResourceCandidate> pool, LockClock lock_clock = {})
        : catalog(std::make_shared<InMemoryResourceCatalog>(std::move(pool)))
        , locks(make_resource_lock_manager(LockConfig{}, std::move(lock_clock)))
    {
    }

    PipelineDependencies dependencies() const
    {
        PipelineDependencies deps;
        deps.rule_engine = quake_rules();
        deps.templates = collapse_templates();
        deps.hard_rules = default_hard_rules();
        deps.catalog = catalog;
        deps.locks = locks;
        deps.audit = audit;
        deps.notifications = notifications;
        deps.review_gate = gate;
        return deps;
    }

    AllocationPipeline pipeline(PipelineConfig config = {}) const
    {
        return AllocationPipeline(std::move(config), dependencies());
    }
};

/// Config under which every solution of `rescue_pool()` needs review.
PipelineConfig review_everything()
{
    PipelineConfig config;
    config.review.risk_threshold = 0.01;
    return config;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(AllocationPipelineTests, Construction_MissingDependencyRejected)
{
    Harness h(rescue_pool());
    auto deps = h.dependencies();
    deps.locks.reset();
    EXPECT_THROW(AllocationPipeline(PipelineConfig{}, deps), InvalidInputError);

    deps = h.dependencies();
    deps.catalog.reset();
    EXPECT_THROW(AllocationPipeline(PipelineConfig{}, deps), InvalidInputError);
}

TEST(AllocationPipelineTests, Construction_InvalidConfigRejected)
{
    Harness h(rescue_pool());
    PipelineConfig config;
    config.optimizer.coverage_threshold = 0.3;
    EXPECT_THROW(h.pipeline(config), ConfigError);
}

// ============================================================================
// Committed runs
// ============================================================================

TEST(AllocationPipelineTests, Commit_HappyPath)
{
    Harness h(rescue_pool());
    auto result = h.pipeline().run(quake_request("run-1"));

    EXPECT_EQ(result.status, PipelineStatus::Committed);
    EXPECT_EQ(result.mode_used, OptimizationMode::Greedy);
    ASSERT_EQ(result.matched_rules.size(), 1u);
    EXPECT_EQ(result.matched_rules[0].rule_id, "R-QUAKE");
    ASSERT_EQ(result.task_plan.sequence.size(), 1u);
    EXPECT_EQ(result.candidate_count, 4u);
    EXPECT_EQ(result.golden_hour_deadline_minutes, std::optional<int>(120));

    ASSERT_TRUE(result.committed.has_value());
    EXPECT_EQ(result.committed->selected_resources,
              (std::vector<ResourceId>{"usar-1", "usar-2"}));
    EXPECT_EQ(result.committed->total_rescue_capacity, 400);
    EXPECT_EQ(result.committed->capacity_status, CapacityStatus::Sufficient);
    EXPECT_TRUE(result.fully_satisfied());

    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Deployed);
    EXPECT_EQ(h.catalog->status_of("usar-2"), ResourceStatus::Deployed);
    EXPECT_EQ(h.catalog->status_of("usar-3"), ResourceStatus::Available);
    EXPECT_EQ(h.locks->active_lock_count(), 0u);
}

TEST(AllocationPipelineTests, Commit_StagesTimedInOrder)
{
    Harness h(rescue_pool());
    auto result = h.pipeline().run(quake_request("run-1"));

    std::vector<std::string> stages;
    for (const auto& t : result.stage_timings)
    {
        stages.push_back(t.stage);
    }
    EXPECT_EQ(stages, (std::vector<std::string>{"rules", "decomposition", "catalog_query",
                                                "optimization", "constraint_filter", "commit"}));
}

TEST(AllocationPipelineTests, Commit_NotificationPublished)
{
    Harness h(rescue_pool());
    h.pipeline().run(quake_request("run-1"));

    auto events = h.notifications->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].run_id, "run-1");
    EXPECT_EQ(events[0].event_id, "EQ-1");
    EXPECT_EQ(events[0].resources, (std::vector<ResourceId>{"usar-1", "usar-2"}));
    EXPECT_EQ(events[0].task_sequence, (std::vector<TaskCode>{"search_rescue"}));
    EXPECT_EQ(events[0].total_rescue_capacity, 400);
    EXPECT_TRUE(events[0].capacity_warning.empty());
}

TEST(AllocationPipelineTests, Commit_TaskImpliedRequirementAdded)
{
    auto pool = rescue_pool();
    auto medic = make_candidate("med-1", {"medical_triage"}, 100, 15.0, 0.02);
    pool.push_back(medic);
    Harness h(pool);

    auto request = quake_request("run-1");
    request.event.scene_codes = {"collapse_medical"};
    auto result = h.pipeline().run(request);

    ASSERT_EQ(result.requirements.size(), 2u);
    EXPECT_EQ(result.requirements[0].task_type, "search_rescue");
    EXPECT_EQ(result.requirements[1].task_type, "medical_triage");
    EXPECT_EQ(result.requirements[1].priority, Priority::Medium);
    EXPECT_EQ(result.requirements[1].required_capabilities,
              (std::set<CapabilityCode>{"medical_triage"}));

    ASSERT_EQ(result.status, PipelineStatus::Committed);
    const auto& selected = result.committed->selected_resources;
    EXPECT_NE(std::find(selected.begin(), selected.end(), "med-1"), selected.end());
    EXPECT_TRUE(result.committed->uncovered_capabilities.empty());
}

TEST(AllocationPipelineTests, Commit_UnderResourcedPlanStillCommitsWithWarning)
{
    LogCapture capture;
    Harness h(rescue_pool());
    PipelineConfig config;
    config.review.review_insufficient_capacity = false;

    // The three nearest teams bring 600 for 1000 affected: Insufficient but above the veto line
    auto request = quake_request("run-1", 1000);
    request.max_results = 3;
    auto result = h.pipeline(config).run(request);
    ASSERT_EQ(result.status, PipelineStatus::Committed);
    EXPECT_EQ(result.committed->capacity_status, CapacityStatus::Insufficient);
    EXPECT_FALSE(result.fully_satisfied());
    EXPECT_FALSE(h.notifications->events()[0].capacity_warning.empty());
    EXPECT_TRUE(capture.contains(LogLevel::Warn, "under-resourced"));
}

TEST(AllocationPipelineTests, Commit_EmptyPlanTakesNoLocks)
{
    TriggerRule rule;
    rule.id = "R-WATCH";
    rule.name = "Aftershock watch";
    rule.condition = Condition{make_comparison(
        "disaster_type", ComparisonOperator::Eq, FieldValue{std::string("earthquake")})};
    rule.actions.task_types = {"monitor"};
    rule.priority = Priority::Low;
    rule.weight = 0.5;

    TaskChainTemplate watch;
    watch.scene_code = "watch";
    watch.chain_name = "Watch";
    watch.tasks = {task("monitor", {})};

    Harness h(rescue_pool());
    auto deps = h.dependencies();
    deps.rule_engine = std::make_shared<const RuleEngine>(std::vector<TriggerRule>{rule});
    deps.templates =
        std::make_shared<const TaskTemplateLibrary>(std::vector<TaskChainTemplate>{watch});
    AllocationPipeline pipeline(PipelineConfig{}, deps);

    auto request = quake_request("run-1", 0);
    request.event.scene_codes = {"watch"};
    auto result = pipeline.run(request);

    EXPECT_EQ(result.status, PipelineStatus::Committed);
    ASSERT_TRUE(result.committed.has_value());
    EXPECT_TRUE(result.committed->selected_resources.empty());
    EXPECT_EQ(result.committed->capacity_status, CapacityStatus::NotApplicable);
    EXPECT_EQ(result.stage_timings.back().stage, "commit");
    for (const auto& candidate : rescue_pool())
    {
        EXPECT_EQ(h.catalog->status_of(candidate.id), ResourceStatus::Available);
    }
    EXPECT_EQ(h.locks->active_lock_count(), 0u);

    auto events = h.notifications->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].resources.empty());
    EXPECT_EQ(events[0].task_sequence, (std::vector<TaskCode>{"monitor"}));

    auto records = h.audit->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].error_code.empty());
}

// ============================================================================
// Runs that end without a commit
// ============================================================================

TEST(AllocationPipelineTests, NoCommit_EverySolutionVetoed)
{
    Harness h(rescue_pool(0.2));
    auto result = h.pipeline().run(quake_request("run-1"));

    EXPECT_EQ(result.status, PipelineStatus::NoFeasibleSolution);
    EXPECT_FALSE(result.committed.has_value());
    EXPECT_TRUE(result.ranked.empty());
    EXPECT_EQ(result.rejections.size(), result.solutions.size());
    ASSERT_FALSE(result.rejections.empty());
    EXPECT_EQ(result.rejections[0].rule_ids[0], "HR-RISK-001");
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
    EXPECT_TRUE(h.notifications->events().empty());
}

TEST(AllocationPipelineTests, NoCommit_PendingReviewWithoutGate)
{
    Harness h(rescue_pool());
    auto result = h.pipeline(review_everything()).run(quake_request("run-1"));

    EXPECT_EQ(result.status, PipelineStatus::PendingReview);
    EXPECT_FALSE(result.committed.has_value());
    ASSERT_FALSE(result.ranked.empty());
    EXPECT_TRUE(result.ranked[0].solution.requires_human_review);
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
    EXPECT_EQ(h.locks->active_lock_count(), 0u);
}

// ============================================================================
// Review gate
// ============================================================================

TEST(AllocationPipelineTests, Review_ApproveCommits)
{
    Harness h(rescue_pool());
    h.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Approve));
    auto result = h.pipeline(review_everything()).run(quake_request("run-1"));

    EXPECT_EQ(result.status, PipelineStatus::Committed);
    ASSERT_TRUE(result.review.has_value());
    EXPECT_EQ(result.review->verdict, ReviewVerdict::Approve);

    ASSERT_EQ(h.gate->requests.size(), 1u);
    const auto& request = h.gate->requests[0];
    EXPECT_EQ(request.run_id, "run-1");
    ASSERT_FALSE(request.reasons.empty());
    EXPECT_EQ(request.reasons[0], "Risk 0.02 reaches the review threshold 0.01");
}

TEST(AllocationPipelineTests, Review_RejectStopsRun)
{
    Harness h(rescue_pool());
    h.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Reject));
    auto result = h.pipeline(review_everything()).run(quake_request("run-1"));

    EXPECT_EQ(result.status, PipelineStatus::RejectedByReview);
    EXPECT_FALSE(result.committed.has_value());
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
    EXPECT_TRUE(h.notifications->events().empty());
}

TEST(AllocationPipelineTests, Review_ModifyCommitsReplacement)
{
    Harness h(rescue_pool());
    h.gate = std::make_shared<ScriptedReviewGate>(
        decision(ReviewVerdict::Modify, {"usar-2", "usar-3"}));
    auto result = h.pipeline(review_everything()).run(quake_request("run-1"));

    ASSERT_EQ(result.status, PipelineStatus::Committed);
    EXPECT_EQ(result.committed->solution_id, "manual-review");
    EXPECT_EQ(result.committed->algorithm, AllocationAlgorithm::Manual);
    EXPECT_EQ(result.committed->selected_resources, (std::vector<ResourceId>{"usar-2", "usar-3"}));

    bool noted = false;
    for (const auto& v : result.violations)
    {
        noted = noted || (v.kind == ViolationKind::ReviewOverride && v.subject == "duty-officer");
    }
    EXPECT_TRUE(noted);
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
    EXPECT_EQ(h.catalog->status_of("usar-3"), ResourceStatus::Deployed);
}

TEST(AllocationPipelineTests, Review_ModifyFailingHardRuleRejected)
{
    Harness h(rescue_pool());
    h.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Modify, {"usar-slow"}));
    auto result = h.pipeline(review_everything()).run(quake_request("run-1"));

    EXPECT_EQ(result.status, PipelineStatus::RejectedByReview);
    ASSERT_FALSE(result.rejections.empty());
    EXPECT_EQ(result.rejections.back().solution_id, "manual-review");
    EXPECT_EQ(result.rejections.back().rule_ids, (std::vector<std::string>{"HR-TIME-001"}));
    EXPECT_EQ(h.catalog->status_of("usar-slow"), ResourceStatus::Available);
}

TEST(AllocationPipelineTests, Review_ModifyWithBadReplacementIsAnError)
{
    Harness h(rescue_pool());
    h.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Modify, {"ghost"}));
    EXPECT_THROW(h.pipeline(review_everything()).run(quake_request("run-1")), InvalidInputError);

    Harness empty(rescue_pool());
    empty.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Modify));
    EXPECT_THROW(empty.pipeline(review_everything()).run(quake_request("run-2")), InvalidInputError);
}

// ============================================================================
// Lock and commit failures
// ============================================================================

TEST(AllocationPipelineTests, Failure_LockConflictLeavesNothingHeld)
{
    Harness h(rescue_pool());
    auto held = h.locks->acquire({"usar-2"}, "other-run");

    try
    {
        h.pipeline().run(quake_request("run-1"));
        FAIL() << "expected LockConflictError";
    }
    catch (const LockConflictError& e)
    {
        EXPECT_EQ(e.conflicting_resources(), (std::vector<std::string>{"usar-2"}));
    }
    EXPECT_FALSE(h.locks->is_locked("usar-1"));
    EXPECT_EQ(h.locks->holder_of("usar-2"), std::optional<std::string>("other-run"));
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
}

TEST(AllocationPipelineTests, Failure_StaleResourceReleasesLocks)
{
    Harness h(rescue_pool());
    h.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Approve));
    auto catalog = h.catalog;
    h.gate->on_review = [catalog] { catalog->set_status("usar-1", ResourceStatus::Deployed); };

    try
    {
        h.pipeline(review_everything()).run(quake_request("run-1"));
        FAIL() << "expected StaleResourceError";
    }
    catch (const StaleResourceError& e)
    {
        EXPECT_EQ(e.stale_resources(), (std::vector<std::string>{"usar-1"}));
    }
    EXPECT_EQ(h.locks->active_lock_count(), 0u);
    EXPECT_EQ(h.catalog->status_of("usar-2"), ResourceStatus::Available);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(AllocationPipelineTests, Cancellation_BeforeStart)
{
    Harness h(rescue_pool());
    CancellationToken token;
    token.request_stop();
    EXPECT_THROW(h.pipeline().run(quake_request("run-1"), &token), RunCancelledError);
    EXPECT_TRUE(h.notifications->events().empty());
}

TEST(AllocationPipelineTests, Cancellation_DuringReviewStopsBeforeLocking)
{
    Harness h(rescue_pool());
    auto token = std::make_shared<CancellationToken>();
    h.gate = std::make_shared<ScriptedReviewGate>(decision(ReviewVerdict::Approve));
    h.gate->on_review = [token] { token->request_stop(); };

    EXPECT_THROW(h.pipeline(review_everything()).run(quake_request("run-1"), token.get()),
                 RunCancelledError);
    EXPECT_EQ(h.locks->active_lock_count(), 0u);
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
}

TEST(AllocationPipelineTests, Cancellation_AfterLockingReleasesLocks)
{
    // The stop arrives while the lock manager reads its clock inside acquire()
    auto token = std::make_shared<CancellationToken>();
    const auto start = std::chrono::steady_clock::now();
    Harness h(rescue_pool(), [token, start] {
        token->request_stop();
        return start;
    });

    EXPECT_THROW(h.pipeline().run(quake_request("run-1"), token.get()), RunCancelledError);
    EXPECT_FALSE(h.locks->is_locked("usar-1"));
    EXPECT_FALSE(h.locks->is_locked("usar-2"));
    EXPECT_EQ(h.catalog->status_of("usar-1"), ResourceStatus::Available);
}

// ============================================================================
// Audit
// ============================================================================

TEST(AllocationPipelineTests, Audit_OneRecordPerRun)
{
    Harness h(rescue_pool());
    auto pipeline = h.pipeline();
    pipeline.run(quake_request("run-1"));

    auto records = h.audit->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].run_id, "run-1");
    ASSERT_TRUE(records[0].result.has_value());
    EXPECT_EQ(records[0].result->status, PipelineStatus::Committed);
    EXPECT_TRUE(records[0].error_code.empty());

    JsonValue json = audit_record_to_json(records[0]);
    EXPECT_EQ(json.at("status", "audit").as_string("status"), "committed");
    EXPECT_EQ(json.at("input", "audit").at("event_id", "input").as_string("event_id"), "EQ-1");
    EXPECT_NE(json.find("committed"), nullptr);
}

TEST(AllocationPipelineTests, Audit_ErrorRecordCarriesCode)
{
    Harness h(rescue_pool());
    auto held = h.locks->acquire({"usar-1"}, "other-run");
    EXPECT_THROW(h.pipeline().run(quake_request("run-1")), LockConflictError);

    auto records = h.audit->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error_code, "LockConflict");
    EXPECT_FALSE(records[0].error_message.empty());

    JsonValue json = audit_record_to_json(records[0]);
    EXPECT_EQ(json.at("status", "audit").as_string("status"), "error");
    EXPECT_EQ(json.at("error_code", "audit").as_string("error_code"), "LockConflict");
}

TEST(AllocationPipelineTests, Audit_ErrorRecordKeepsPartialResult)
{
    Harness h(rescue_pool());
    auto held = h.locks->acquire({"usar-1"}, "other-run");
    EXPECT_THROW(h.pipeline().run(quake_request("run-1")), LockConflictError);

    auto records = h.audit->records();
    ASSERT_EQ(records.size(), 1u);
    ASSERT_TRUE(records[0].result.has_value());
    const PipelineResult& partial = *records[0].result;
    EXPECT_EQ(partial.run_id, "run-1");
    ASSERT_EQ(partial.matched_rules.size(), 1u);
    EXPECT_EQ(partial.matched_rules[0].rule_id, "R-QUAKE");
    EXPECT_EQ(partial.task_plan.sequence.size(), 1u);
    EXPECT_EQ(partial.candidate_count, 4u);
    EXPECT_FALSE(partial.solutions.empty());
    EXPECT_FALSE(partial.ranked.empty());
    EXPECT_FALSE(partial.committed.has_value());
    EXPECT_EQ(partial.stage_timings.size(), 5u);

    JsonValue json = audit_record_to_json(records[0]);
    EXPECT_EQ(json.at("status", "audit").as_string("status"), "error");
    EXPECT_FALSE(json.at("solutions", "audit").as_array("solutions").empty());
    EXPECT_EQ(json.at("matched_rules", "audit").as_array("matched_rules").size(), 1u);
}

TEST(AllocationPipelineTests, Audit_UnexpectedSinkErrorStillAudited)
{
    class FailingNotificationSink : public NotificationSink
    {
    public:
        void publish(const CommittedPlanEvent&) override
        {
            throw std::runtime_error("push channel closed");
        }
    };

    Harness h(rescue_pool());
    auto deps = h.dependencies();
    deps.notifications = std::make_shared<FailingNotificationSink>();
    AllocationPipeline pipeline(PipelineConfig{}, deps);

    LogCapture logs;
    EXPECT_THROW(pipeline.run(quake_request("run-1")), std::runtime_error);

    auto records = h.audit->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error_code, "Unexpected");
    EXPECT_EQ(records[0].error_message, "push channel closed");
    ASSERT_TRUE(records[0].result.has_value());
    ASSERT_TRUE(records[0].result->committed.has_value());
    EXPECT_TRUE(logs.contains(LogLevel::Error, "push channel closed"));
}

TEST(AllocationPipelineTests, Audit_StreamSinkWritesOneLinePerRecord)
{
    Harness h(rescue_pool(0.2));
    std::ostringstream out;
    auto deps = h.dependencies();
    deps.audit = std::make_shared<StreamAuditSink>(out);
    AllocationPipeline pipeline(PipelineConfig{}, deps);

    pipeline.run(quake_request("run-1"));
    pipeline.run(quake_request("run-2"));

    std::istringstream lines(out.str());
    std::string line;
    std::vector<std::string> run_ids;
    while (std::getline(lines, line))
    {
        JsonValue json = json_parse(line);
        run_ids.push_back(json.at("run_id", "line").as_string("run_id"));
        EXPECT_EQ(json.at("status", "line").as_string("status"), "no_feasible_solution");
    }
    EXPECT_EQ(run_ids, (std::vector<std::string>{"run-1", "run-2"}));
}

// ============================================================================
// Input validation
// ============================================================================

TEST(AllocationPipelineTests, Input_InvalidRequestRejected)
{
    Harness h(rescue_pool());
    auto pipeline = h.pipeline();

    EXPECT_THROW(pipeline.run(quake_request("")), InvalidInputError);
    EXPECT_THROW(pipeline.run(quake_request("run-1", -5)), InvalidInputError);
    auto request = quake_request("run-2");
    request.max_results = 0;
    EXPECT_THROW(pipeline.run(request), InvalidInputError);

    auto records = h.audit->records();
    ASSERT_EQ(records.size(), 3u);
    for (const auto& r : records)
    {
        EXPECT_EQ(r.error_code, "InvalidInput");
    }
}

TEST(AllocationPipelineTests, Input_MaxResultsLimitsCandidates)
{
    Harness h(rescue_pool());
    auto request = quake_request("run-1");
    request.max_results = 2;
    auto result = h.pipeline().run(request);
    EXPECT_EQ(result.candidate_count, 2u);
}

// ============================================================================
// Optimizer failure handling
// ============================================================================

TEST(AllocationPipelineTests, Optimizer_FailurePropagatesByDefault)
{
    Harness h(rescue_pool());
    auto request = quake_request("run-1", 100000);
    request.mode = OptimizationMode::MultiObjective;

    EXPECT_THROW(h.pipeline().run(request), OptimizerNonConvergenceError);
    EXPECT_EQ(h.audit->records()[0].error_code, "OptimizerNonConvergence");
}

TEST(AllocationPipelineTests, Optimizer_GreedyRetryWhenEnabled)
{
    Harness h(rescue_pool());
    PipelineConfig config;
    config.retry_greedy_on_optimizer_failure = true;
    auto request = quake_request("run-1", 100000);
    request.mode = OptimizationMode::MultiObjective;

    auto result = h.pipeline(config).run(request);
    EXPECT_EQ(result.mode_used, OptimizationMode::Greedy);
    EXPECT_FALSE(result.optimizer_fallback_reason.empty());
    // The greedy plan is far below the capacity floor
    EXPECT_EQ(result.status, PipelineStatus::NoFeasibleSolution);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(AllocationPipelineTests, Concurrency_CompetingRunsNeverShareResources)
{
    Harness h(rescue_pool());
    auto pipeline = h.pipeline();

    std::vector<std::future<PipelineResult>> futures;
    for (int i = 0; i < 4; ++i)
    {
        futures.push_back(pipeline.submit(quake_request("run-" + std::to_string(i)),
                                          std::make_shared<CancellationToken>()));
    }

    std::map<ResourceId, std::string> owner;
    int committed = 0;
    for (size_t i = 0; i < futures.size(); ++i)
    {
        try
        {
            PipelineResult result = futures[i].get();
            if (result.status != PipelineStatus::Committed)
            {
                continue;
            }
            ++committed;
            for (const auto& id : result.committed->selected_resources)
            {
                EXPECT_TRUE(owner.emplace(id, result.run_id).second) << id;
            }
        }
        catch (const LockConflictError&)
        {
        }
        catch (const StaleResourceError&)
        {
        }
    }

    EXPECT_GE(committed, 1);
    EXPECT_EQ(h.audit->records().size(), futures.size());
    EXPECT_EQ(h.locks->active_lock_count(), 0u);
    for (const auto& [id, run] : owner)
    {
        EXPECT_EQ(h.catalog->status_of(id), ResourceStatus::Deployed) << run;
    }
}
