/**
 * @file pipeline_sinks.hpp
 * @brief Interfaces the pipeline produces to: audit, notification, review.
 */
#pragma once
#include "resq/common/json_value.hpp"
#include "resq/pipeline/allocation_request.hpp"
#include "resq/pipeline/pipeline_result.hpp"

#include <mutex>

namespace resq
{

/**
 * @brief Everything an external audit log keeps about one run.
 *
 * @details
 * Exactly one record is emitted per run. A run that ended in an error
 * carries `error_code` and `error_message` together with the partial
 * result built before the failure. `error_code` is the `ErrorCode` name,
 * or "Unexpected" for an exception outside the resq hierarchy.
 */
struct AuditRecord
{
    std::string run_id;
    AllocationRequest request;
    std::optional<PipelineResult> result;
    std::string error_code;
    std::string error_message;
};

/**
 * @brief Handed to the external push mechanism after a commit.
 */
struct CommittedPlanEvent
{
    std::string run_id;
    std::string event_id;
    std::string solution_id;
    std::vector<ResourceId> resources;
    std::vector<TaskCode> task_sequence;
    int64_t total_rescue_capacity{0};
    double capacity_coverage_rate{0.0};
    std::string capacity_warning;
};

/**
 * @brief What the human-review gate is asked to decide on.
 */
struct ReviewRequest
{
    std::string run_id;
    EventContext event;
    ScoredSolution proposed;
    /// Other ranked survivors, best first.
    std::vector<ScoredSolution> alternatives;
    /// Why review is required.
    std::vector<std::string> reasons;
};

class AuditSink
{
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditRecord& record) = 0;
};

class NotificationSink
{
public:
    virtual ~NotificationSink() = default;
    virtual void publish(const CommittedPlanEvent& event) = 0;
};

/**
 * @brief External approve/reject/modify decision point.
 *
 * @details
 * The pipeline calls `review()` synchronously from the run's thread and
 * proceeds to lock and commit only after it returns.
 */
class ReviewGate
{
public:
    virtual ~ReviewGate() = default;
    virtual ReviewDecision review(const ReviewRequest& request) = 0;
};

/// JSON form of an audit record.
JsonValue audit_record_to_json(const AuditRecord& record);

/**
 * @brief Writes each audit record as one JSON line.
 *
 * @par Thread safety
 * - `record()` serializes writes; lines from concurrent runs never interleave.
 */
class StreamAuditSink : public AuditSink
{
public:
    explicit StreamAuditSink(std::ostream& out);
    void record(const AuditRecord& record) override;

private:
    std::ostream& m_out;
    std::mutex m_mutex;
};

/**
 * @brief Publishes committed plans to the log.
 */
class LoggingNotificationSink : public NotificationSink
{
public:
    void publish(const CommittedPlanEvent& event) override;
};

} // namespace resq
