/**
 * @file pipeline_sinks.cpp
 */
#include "resq/pipeline/pipeline_sinks.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

namespace
{

template <typename Container>
JsonValue string_array(const Container& items)
{
    JsonValue out = JsonValue::make_array();
    for (const auto& item : items)
    {
        out.push_back(JsonValue::make_string(item));
    }
    return out;
}

JsonValue violation_to_json(const Violation& v)
{
    JsonValue out = JsonValue::make_object();
    out.set("kind", JsonValue::make_string(to_string(v.kind)));
    out.set("severity", JsonValue::make_string(to_string(v.severity)));
    out.set("strict", JsonValue::make_bool(v.strict));
    out.set("subject", JsonValue::make_string(v.subject));
    out.set("message", JsonValue::make_string(v.message));
    return out;
}

JsonValue solution_to_json(const AllocationSolution& s)
{
    JsonValue out = JsonValue::make_object();
    out.set("solution_id", JsonValue::make_string(s.solution_id));
    out.set("algorithm", JsonValue::make_string(to_string(s.algorithm)));
    out.set("selected_resources", string_array(s.selected_resources));
    out.set("covered_capabilities", string_array(s.covered_capabilities));
    out.set("uncovered_capabilities", string_array(s.uncovered_capabilities));
    out.set("total_rescue_capacity",
            JsonValue::make_number(static_cast<double>(s.total_rescue_capacity)));
    out.set("estimated_affected", JsonValue::make_number(s.estimated_affected));
    out.set("capacity_coverage_rate", JsonValue::make_number(s.capacity_coverage_rate));
    out.set("capacity_status", JsonValue::make_string(to_string(s.capacity_status)));
    if (!s.capacity_warning.empty())
    {
        out.set("capacity_warning", JsonValue::make_string(s.capacity_warning));
    }

    JsonValue objectives = JsonValue::make_object();
    objectives.set("response_time", JsonValue::make_number(s.objectives.response_time));
    objectives.set("coverage_rate", JsonValue::make_number(s.objectives.coverage_rate));
    objectives.set("cost", JsonValue::make_number(s.objectives.cost));
    objectives.set("risk", JsonValue::make_number(s.objectives.risk));
    out.set("objectives", std::move(objectives));

    JsonValue violations = JsonValue::make_array();
    for (const auto& v : s.violations)
    {
        violations.push_back(violation_to_json(v));
    }
    out.set("violations", std::move(violations));
    out.set("requires_human_review", JsonValue::make_bool(s.requires_human_review));
    return out;
}

void add_result(JsonValue& out, const PipelineResult& r)
{
    out.set("status", JsonValue::make_string(to_string(r.status)));
    out.set("mode", JsonValue::make_string(to_string(r.mode_used)));

    JsonValue rules = JsonValue::make_array();
    for (const auto& m : r.matched_rules)
    {
        rules.push_back(JsonValue::make_string(m.rule_id));
    }
    out.set("matched_rules", std::move(rules));

    JsonValue tasks = JsonValue::make_array();
    for (const auto& node : r.task_plan.sequence)
    {
        tasks.push_back(JsonValue::make_string(node.task_code));
    }
    out.set("task_sequence", std::move(tasks));
    out.set("candidate_count", JsonValue::make_number(static_cast<double>(r.candidate_count)));

    JsonValue solutions = JsonValue::make_array();
    for (const auto& s : r.solutions)
    {
        solutions.push_back(solution_to_json(s));
    }
    out.set("solutions", std::move(solutions));

    JsonValue rejections = JsonValue::make_array();
    for (const auto& rej : r.rejections)
    {
        JsonValue item = JsonValue::make_object();
        item.set("solution_id", JsonValue::make_string(rej.solution_id));
        item.set("rule_ids", string_array(rej.rule_ids));
        item.set("reasons", string_array(rej.reasons));
        rejections.push_back(std::move(item));
    }
    out.set("rejections", std::move(rejections));

    if (r.committed)
    {
        out.set("committed", solution_to_json(*r.committed));
    }
    if (r.review)
    {
        JsonValue review = JsonValue::make_object();
        review.set("verdict", JsonValue::make_string(to_string(r.review->verdict)));
        review.set("reviewer", JsonValue::make_string(r.review->reviewer));
        review.set("comment", JsonValue::make_string(r.review->comment));
        out.set("review", std::move(review));
    }
    if (!r.optimizer_fallback_reason.empty())
    {
        out.set("optimizer_fallback_reason", JsonValue::make_string(r.optimizer_fallback_reason));
    }

    JsonValue violations = JsonValue::make_array();
    for (const auto& v : r.violations)
    {
        violations.push_back(violation_to_json(v));
    }
    out.set("violations", std::move(violations));

    JsonValue timings = JsonValue::make_object();
    for (const auto& t : r.stage_timings)
    {
        timings.set(t.stage, JsonValue::make_number(t.duration.count() / 1.0e6));
    }
    out.set("stage_ms", std::move(timings));
    out.set("total_ms", JsonValue::make_number(r.total_duration.count() / 1.0e6));
}

} // namespace

JsonValue audit_record_to_json(const AuditRecord& record)
{
    JsonValue out = JsonValue::make_object();
    out.set("run_id", JsonValue::make_string(record.run_id));

    const EventContext& event = record.request.event;
    JsonValue input = JsonValue::make_object();
    input.set("event_id", JsonValue::make_string(event.event_id));
    input.set("disaster_type", JsonValue::make_string(event.disaster_type));
    input.set("estimated_affected", JsonValue::make_number(event.estimated_affected));
    input.set("scene_codes", string_array(event.scene_codes));
    if (event.golden_hour_deadline_minutes)
    {
        input.set("golden_hour_deadline_minutes",
                  JsonValue::make_number(*event.golden_hour_deadline_minutes));
    }
    JsonValue attributes = JsonValue::make_object();
    for (const auto& [key, value] : event.attributes)
    {
        attributes.set(key, JsonValue::make_string(to_string(value)));
    }
    input.set("attributes", std::move(attributes));
    input.set("mode", JsonValue::make_string(to_string(record.request.mode)));
    out.set("input", std::move(input));

    if (record.result)
    {
        add_result(out, *record.result);
    }
    if (!record.error_code.empty())
    {
        out.set("status", JsonValue::make_string("error"));
        out.set("error_code", JsonValue::make_string(record.error_code));
        out.set("error_message", JsonValue::make_string(record.error_message));
    }
    return out;
}

StreamAuditSink::StreamAuditSink(std::ostream& out)
    : m_out(out)
{
}

void StreamAuditSink::record(const AuditRecord& record)
{
    std::string line = json_stringify(audit_record_to_json(record));
    std::lock_guard<std::mutex> guard(m_mutex);
    m_out << line << '\n';
    m_out.flush();
}

void LoggingNotificationSink::publish(const CommittedPlanEvent& event)
{
    std::string resources;
    for (const auto& id : event.resources)
    {
        resources += (resources.empty() ? "" : ",") + id;
    }
    log(LogLevel::Info,
        "Committed plan " + event.solution_id + " for run '" + event.run_id + "' (event " +
            event.event_id + "): resources [" + resources + "], capacity " +
            std::to_string(event.total_rescue_capacity) + ", coverage " +
            format_decimal(event.capacity_coverage_rate));
}

} // namespace resq
