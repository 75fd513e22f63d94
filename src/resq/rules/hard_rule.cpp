/**
 * @file hard_rule.cpp
 */
#include "resq/rules/hard_rule.hpp"
#include "resq/common/errors.hpp"

namespace resq
{

const char* to_string(HardRuleAction action) noexcept
{
    return action == HardRuleAction::Reject ? "reject" : "warn";
}

const char* to_string(HardRuleSeverity severity) noexcept
{
    switch (severity)
    {
    case HardRuleSeverity::Critical:
        return "critical";
    case HardRuleSeverity::High:
        return "high";
    case HardRuleSeverity::Medium:
        return "medium";
    }
    return "high";
}

namespace
{

bool is_numeric_operator(ComparisonOperator op)
{
    switch (op)
    {
    case ComparisonOperator::Eq:
    case ComparisonOperator::Ne:
    case ComparisonOperator::Gt:
    case ComparisonOperator::Gte:
    case ComparisonOperator::Lt:
    case ComparisonOperator::Lte:
        return true;
    default:
        return false;
    }
}

bool compare_numbers(double lhs, ComparisonOperator op, double rhs)
{
    switch (op)
    {
    case ComparisonOperator::Eq:
        return lhs == rhs;
    case ComparisonOperator::Ne:
        return lhs != rhs;
    case ComparisonOperator::Gt:
        return lhs > rhs;
    case ComparisonOperator::Gte:
        return lhs >= rhs;
    case ComparisonOperator::Lt:
        return lhs < rhs;
    case ComparisonOperator::Lte:
        return lhs <= rhs;
    default:
        return false;
    }
}

void replace_all(std::string& text, const std::string& token, const std::string& value)
{
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos)
    {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

std::optional<std::string> evaluate_hard_rule(const HardRule& rule, const MetricMap& metrics)
{
    if (rule.precondition)
    {
        auto it = metrics.find(rule.precondition->field);
        if (it == metrics.end() ||
            !compare_numbers(it->second, rule.precondition->op, rule.precondition->value))
        {
            return std::nullopt;
        }
    }

    auto value_it = metrics.find(rule.check.field);
    if (value_it == metrics.end())
    {
        return std::nullopt;
    }

    double threshold = 0.0;
    if (!rule.check.threshold_field.empty())
    {
        auto threshold_it = metrics.find(rule.check.threshold_field);
        if (threshold_it == metrics.end())
        {
            return std::nullopt;
        }
        threshold = threshold_it->second;
    }
    else if (rule.check.threshold)
    {
        threshold = *rule.check.threshold;
    }
    else
    {
        return std::nullopt;
    }

    if (!compare_numbers(value_it->second, rule.check.op, threshold))
    {
        return std::nullopt;
    }

    std::string message = rule.message_template.empty()
                              ? rule.check.field + " " + to_string(rule.check.op) + " {threshold}"
                              : rule.message_template;
    replace_all(message, "{value}", format_decimal(value_it->second));
    replace_all(message, "{threshold}", format_decimal(threshold));
    return message;
}

void validate_hard_rule(const HardRule& rule)
{
    if (rule.id.empty())
    {
        throw RuleLoadError("Hard rule with empty id");
    }
    if (rule.check.field.empty())
    {
        throw RuleLoadError("Hard rule '" + rule.id + "' has no check field");
    }
    if (!rule.check.threshold && rule.check.threshold_field.empty())
    {
        throw RuleLoadError("Hard rule '" + rule.id + "' has neither threshold nor threshold_field");
    }
    if (!is_numeric_operator(rule.check.op))
    {
        throw RuleLoadError(
            "Hard rule '" + rule.id + "' uses non-numeric operator '" +
            to_string(rule.check.op) + "'");
    }
    if (rule.precondition && !is_numeric_operator(rule.precondition->op))
    {
        throw RuleLoadError(
            "Hard rule '" + rule.id + "' precondition uses non-numeric operator '" +
            to_string(rule.precondition->op) + "'");
    }
}

std::vector<HardRule> default_hard_rules()
{
    std::vector<HardRule> rules;

    HardRule risk;
    risk.id = "HR-RISK-001";
    risk.name = "Rescuer risk ceiling";
    risk.check = MetricCheck{"rescue_risk", ComparisonOperator::Gt, 0.10, ""};
    risk.action = HardRuleAction::Reject;
    risk.message_template = "Rescue risk {value} exceeds ceiling {threshold}";
    risk.severity = HardRuleSeverity::Critical;
    rules.push_back(risk);

    HardRule time;
    time.id = "HR-TIME-001";
    time.name = "Golden hour deadline";
    time.check = MetricCheck{"response_time_min", ComparisonOperator::Gt, std::nullopt,
                             "golden_hour_deadline"};
    time.action = HardRuleAction::Reject;
    time.message_template = "Response time {value} min exceeds golden-hour deadline {threshold} min";
    time.severity = HardRuleSeverity::Critical;
    rules.push_back(time);

    HardRule capacity;
    capacity.id = "HR-CAP-001";
    capacity.name = "Minimum capacity coverage";
    capacity.check = MetricCheck{"capacity_coverage_rate", ComparisonOperator::Lt, 0.5, ""};
    capacity.precondition = MetricPrecondition{"estimated_affected", ComparisonOperator::Gt, 0.0};
    capacity.action = HardRuleAction::Reject;
    capacity.message_template = "Capacity coverage {value} is below minimum {threshold}";
    capacity.severity = HardRuleSeverity::Critical;
    rules.push_back(capacity);

    HardRule critical;
    critical.id = "HR-CRIT-001";
    critical.name = "Critical capability coverage";
    critical.check =
        MetricCheck{"uncovered_critical_capabilities", ComparisonOperator::Gt, 0.0, ""};
    critical.action = HardRuleAction::Warn;
    critical.message_template = "{value} critical capabilities are not covered";
    critical.severity = HardRuleSeverity::High;
    rules.push_back(critical);

    return rules;
}

} // namespace resq
