/**
 * @file hard_rule.hpp
 * @brief One-vote-veto safety rules evaluated over solution metrics.
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/rules/condition.hpp"

namespace resq
{

/// Named numeric metrics of a solution, e.g. "rescue_risk" or "response_time_min".
using MetricMap = std::map<std::string, double>;

enum class HardRuleAction
{
    Reject,
    Warn
};

enum class HardRuleSeverity
{
    Critical,
    High,
    Medium
};

const char* to_string(HardRuleAction action) noexcept;
const char* to_string(HardRuleSeverity severity) noexcept;

/**
 * @brief The violating condition `metric <op> threshold`.
 *
 * @details
 * The threshold is either a constant or another metric named by
 * `threshold_field` (for example the event's golden-hour deadline).
 */
struct MetricCheck
{
    std::string field;
    ComparisonOperator op{ComparisonOperator::Gt};
    std::optional<double> threshold;
    std::string threshold_field;
};

/**
 * @brief Gate deciding whether a hard rule applies at all.
 */
struct MetricPrecondition
{
    std::string field;
    ComparisonOperator op{ComparisonOperator::Gt};
    double value{0.0};
};

/**
 * @brief A declarative hard rule.
 *
 * @details
 * The rule is violated when its check holds. A rule whose precondition does
 * not hold, or whose checked metric or threshold metric is absent, does not
 * apply and therefore passes.
 */
struct HardRule
{
    std::string id;
    std::string name;
    MetricCheck check;
    std::optional<MetricPrecondition> precondition;
    HardRuleAction action{HardRuleAction::Reject};

    /// Message with `{value}` and `{threshold}` placeholders.
    std::string message_template;

    HardRuleSeverity severity{HardRuleSeverity::High};
};

/**
 * @brief Evaluate one hard rule.
 * @return The formatted violation message, or nullopt if the rule passes or
 *         does not apply.
 */
std::optional<std::string> evaluate_hard_rule(const HardRule& rule, const MetricMap& metrics);

/**
 * @brief Validate a hard rule definition.
 * @throw RuleLoadError if the id is empty, no threshold is given, or an
 *        operator is not a numeric comparison.
 */
void validate_hard_rule(const HardRule& rule);

/**
 * @brief The built-in safety rules.
 *
 * @details
 * - HR-RISK-001: rescue_risk > 0.10 rejects.
 * - HR-TIME-001: response_time_min > golden_hour_deadline rejects.
 * - HR-CAP-001: capacity_coverage_rate < 0.5 rejects when estimated_affected > 0.
 * - HR-CRIT-001: uncovered_critical_capabilities > 0 warns.
 */
std::vector<HardRule> default_hard_rules();

} // namespace resq
