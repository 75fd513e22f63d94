/**
 * @file rule_loader.hpp
 * @brief JSON rule sources.
 */
#pragma once
#include "resq/common/json_value.hpp"
#include "resq/rules/hard_rule.hpp"
#include "resq/rules/rule_engine.hpp"

namespace resq
{

/**
 * @brief Read trigger rules from a document of the form `{"rules": [...]}`.
 *
 * @details
 * Each rule:
 * @code
 * {
 *   "id": "TRR-EQ-001", "name": "...", "description": "...",
 *   "trigger": {"logic": "AND", "conditions": [
 *       {"field": "disaster_type", "operator": "eq", "value": "earthquake"},
 *       {"logic": "OR", "conditions": [...]}]},
 *   "actions": {"task_types": [...],
 *               "required_capabilities": [{"code": "...", "priority": "critical",
 *                                          "min_quantity": 2}],
 *               "resource_types": [...], "grouping_pattern": "...",
 *               "tactical_notes": "..."},
 *   "priority": "high", "weight": 0.9
 * }
 * @endcode
 * `priority` defaults to medium and `weight` to 0.5.
 *
 * @throw RuleLoadError on any structural problem.
 */
std::vector<TriggerRule> load_trigger_rules(const JsonValue& doc);

/// @throw RuleLoadError if the file is unreadable or invalid.
std::vector<TriggerRule> load_trigger_rules_file(const std::string& path);

/**
 * @brief Read hard rules from a document of the form `{"hard_rules": [...]}`.
 *
 * @details
 * Each rule:
 * @code
 * {
 *   "id": "HR-RISK-001", "name": "...",
 *   "check": {"field": "rescue_risk", "operator": "gt", "threshold": 0.10},
 *   "condition": {"field": "estimated_affected", "operator": "gt", "value": 0},
 *   "action": "reject", "message": "Risk {value} exceeds {threshold}",
 *   "severity": "critical"
 * }
 * @endcode
 * `check` may name `threshold_field` instead of `threshold`.
 *
 * @throw RuleLoadError on any structural problem or an empty list.
 */
std::vector<HardRule> load_hard_rules(const JsonValue& doc);

/// @throw RuleLoadError if the file is unreadable or invalid.
std::vector<HardRule> load_hard_rules_file(const std::string& path);

} // namespace resq
