/**
 * @file rule_engine.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"
#include "resq/rules/condition.hpp"
#include "resq/rules/event_context.hpp"

namespace resq
{

/**
 * @brief One capability a rule asks for.
 */
struct CapabilityNeed
{
    CapabilityCode code;
    Priority priority{Priority::Medium};
    int min_quantity{1};
};

/**
 * @brief What a trigger rule contributes when its condition holds.
 */
struct RuleAction
{
    std::vector<TaskCode> task_types;
    std::vector<CapabilityNeed> required_capabilities;
    std::vector<std::string> resource_types;
    std::string grouping_pattern;
    std::string tactical_notes;
};

/**
 * @brief A declarative trigger rule.
 */
struct TriggerRule
{
    std::string id;
    std::string name;
    std::string description;
    Condition condition;
    RuleAction actions;
    Priority priority{Priority::Medium};

    /// Ranking weight in [0, 1].
    double weight{0.5};
};

/**
 * @brief A rule whose condition held for an event.
 */
struct MatchedRule
{
    std::string rule_id;
    std::string rule_name;
    Priority priority{Priority::Medium};
    double weight{0.0};
    RuleAction actions;

    /// Descriptions of the leaf comparisons that held.
    std::vector<std::string> matched_conditions;
};

/**
 * @brief Evaluates trigger rules against an event.
 *
 * @details
 * The rule set is fixed at construction. Evaluation is pure: it tests every
 * rule's condition tree, collects the matches and orders them by descending
 * weight (equal weights keep load order).
 *
 * @par Thread safety
 * - Immutable after construction; concurrent `evaluate()` calls are safe.
 */
class RuleEngine
{
public:
    /**
     * @brief Construct an engine over a loaded rule set.
     * @throw RuleLoadError if `rules` is empty, an id repeats, an id is empty,
     *        or a weight lies outside [0, 1].
     */
    explicit RuleEngine(std::vector<TriggerRule> rules);

    size_t rule_count() const noexcept;

    const std::vector<TriggerRule>& rules() const noexcept;

    /**
     * @brief Evaluate all rules against `context`.
     * @return Matched rules ordered by descending weight.
     */
    std::vector<MatchedRule> evaluate(const EventContext& context) const;

    /**
     * @brief Turn matched rules into requirements.
     *
     * @details
     * One requirement per task type, in order of first appearance. A task type
     * emitted by several rules gets the union of their capabilities and the
     * strongest priority. A capability is critical when its own priority or
     * the emitting rule's priority is critical. Rules without task types feed
     * a single requirement with an empty task type.
     */
    static std::vector<Requirement> derive_requirements(const std::vector<MatchedRule>& matched);

private:
    std::vector<TriggerRule> m_rules;
};

} // namespace resq
