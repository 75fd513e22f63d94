/**
 * @file rule_engine.cpp
 */
#include "resq/rules/rule_engine.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

RuleEngine::RuleEngine(std::vector<TriggerRule> rules)
    : m_rules(std::move(rules))
{
    if (m_rules.empty())
    {
        throw RuleLoadError("Rule source is empty; refusing to evaluate with zero rules");
    }

    std::set<std::string> seen;
    for (const auto& rule : m_rules)
    {
        if (rule.id.empty())
        {
            throw RuleLoadError("Rule with empty id");
        }
        if (!seen.insert(rule.id).second)
        {
            throw RuleLoadError("Duplicate rule id '" + rule.id + "'");
        }
        if (!(rule.weight >= 0.0 && rule.weight <= 1.0))
        {
            throw RuleLoadError(
                "Rule '" + rule.id + "' weight " + format_decimal(rule.weight) +
                " is outside [0, 1]");
        }
    }
}

size_t RuleEngine::rule_count() const noexcept
{
    return m_rules.size();
}

const std::vector<TriggerRule>& RuleEngine::rules() const noexcept
{
    return m_rules;
}

std::vector<MatchedRule> RuleEngine::evaluate(const EventContext& context) const
{
    std::vector<MatchedRule> matches;

    for (const auto& rule : m_rules)
    {
        std::vector<std::string> matched_conditions;
        if (!evaluate_condition(rule.condition, context, matched_conditions))
        {
            continue;
        }

        MatchedRule m;
        m.rule_id = rule.id;
        m.rule_name = rule.name;
        m.priority = rule.priority;
        m.weight = rule.weight;
        m.actions = rule.actions;
        m.matched_conditions = std::move(matched_conditions);
        matches.push_back(std::move(m));
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const MatchedRule& a, const MatchedRule& b) {
                         return a.weight > b.weight;
                     });

    log(LogLevel::Info,
        "Event '" + context.event_id + "' matched " + std::to_string(matches.size()) + " of " +
            std::to_string(m_rules.size()) + " rules");
    return matches;
}

std::vector<Requirement> RuleEngine::derive_requirements(const std::vector<MatchedRule>& matched)
{
    std::vector<Requirement> requirements;
    std::unordered_map<TaskCode, size_t> index_by_task;

    auto requirement_for = [&](const TaskCode& task_type, Priority priority) -> Requirement& {
        auto it = index_by_task.find(task_type);
        if (it != index_by_task.end())
        {
            Requirement& existing = requirements[it->second];
            existing.priority = stronger_priority(existing.priority, priority);
            return existing;
        }
        index_by_task.emplace(task_type, requirements.size());
        Requirement req;
        req.task_type = task_type;
        req.priority = priority;
        requirements.push_back(std::move(req));
        return requirements.back();
    };

    for (const auto& rule : matched)
    {
        std::vector<TaskCode> task_types = rule.actions.task_types;
        if (task_types.empty())
        {
            task_types.emplace_back();
        }

        for (const auto& task_type : task_types)
        {
            Requirement& req = requirement_for(task_type, rule.priority);
            for (const auto& need : rule.actions.required_capabilities)
            {
                req.required_capabilities.insert(need.code);
                if (need.priority == Priority::Critical || rule.priority == Priority::Critical)
                {
                    req.critical_capabilities.insert(need.code);
                }
            }
        }
    }

    return requirements;
}

} // namespace resq
