/**
 * @file task_decomposer.cpp
 */
#include "resq/tasks/task_decomposer.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"
#include "resq/tasks/task_graph.hpp"

#include <cstdio>

namespace resq
{

// ============================================================================
// DecompositionResult
// ============================================================================

std::optional<int> DecompositionResult::earliest_golden_hour() const
{
    std::optional<int> earliest;
    for (const auto& node : sequence)
    {
        if (node.golden_hour_minutes && (!earliest || *node.golden_hour_minutes < *earliest))
        {
            earliest = node.golden_hour_minutes;
        }
    }
    return earliest;
}

std::set<CapabilityCode> DecompositionResult::required_capabilities() const
{
    std::set<CapabilityCode> out;
    for (const auto& node : sequence)
    {
        out.insert(node.required_capabilities.begin(), node.required_capabilities.end());
    }
    return out;
}

bool DecompositionResult::has_strict_violations() const
{
    return std::any_of(violations.begin(), violations.end(),
                       [](const Violation& v) { return v.strict; });
}

// ============================================================================
// TaskDecomposer
// ============================================================================

namespace
{

struct PlannedTask
{
    TaskDefinition definition;
    std::set<CapabilityCode> capabilities;
    bool requirement_implied{false};
    bool has_strict_dependency{false};
};

/// Accumulates the merged task set while preserving insertion order.
class PlanBuilder
{
public:
    bool contains(const TaskCode& code) const
    {
        return m_index.count(code) > 0;
    }

    TaskIdx index_of(const TaskCode& code) const
    {
        return m_index.at(code);
    }

    PlannedTask& task(TaskIdx idx)
    {
        return m_tasks[idx];
    }

    const std::vector<PlannedTask>& tasks() const
    {
        return m_tasks;
    }

    /// Add a task or merge it into an existing one with the same code.
    TaskIdx merge(const TaskDefinition& definition)
    {
        auto it = m_index.find(definition.code);
        if (it != m_index.end())
        {
            PlannedTask& existing = m_tasks[it->second];
            existing.capabilities.insert(definition.required_capabilities.begin(),
                                         definition.required_capabilities.end());
            if (definition.golden_hour_minutes &&
                (!existing.definition.golden_hour_minutes ||
                 *definition.golden_hour_minutes < *existing.definition.golden_hour_minutes))
            {
                existing.definition.golden_hour_minutes = definition.golden_hour_minutes;
            }
            return it->second;
        }

        PlannedTask planned;
        planned.definition = definition;
        planned.capabilities.insert(definition.required_capabilities.begin(),
                                    definition.required_capabilities.end());
        TaskIdx idx = m_tasks.size();
        m_tasks.push_back(std::move(planned));
        m_index.emplace(definition.code, idx);
        return idx;
    }

private:
    std::vector<PlannedTask> m_tasks;
    std::map<TaskCode, TaskIdx> m_index;
};

std::string join_codes(const std::vector<TaskCode>& codes)
{
    std::string out;
    for (const auto& code : codes)
    {
        out += (out.empty() ? "" : ", ") + code;
    }
    return out;
}

std::string group_id(size_t ordinal)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "PG-%02zu", ordinal);
    return buf;
}

} // namespace

TaskDecomposer::TaskDecomposer(std::shared_ptr<const TaskTemplateLibrary> library)
    : m_library(std::move(library))
{
    if (!m_library)
    {
        throw InvalidInputError("TaskDecomposer requires a template library");
    }
}

DecompositionResult TaskDecomposer::decompose(
    const std::vector<Requirement>& requirements,
    const std::vector<SceneCode>& scene_codes) const
{
    DecompositionResult result;
    PlanBuilder plan;
    std::vector<DependencyDeclaration> declared_dependencies;
    std::vector<std::vector<TaskCode>> declared_hints;
    bool any_template_hints = false;

    // -------------------------------------------------------------------------
    // Merge the selected chains
    // -------------------------------------------------------------------------

    std::set<SceneCode> seen_scenes;
    for (const auto& scene_code : scene_codes)
    {
        if (!seen_scenes.insert(scene_code).second)
        {
            continue;
        }
        const TaskChainTemplate& tmpl = m_library->require_template(scene_code);
        result.chain_names.push_back(tmpl.chain_name.empty() ? tmpl.scene_code : tmpl.chain_name);

        for (const auto& task : tmpl.tasks)
        {
            plan.merge(task);
        }
        declared_dependencies.insert(declared_dependencies.end(),
                                     tmpl.dependencies.begin(), tmpl.dependencies.end());
        if (!tmpl.parallel_hints.empty())
        {
            any_template_hints = true;
            declared_hints.insert(declared_hints.end(),
                                  tmpl.parallel_hints.begin(), tmpl.parallel_hints.end());
        }
    }

    // -------------------------------------------------------------------------
    // Requirement-implied tasks
    // -------------------------------------------------------------------------

    for (const auto& req : requirements)
    {
        if (req.task_type.empty())
        {
            continue;
        }

        if (!plan.contains(req.task_type))
        {
            const MetaTaskDefinition* meta = m_library->find_meta_task(req.task_type);
            if (meta == nullptr)
            {
                Violation v;
                v.kind = ViolationKind::UnmappedTaskType;
                v.strict = req.priority == Priority::Critical;
                v.severity = v.strict ? ViolationSeverity::Error : ViolationSeverity::Warning;
                v.subject = req.task_type;
                v.message = "Required task type '" + req.task_type +
                            "' is not defined by any selected chain or meta task";
                result.violations.push_back(std::move(v));
                continue;
            }
            plan.merge(meta->task);
            declared_dependencies.insert(declared_dependencies.end(),
                                         meta->dependencies.begin(), meta->dependencies.end());
        }

        PlannedTask& planned = plan.task(plan.index_of(req.task_type));
        planned.requirement_implied = true;
        planned.capabilities.insert(req.required_capabilities.begin(),
                                    req.required_capabilities.end());
    }

    // -------------------------------------------------------------------------
    // Build the merged graph
    // -------------------------------------------------------------------------

    TaskGraph graph;
    for (TaskIdx t = 0; t < plan.tasks().size(); ++t)
    {
        graph.add_task(t, plan.tasks()[t].definition.code);
    }

    std::set<std::pair<TaskCode, TaskCode>> reported_missing;
    for (const auto& dep : declared_dependencies)
    {
        TaskIdx dependent = plan.index_of(dep.task);
        if (dep.strict)
        {
            plan.task(dependent).has_strict_dependency = true;
        }

        if (plan.contains(dep.depends_on))
        {
            graph.link_tasks(plan.index_of(dep.depends_on), dependent,
                             dep.strict ? DependencyStrength::Strict
                                        : DependencyStrength::Advisory);
            continue;
        }

        if (!reported_missing.insert({dep.task, dep.depends_on}).second)
        {
            continue;
        }
        Violation v;
        v.kind = dep.strict ? ViolationKind::StrictDependency : ViolationKind::AdvisoryDependency;
        v.severity = dep.strict ? ViolationSeverity::Error : ViolationSeverity::Warning;
        v.strict = dep.strict;
        v.subject = dep.task;
        v.message = "Task '" + dep.task + "' depends on '" + dep.depends_on +
                    "', which is not part of the plan";
        result.violations.push_back(std::move(v));
    }

    std::vector<TaskIdx> order = graph.topological_order();
    std::vector<size_t> position(order.size(), 0);
    for (size_t i = 0; i < order.size(); ++i)
    {
        position[order[i]] = i;
    }

    // -------------------------------------------------------------------------
    // Parallel groups
    // -------------------------------------------------------------------------

    std::vector<ParallelGroup> groups;
    std::vector<bool> grouped(order.size(), false);
    auto by_position = [&](TaskIdx a, TaskIdx b) { return position[a] < position[b]; };

    if (any_template_hints)
    {
        for (const auto& hint : declared_hints)
        {
            std::vector<TaskIdx> members;
            for (const auto& code : hint)
            {
                if (!plan.contains(code))
                {
                    continue;
                }
                TaskIdx idx = plan.index_of(code);
                if (!grouped[idx] &&
                    std::find(members.begin(), members.end(), idx) == members.end())
                {
                    members.push_back(idx);
                }
            }
            if (members.size() < 2)
            {
                continue;
            }

            bool conflict = false;
            for (size_t i = 0; i < members.size() && !conflict; ++i)
            {
                for (size_t j = i + 1; j < members.size() && !conflict; ++j)
                {
                    conflict = graph.are_ordered(members[i], members[j]);
                }
            }

            std::sort(members.begin(), members.end(), by_position);
            std::vector<TaskCode> codes;
            for (TaskIdx idx : members)
            {
                codes.push_back(graph.task_code(idx));
            }

            if (conflict)
            {
                Violation v;
                v.kind = ViolationKind::ParallelGroupConflict;
                v.severity = ViolationSeverity::Error;
                v.subject = join_codes(codes);
                v.message = "Declared parallel group {" + v.subject +
                            "} contains a dependency between its members in the merged plan";
                result.violations.push_back(std::move(v));
                continue;
            }

            for (TaskIdx idx : members)
            {
                grouped[idx] = true;
            }
            groups.push_back(ParallelGroup{"", std::move(codes), true});
        }
    }
    else
    {
        // Per phase, in order of first appearance in the sequence
        std::vector<std::string> phases;
        for (TaskIdx idx : order)
        {
            const std::string& phase = plan.tasks()[idx].definition.phase;
            if (!phase.empty() && std::find(phases.begin(), phases.end(), phase) == phases.end())
            {
                phases.push_back(phase);
            }
        }

        for (const auto& phase : phases)
        {
            std::vector<TaskIdx> members;
            for (TaskIdx idx : order)
            {
                if (plan.tasks()[idx].definition.phase != phase)
                {
                    continue;
                }
                bool independent = std::none_of(
                    members.begin(), members.end(),
                    [&](TaskIdx m) { return graph.are_ordered(m, idx); });
                if (independent)
                {
                    members.push_back(idx);
                }
            }
            if (members.size() < 2)
            {
                continue;
            }
            std::vector<TaskCode> codes;
            for (TaskIdx idx : members)
            {
                grouped[idx] = true;
                codes.push_back(graph.task_code(idx));
            }
            groups.push_back(ParallelGroup{"", std::move(codes), false});
        }
    }

    std::stable_sort(groups.begin(), groups.end(),
                     [&](const ParallelGroup& a, const ParallelGroup& b) {
                         return position[plan.index_of(a.tasks.front())] <
                                position[plan.index_of(b.tasks.front())];
                     });

    std::map<TaskCode, std::string> group_of;
    for (size_t g = 0; g < groups.size(); ++g)
    {
        groups[g].group_id = group_id(g + 1);
        for (const auto& code : groups[g].tasks)
        {
            group_of[code] = groups[g].group_id;
        }
    }

    // -------------------------------------------------------------------------
    // Sequence
    // -------------------------------------------------------------------------

    for (size_t i = 0; i < order.size(); ++i)
    {
        TaskIdx idx = order[i];
        const PlannedTask& planned = plan.tasks()[idx];

        TaskNode node;
        node.task_code = planned.definition.code;
        node.name = planned.definition.name.empty() ? planned.definition.code
                                                    : planned.definition.name;
        node.phase = planned.definition.phase;
        for (TaskIdx pred : graph.predecessors(idx))
        {
            node.depends_on.insert(graph.task_code(pred));
        }
        node.is_strict_dependency = planned.has_strict_dependency;
        node.golden_hour_minutes = planned.definition.golden_hour_minutes;
        node.required_capabilities = planned.capabilities;
        node.sequence = i + 1;
        auto g = group_of.find(node.task_code);
        if (g != group_of.end())
        {
            node.parallel_group_id = g->second;
        }
        node.requirement_implied = planned.requirement_implied;
        result.sequence.push_back(std::move(node));
    }

    result.parallel_groups = std::move(groups);

    log(LogLevel::Info,
        "Decomposed " + std::to_string(scene_codes.size()) + " scene codes into " +
            std::to_string(result.sequence.size()) + " tasks, " +
            std::to_string(result.parallel_groups.size()) + " parallel groups, " +
            std::to_string(result.violations.size()) + " violations");
    return result;
}

} // namespace resq
