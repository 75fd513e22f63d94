/**
 * @file task_graph.cpp
 */
#include "resq/tasks/task_graph.hpp"
#include "resq/common/errors.hpp"

#include <queue>
#include <unordered_set>

namespace resq
{

// ============================================================================
// Construction and queries
// ============================================================================

TaskGraph::TaskGraph(bool eager_validation)
    : m_eager_validation(eager_validation)
{
}

size_t TaskGraph::task_count() const noexcept
{
    return m_task_codes.size();
}

void TaskGraph::add_task(TaskIdx task_idx, TaskCode code)
{
    if (task_idx != m_task_codes.size())
    {
        throw InvalidInputError(
            "Task index " + std::to_string(task_idx) + " is out of sequence; expected " +
            std::to_string(m_task_codes.size()));
    }
    m_task_codes.push_back(std::move(code));
    m_predecessors.emplace_back();
    m_successors.emplace_back();
}

const TaskCode& TaskGraph::task_code(TaskIdx task_idx) const
{
    if (task_idx >= m_task_codes.size())
    {
        throw InvalidInputError("Task index " + std::to_string(task_idx) + " does not exist");
    }
    return m_task_codes[task_idx];
}

const std::vector<TaskLink>& TaskGraph::links() const noexcept
{
    return m_links;
}

const std::vector<TaskIdx>& TaskGraph::predecessors(TaskIdx task_idx) const
{
    task_code(task_idx);
    return m_predecessors[task_idx];
}

const std::vector<TaskIdx>& TaskGraph::successors(TaskIdx task_idx) const
{
    task_code(task_idx);
    return m_successors[task_idx];
}

std::optional<DependencyStrength> TaskGraph::link_strength(TaskIdx before, TaskIdx after) const
{
    auto it = m_link_index.find({before, after});
    if (it == m_link_index.end())
    {
        return std::nullopt;
    }
    return m_links[it->second].strength;
}

// ============================================================================
// Linking
// ============================================================================

void TaskGraph::link_tasks(TaskIdx before, TaskIdx after, DependencyStrength strength)
{
    const size_t count = m_task_codes.size();
    if (before >= count)
    {
        throw InvalidInputError(
            "Before task index " + std::to_string(before) + " does not exist");
    }
    if (after >= count)
    {
        throw InvalidInputError(
            "After task index " + std::to_string(after) + " does not exist");
    }

    if (before == after)
    {
        throw CyclicDependencyError(
            "Task '" + m_task_codes[before] + "' cannot depend on itself",
            {m_task_codes[before]},
            {{m_task_codes[before], m_task_codes[before]}});
    }

    // Repeated edge: keep one, upgraded to the stronger strength
    auto existing = m_link_index.find({before, after});
    if (existing != m_link_index.end())
    {
        if (strength == DependencyStrength::Strict)
        {
            m_links[existing->second].strength = DependencyStrength::Strict;
        }
        return;
    }

    // A cycle would exist if `before` is already reachable from `after`
    if (m_eager_validation && is_reachable_from(after, before))
    {
        throw CyclicDependencyError(
            "Adding dependency '" + m_task_codes[before] + "' -> '" + m_task_codes[after] +
                "' would create a cycle",
            {m_task_codes[before], m_task_codes[after]},
            {{m_task_codes[before], m_task_codes[after]}});
    }

    m_link_index.emplace(std::make_pair(before, after), m_links.size());
    m_links.push_back(TaskLink{before, after, strength});
    m_successors[before].push_back(after);
    m_predecessors[after].push_back(before);
}

// ============================================================================
// Reachability
// ============================================================================

bool TaskGraph::is_reachable_from(TaskIdx from, TaskIdx target) const
{
    if (from == target)
    {
        return true;
    }

    // Iterative DFS
    std::vector<bool> visited(m_task_codes.size(), false);
    std::vector<TaskIdx> stack;
    stack.push_back(from);

    while (!stack.empty())
    {
        TaskIdx current = stack.back();
        stack.pop_back();

        if (visited[current])
        {
            continue;
        }
        visited[current] = true;

        for (TaskIdx successor : m_successors[current])
        {
            if (successor == target)
            {
                return true;
            }
            if (!visited[successor])
            {
                stack.push_back(successor);
            }
        }
    }

    return false;
}

bool TaskGraph::are_ordered(TaskIdx a, TaskIdx b) const
{
    return is_reachable_from(a, b) || is_reachable_from(b, a);
}

// ============================================================================
// Kahn's algorithm
// ============================================================================

std::vector<TaskIdx> TaskGraph::run_kahn(std::vector<size_t>& in_degree) const
{
    const size_t count = m_task_codes.size();
    in_degree.assign(count, 0);
    for (const auto& link : m_links)
    {
        ++in_degree[link.after];
    }

    // Min-heap on index: ready tasks leave in insertion order
    std::priority_queue<TaskIdx, std::vector<TaskIdx>, std::greater<TaskIdx>> ready;
    for (TaskIdx t = 0; t < count; ++t)
    {
        if (in_degree[t] == 0)
        {
            ready.push(t);
        }
    }

    std::vector<TaskIdx> order;
    order.reserve(count);
    while (!ready.empty())
    {
        TaskIdx t = ready.top();
        ready.pop();
        order.push_back(t);

        for (TaskIdx succ : m_successors[t])
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }
    return order;
}

void TaskGraph::add_link_blame(TaskDiagnosticItem& item) const
{
    std::unordered_set<TaskIdx> task_set(item.involved_tasks.begin(), item.involved_tasks.end());

    std::vector<std::pair<size_t, DependencyStrength>> blamed_with_strength;
    for (size_t i = 0; i < m_links.size(); ++i)
    {
        // Link is involved if both endpoints are in the cycle
        if (task_set.count(m_links[i].before) > 0 && task_set.count(m_links[i].after) > 0)
        {
            blamed_with_strength.emplace_back(i, m_links[i].strength);
        }
    }

    // Advisory first, then strict; link order within each
    std::stable_sort(blamed_with_strength.begin(), blamed_with_strength.end(),
                     [](const auto& a, const auto& b) {
                         return static_cast<int>(a.second) < static_cast<int>(b.second);
                     });

    for (const auto& [idx, strength] : blamed_with_strength)
    {
        item.blamed_links.push_back(idx);
    }
}

// ============================================================================
// Diagnostics and ordering
// ============================================================================

std::shared_ptr<TaskGraphDiagnostics> TaskGraph::get_diagnostics() const
{
    auto diagnostics = std::make_shared<TaskGraphDiagnostics>();
    const size_t count = m_task_codes.size();

    // Isolated tasks are legitimate (a chain may hold independent tasks) but
    // worth reporting when the graph has edges at all
    if (!m_links.empty())
    {
        for (TaskIdx t = 0; t < count; ++t)
        {
            if (m_predecessors[t].empty() && m_successors[t].empty())
            {
                TaskDiagnosticItem item;
                item.severity = ViolationSeverity::Warning;
                item.category = TaskDiagnosticCategory::IsolatedTask;
                item.message = "Task '" + m_task_codes[t] + "' has no dependencies or dependents";
                item.involved_tasks.push_back(t);
                diagnostics->m_warnings.push_back(std::move(item));
            }
        }
    }

    std::vector<size_t> in_degree;
    std::vector<TaskIdx> order = run_kahn(in_degree);
    if (order.size() < count)
    {
        TaskDiagnosticItem item;
        item.severity = ViolationSeverity::Error;
        item.category = TaskDiagnosticCategory::Cycle;
        item.message = "Cycle detected in task dependencies";
        for (TaskIdx t = 0; t < count; ++t)
        {
            if (in_degree[t] > 0)
            {
                item.involved_tasks.push_back(t);
            }
        }
        add_link_blame(item);
        diagnostics->m_errors.push_back(std::move(item));
    }

    return diagnostics;
}

std::vector<TaskIdx> TaskGraph::topological_order() const
{
    std::vector<size_t> in_degree;
    std::vector<TaskIdx> order = run_kahn(in_degree);
    if (order.size() == m_task_codes.size())
    {
        return order;
    }

    TaskDiagnosticItem item;
    for (TaskIdx t = 0; t < m_task_codes.size(); ++t)
    {
        if (in_degree[t] > 0)
        {
            item.involved_tasks.push_back(t);
        }
    }
    add_link_blame(item);

    std::vector<std::string> involved;
    std::string listing;
    for (TaskIdx t : item.involved_tasks)
    {
        involved.push_back(m_task_codes[t]);
        listing += (listing.empty() ? "" : ", ") + m_task_codes[t];
    }
    std::vector<std::pair<std::string, std::string>> blamed;
    for (size_t link_idx : item.blamed_links)
    {
        const TaskLink& link = m_links[link_idx];
        blamed.emplace_back(m_task_codes[link.before], m_task_codes[link.after]);
    }

    throw CyclicDependencyError(
        "Cyclic task dependencies among: " + listing, std::move(involved), std::move(blamed));
}

} // namespace resq
