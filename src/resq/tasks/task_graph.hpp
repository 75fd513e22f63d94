/**
 * @file task_graph.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"

namespace resq
{

/**
 * @brief Type alias for task indices.
 *
 * @details
 * `TaskIdx` is a type alias for `size_t` used to identify tasks in a
 * `TaskGraph`. It exists for clarity in API signatures, not for compile-time
 * type safety.
 */
using TaskIdx = size_t;

/**
 * @brief Strength of a dependency edge.
 *
 * @par Blame priority
 * When a cycle is detected, advisory edges are blamed before strict ones:
 * a strict edge encodes an operational necessity (no search before the
 * structure is shored up), an advisory edge only a preferred order.
 */
enum class DependencyStrength
{
    Advisory,
    Strict
};

/**
 * @brief A dependency edge: `before` must run ahead of `after`.
 */
struct TaskLink
{
    TaskIdx before;
    TaskIdx after;
    DependencyStrength strength;
};

// ============================================================================
// Diagnostics
// ============================================================================

enum class TaskDiagnosticCategory
{
    Cycle,        ///< A cycle was detected in the dependency edges.
    IsolatedTask  ///< A task has no incoming or outgoing edge.
};

/**
 * @brief One finding from `TaskGraph::get_diagnostics()`.
 */
struct TaskDiagnosticItem
{
    ViolationSeverity severity;
    TaskDiagnosticCategory category;
    std::string message;

    /// Tasks involved in this issue.
    std::vector<TaskIdx> involved_tasks;

    /// Indices into `TaskGraph::links()`, advisory edges first.
    std::vector<size_t> blamed_links;
};

/**
 * @brief Errors and warnings collected from a `TaskGraph`.
 *
 * @par Thread safety
 * - Immutable once returned; concurrent reads are safe.
 */
class TaskGraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<TaskDiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<TaskDiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

private:
    friend class TaskGraph;

    std::vector<TaskDiagnosticItem> m_errors;
    std::vector<TaskDiagnosticItem> m_warnings;
};

// ============================================================================
// TaskGraph
// ============================================================================

/**
 * @brief Index-based dependency graph over the tasks of one decomposition.
 *
 * @details
 * Tasks are added sequentially from index 0 with a code used in error
 * messages. Links are directed dependency edges. Linking the same pair twice
 * keeps a single edge whose strength is the stronger of the two, so merging
 * dependency maps never drops an edge.
 *
 * @par Validation
 * With eager validation, `link_tasks()` rejects an edge that would close a
 * cycle. With lazy validation (the default, used when merging templates), the
 * cycle surfaces from `get_diagnostics()` or `topological_order()`.
 *
 * @par Ordering
 * `topological_order()` runs Kahn's algorithm with a min-heap on task index,
 * so among ready tasks the one added first always comes first.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class TaskGraph
{
public:
    /**
     * @param eager_validation If true, `link_tasks()` throws on an edge that
     *        would create a cycle.
     */
    explicit TaskGraph(bool eager_validation = false);

    size_t task_count() const noexcept;

    /**
     * @brief Add a task.
     * @param task_idx Must equal the current `task_count()`.
     * @param code Task code used in diagnostics and errors.
     * @throw InvalidInputError if `task_idx` is out of sequence.
     */
    void add_task(TaskIdx task_idx, TaskCode code);

    const TaskCode& task_code(TaskIdx task_idx) const;

    /**
     * @brief Declare that `before` must run ahead of `after`.
     * @throw InvalidInputError if either index does not exist.
     * @throw CyclicDependencyError on a self-link, or on an edge closing a
     *        cycle when eager validation is enabled.
     */
    void link_tasks(TaskIdx before, TaskIdx after, DependencyStrength strength);

    const std::vector<TaskLink>& links() const noexcept;

    /// Direct predecessors of `task_idx`, in link order.
    const std::vector<TaskIdx>& predecessors(TaskIdx task_idx) const;

    /// Direct successors of `task_idx`, in link order.
    const std::vector<TaskIdx>& successors(TaskIdx task_idx) const;

    /// Strength of the edge before -> after, if present.
    std::optional<DependencyStrength> link_strength(TaskIdx before, TaskIdx after) const;

    /**
     * @brief Check whether `target` can be reached from `from` along edges.
     * @details A task reaches itself.
     */
    bool is_reachable_from(TaskIdx from, TaskIdx target) const;

    /// True if either task reaches the other.
    bool are_ordered(TaskIdx a, TaskIdx b) const;

    std::shared_ptr<TaskGraphDiagnostics> get_diagnostics() const;

    /**
     * @brief Topologically sorted task indices.
     * @throw CyclicDependencyError naming the tasks left in a cycle.
     */
    std::vector<TaskIdx> topological_order() const;

private:
    /// Run Kahn's algorithm; returns the processed order and leaves the
    /// residual in-degrees in `in_degree`.
    std::vector<TaskIdx> run_kahn(std::vector<size_t>& in_degree) const;

    void add_link_blame(TaskDiagnosticItem& item) const;

    bool m_eager_validation;

    std::vector<TaskCode> m_task_codes;

    std::vector<TaskLink> m_links;
    std::map<std::pair<TaskIdx, TaskIdx>, size_t> m_link_index;

    std::vector<std::vector<TaskIdx>> m_predecessors;
    std::vector<std::vector<TaskIdx>> m_successors;
};

} // namespace resq
