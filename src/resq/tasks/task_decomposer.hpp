/**
 * @file task_decomposer.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"
#include "resq/tasks/task_template.hpp"

namespace resq
{

/**
 * @brief One task of a decomposed plan.
 *
 * @details
 * `depends_on` lists the direct dependencies present in the plan.
 * `is_strict_dependency` is true when at least one of the task's declared
 * dependencies is strict. Nodes are created per run and never mutated after
 * decomposition.
 */
struct TaskNode
{
    TaskCode task_code;
    std::string name;
    std::string phase;
    std::set<TaskCode> depends_on;
    bool is_strict_dependency{false};
    std::optional<int> golden_hour_minutes;
    std::set<CapabilityCode> required_capabilities;

    /// 1-based position in the sequence.
    size_t sequence{0};

    /// Id of the parallel group the task belongs to, empty if none.
    std::string parallel_group_id;

    /// True when a requirement named this task type.
    bool requirement_implied{false};
};

/**
 * @brief A set of tasks that may run concurrently.
 */
struct ParallelGroup
{
    std::string group_id;

    /// Members in sequence order.
    std::vector<TaskCode> tasks;

    /// True when the group came from a template hint rather than phase analysis.
    bool declared{true};
};

struct DecompositionResult
{
    std::vector<TaskNode> sequence;
    std::vector<ParallelGroup> parallel_groups;
    std::vector<Violation> violations;

    /// Names of the chains that were merged, in scene-code order.
    std::vector<std::string> chain_names;

    /// Smallest golden hour across the plan, if any task declares one.
    std::optional<int> earliest_golden_hour() const;

    /// Union of capabilities required by the plan's tasks.
    std::set<CapabilityCode> required_capabilities() const;

    bool has_strict_violations() const;
};

/**
 * @brief Expands requirements and scene codes into an ordered task plan.
 *
 * @details
 * 1. Each scene code selects its chain template; the chains' task sets are
 *    unioned and their dependency maps merged edge by edge.
 * 2. Requirement task types outside the selected chains are pulled in from
 *    the library's meta tasks (with their own dependencies). Task types the
 *    library does not know become `UnmappedTaskType` violations.
 * 3. Dependencies whose target is not in the plan become `StrictDependency`
 *    errors or `AdvisoryDependency` warnings.
 * 4. The merged graph is sorted with Kahn's algorithm; ties keep template
 *    insertion order. A cycle throws `CyclicDependencyError`.
 * 5. Parallel groups come from template hints, or per phase when no selected
 *    template declares hints. A declared group whose members are ordered in
 *    the merged graph is dropped with a `ParallelGroupConflict` error.
 *
 * Decomposition is deterministic: identical inputs give identical output.
 *
 * @par Thread safety
 * - `decompose()` is const and safe to call concurrently.
 */
class TaskDecomposer
{
public:
    explicit TaskDecomposer(std::shared_ptr<const TaskTemplateLibrary> library);

    /**
     * @throw TemplateError if a scene code has no template.
     * @throw CyclicDependencyError if the merged graph has a cycle.
     */
    DecompositionResult decompose(
        const std::vector<Requirement>& requirements,
        const std::vector<SceneCode>& scene_codes) const;

private:
    std::shared_ptr<const TaskTemplateLibrary> m_library;
};

} // namespace resq
