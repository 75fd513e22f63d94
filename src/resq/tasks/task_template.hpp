/**
 * @file task_template.hpp
 * @brief Scene-code keyed task-chain templates.
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"
#include "resq/common/json_value.hpp"

namespace resq
{

struct TaskDefinition
{
    TaskCode code;
    std::string name;
    std::string phase;
    std::optional<int> golden_hour_minutes;
    std::vector<CapabilityCode> required_capabilities;
};

/**
 * @brief `task` depends on `depends_on`.
 */
struct DependencyDeclaration
{
    TaskCode task;
    TaskCode depends_on;
    bool strict{true};
};

/**
 * @brief The named task chain for one scene code.
 */
struct TaskChainTemplate
{
    SceneCode scene_code;
    std::string chain_name;

    /// Tasks in declaration order; this order breaks ordering ties.
    std::vector<TaskDefinition> tasks;

    std::vector<DependencyDeclaration> dependencies;

    /// Declared sets of tasks that may run concurrently.
    std::vector<std::vector<TaskCode>> parallel_hints;
};

/**
 * @brief A task that requirements may call for outside any selected chain.
 */
struct MetaTaskDefinition
{
    TaskDefinition task;
    std::vector<DependencyDeclaration> dependencies;
};

/**
 * @brief Immutable library of task-chain templates.
 *
 * @details
 * Every template is validated at construction:
 * - task codes are unique within the template;
 * - every dependency's dependent task belongs to the template (its target may
 *   lie outside and is resolved after chains are merged);
 * - every parallel-hint member belongs to the template;
 * - no two members of a hint are ordered by the template's own dependencies.
 * Cycles are not rejected here; they surface as `CyclicDependencyError` when
 * the merged graph is sorted.
 *
 * @par Thread safety
 * - Immutable after construction; safe to share across runs.
 */
class TaskTemplateLibrary
{
public:
    /// @throw TemplateError on any validation failure.
    TaskTemplateLibrary(
        std::vector<TaskChainTemplate> templates,
        std::vector<MetaTaskDefinition> meta_tasks = {});

    size_t template_count() const noexcept;

    /// @return The template for `scene_code`, or nullptr.
    const TaskChainTemplate* find_template(const SceneCode& scene_code) const;

    /// @return The meta task for `code`, or nullptr.
    const MetaTaskDefinition* find_meta_task(const TaskCode& code) const;

    /**
     * @brief Template the scene code, or throw.
     * @throw TemplateError if no template is registered for `scene_code`.
     */
    const TaskChainTemplate& require_template(const SceneCode& scene_code) const;

private:
    std::vector<TaskChainTemplate> m_templates;
    std::map<SceneCode, size_t> m_template_index;
    std::vector<MetaTaskDefinition> m_meta_tasks;
    std::map<TaskCode, size_t> m_meta_index;
};

/**
 * @brief Read a template library from JSON.
 *
 * @details
 * @code
 * {
 *   "templates": [{
 *     "scene_code": "S-EQ-COLLAPSE", "chain_name": "...",
 *     "tasks": [{"code": "...", "name": "...", "phase": "...",
 *                "golden_hour_minutes": 60, "required_capabilities": [...]}],
 *     "dependencies": [{"task": "...", "depends_on": "...", "strict": true}],
 *     "parallel_hints": [["...", "..."]]
 *   }],
 *   "meta_tasks": [{"code": "...", "name": "...", "phase": "...",
 *                   "depends_on": [{"task": "...", "strict": false}]}]
 * }
 * @endcode
 *
 * @throw TemplateError on any structural or validation problem.
 */
TaskTemplateLibrary load_task_templates(const JsonValue& doc);

/// @throw TemplateError if the file is unreadable or invalid.
TaskTemplateLibrary load_task_templates_file(const std::string& path);

} // namespace resq
