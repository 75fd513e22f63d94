/**
 * @file task_template.cpp
 */
#include "resq/tasks/task_template.hpp"
#include "resq/common/errors.hpp"
#include "resq/tasks/task_graph.hpp"

namespace resq
{

// ============================================================================
// Validation
// ============================================================================

namespace
{

void validate_template(const TaskChainTemplate& tmpl)
{
    const std::string ctx = "template '" + tmpl.scene_code + "'";
    if (tmpl.scene_code.empty())
    {
        throw TemplateError("Template with empty scene code");
    }

    std::map<TaskCode, TaskIdx> index;
    TaskGraph graph;
    for (const auto& task : tmpl.tasks)
    {
        if (task.code.empty())
        {
            throw TemplateError(ctx + " declares a task with an empty code");
        }
        if (index.count(task.code) > 0)
        {
            throw TemplateError(ctx + " declares task '" + task.code + "' twice");
        }
        if (task.golden_hour_minutes && *task.golden_hour_minutes <= 0)
        {
            throw TemplateError(
                ctx + " task '" + task.code + "' has a non-positive golden hour");
        }
        TaskIdx idx = graph.task_count();
        graph.add_task(idx, task.code);
        index.emplace(task.code, idx);
    }

    for (const auto& dep : tmpl.dependencies)
    {
        auto task_it = index.find(dep.task);
        if (task_it == index.end())
        {
            throw TemplateError(
                ctx + " declares a dependency for unknown task '" + dep.task + "'");
        }
        auto dep_it = index.find(dep.depends_on);
        if (dep_it == index.end())
        {
            continue; // resolved against the merged graph
        }
        if (dep_it->second == task_it->second)
        {
            throw TemplateError(ctx + " task '" + dep.task + "' depends on itself");
        }
        graph.link_tasks(dep_it->second, task_it->second,
                         dep.strict ? DependencyStrength::Strict : DependencyStrength::Advisory);
    }

    for (size_t h = 0; h < tmpl.parallel_hints.size(); ++h)
    {
        const auto& hint = tmpl.parallel_hints[h];
        std::vector<TaskIdx> members;
        for (const auto& code : hint)
        {
            auto it = index.find(code);
            if (it == index.end())
            {
                throw TemplateError(
                    ctx + " parallel hint " + std::to_string(h) + " names unknown task '" +
                    code + "'");
            }
            members.push_back(it->second);
        }
        for (size_t i = 0; i < members.size(); ++i)
        {
            for (size_t j = i + 1; j < members.size(); ++j)
            {
                if (members[i] == members[j] || graph.are_ordered(members[i], members[j]))
                {
                    throw TemplateError(
                        ctx + " parallel hint " + std::to_string(h) + " contains dependent tasks '" +
                        graph.task_code(members[i]) + "' and '" + graph.task_code(members[j]) + "'");
                }
            }
        }
    }
}

} // namespace

// ============================================================================
// TaskTemplateLibrary
// ============================================================================

TaskTemplateLibrary::TaskTemplateLibrary(
    std::vector<TaskChainTemplate> templates,
    std::vector<MetaTaskDefinition> meta_tasks)
    : m_templates(std::move(templates))
    , m_meta_tasks(std::move(meta_tasks))
{
    if (m_templates.empty())
    {
        throw TemplateError("Task template library is empty");
    }

    for (size_t i = 0; i < m_templates.size(); ++i)
    {
        validate_template(m_templates[i]);
        if (!m_template_index.emplace(m_templates[i].scene_code, i).second)
        {
            throw TemplateError(
                "Duplicate template for scene code '" + m_templates[i].scene_code + "'");
        }
    }

    for (size_t i = 0; i < m_meta_tasks.size(); ++i)
    {
        const MetaTaskDefinition& meta = m_meta_tasks[i];
        if (meta.task.code.empty())
        {
            throw TemplateError("Meta task with an empty code");
        }
        for (const auto& dep : meta.dependencies)
        {
            if (dep.task != meta.task.code)
            {
                throw TemplateError(
                    "Meta task '" + meta.task.code + "' declares a dependency for '" + dep.task +
                    "'");
            }
            if (dep.depends_on == meta.task.code)
            {
                throw TemplateError("Meta task '" + meta.task.code + "' depends on itself");
            }
        }
        if (!m_meta_index.emplace(meta.task.code, i).second)
        {
            throw TemplateError("Duplicate meta task '" + meta.task.code + "'");
        }
    }
}

size_t TaskTemplateLibrary::template_count() const noexcept
{
    return m_templates.size();
}

const TaskChainTemplate* TaskTemplateLibrary::find_template(const SceneCode& scene_code) const
{
    auto it = m_template_index.find(scene_code);
    return it == m_template_index.end() ? nullptr : &m_templates[it->second];
}

const MetaTaskDefinition* TaskTemplateLibrary::find_meta_task(const TaskCode& code) const
{
    auto it = m_meta_index.find(code);
    return it == m_meta_index.end() ? nullptr : &m_meta_tasks[it->second];
}

const TaskChainTemplate& TaskTemplateLibrary::require_template(const SceneCode& scene_code) const
{
    const TaskChainTemplate* tmpl = find_template(scene_code);
    if (tmpl == nullptr)
    {
        throw TemplateError("No task template for scene code '" + scene_code + "'");
    }
    return *tmpl;
}

// ============================================================================
// JSON loading
// ============================================================================

namespace
{

std::vector<std::string> read_codes(const JsonValue& v, const std::string& context)
{
    std::vector<std::string> out;
    const auto& items = v.as_array(context);
    for (size_t i = 0; i < items.size(); ++i)
    {
        out.push_back(items[i].as_string(context + "[" + std::to_string(i) + "]"));
    }
    return out;
}

TaskDefinition read_task(const JsonValue& v, const std::string& context, bool allow_depends_on)
{
    std::set<std::string> keys = {"code", "name", "phase", "golden_hour_minutes",
                                  "required_capabilities"};
    if (allow_depends_on)
    {
        keys.insert("depends_on");
    }
    v.expect_only_keys(keys, context);

    TaskDefinition task;
    task.code = v.at("code", context).as_string(context + ".code");
    if (const auto* f = v.find("name"))
        task.name = f->as_string(context + ".name");
    if (task.name.empty())
        task.name = task.code;
    if (const auto* f = v.find("phase"))
        task.phase = f->as_string(context + ".phase");
    if (const auto* f = v.find("golden_hour_minutes"))
        task.golden_hour_minutes = f->as_int(context + ".golden_hour_minutes");
    if (const auto* f = v.find("required_capabilities"))
        task.required_capabilities = read_codes(*f, context + ".required_capabilities");
    return task;
}

TaskChainTemplate read_template(const JsonValue& v, const std::string& context)
{
    v.expect_only_keys(
        {"scene_code", "chain_name", "tasks", "dependencies", "parallel_hints"}, context);

    TaskChainTemplate tmpl;
    tmpl.scene_code = v.at("scene_code", context).as_string(context + ".scene_code");
    const std::string ctx = "template '" + tmpl.scene_code + "'";
    if (const auto* f = v.find("chain_name"))
        tmpl.chain_name = f->as_string(ctx + ".chain_name");

    const auto& tasks = v.at("tasks", ctx).as_array(ctx + ".tasks");
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        tmpl.tasks.push_back(
            read_task(tasks[i], ctx + ".tasks[" + std::to_string(i) + "]", false));
    }

    if (const auto* deps = v.find("dependencies"))
    {
        const auto& items = deps->as_array(ctx + ".dependencies");
        for (size_t i = 0; i < items.size(); ++i)
        {
            std::string dctx = ctx + ".dependencies[" + std::to_string(i) + "]";
            items[i].expect_only_keys({"task", "depends_on", "strict"}, dctx);
            DependencyDeclaration dep;
            dep.task = items[i].at("task", dctx).as_string(dctx + ".task");
            dep.depends_on = items[i].at("depends_on", dctx).as_string(dctx + ".depends_on");
            if (const auto* s = items[i].find("strict"))
                dep.strict = s->as_bool(dctx + ".strict");
            tmpl.dependencies.push_back(std::move(dep));
        }
    }

    if (const auto* hints = v.find("parallel_hints"))
    {
        const auto& items = hints->as_array(ctx + ".parallel_hints");
        for (size_t i = 0; i < items.size(); ++i)
        {
            tmpl.parallel_hints.push_back(
                read_codes(items[i], ctx + ".parallel_hints[" + std::to_string(i) + "]"));
        }
    }
    return tmpl;
}

MetaTaskDefinition read_meta_task(const JsonValue& v, const std::string& context)
{
    MetaTaskDefinition meta;
    meta.task = read_task(v, context, true);
    if (const auto* deps = v.find("depends_on"))
    {
        const auto& items = deps->as_array(context + ".depends_on");
        for (size_t i = 0; i < items.size(); ++i)
        {
            std::string dctx = context + ".depends_on[" + std::to_string(i) + "]";
            items[i].expect_only_keys({"task", "strict"}, dctx);
            DependencyDeclaration dep;
            dep.task = meta.task.code;
            dep.depends_on = items[i].at("task", dctx).as_string(dctx + ".task");
            if (const auto* s = items[i].find("strict"))
                dep.strict = s->as_bool(dctx + ".strict");
            meta.dependencies.push_back(std::move(dep));
        }
    }
    return meta;
}

} // namespace

TaskTemplateLibrary load_task_templates(const JsonValue& doc)
{
    std::vector<TaskChainTemplate> templates;
    std::vector<MetaTaskDefinition> meta_tasks;
    try
    {
        doc.expect_only_keys({"templates", "meta_tasks"}, "template library");
        const auto& items = doc.at("templates", "template library").as_array("templates");
        for (size_t i = 0; i < items.size(); ++i)
        {
            templates.push_back(read_template(items[i], "templates[" + std::to_string(i) + "]"));
        }
        if (const auto* metas = doc.find("meta_tasks"))
        {
            const auto& list = metas->as_array("meta_tasks");
            for (size_t i = 0; i < list.size(); ++i)
            {
                meta_tasks.push_back(
                    read_meta_task(list[i], "meta_tasks[" + std::to_string(i) + "]"));
            }
        }
    }
    catch (const ConfigError& e)
    {
        throw TemplateError(e.what());
    }
    return TaskTemplateLibrary(std::move(templates), std::move(meta_tasks));
}

TaskTemplateLibrary load_task_templates_file(const std::string& path)
{
    try
    {
        return load_task_templates(json_parse_file(path));
    }
    catch (const ConfigError& e)
    {
        throw TemplateError(e.what());
    }
    catch (const TemplateError& e)
    {
        throw TemplateError(path + ": " + e.what());
    }
}

} // namespace resq
