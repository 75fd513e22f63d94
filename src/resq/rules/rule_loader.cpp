/**
 * @file rule_loader.cpp
 */
#include "resq/rules/rule_loader.hpp"
#include "resq/common/errors.hpp"

namespace resq
{

namespace
{

std::vector<std::string> read_string_list(const JsonValue& v, const std::string& context)
{
    std::vector<std::string> out;
    const auto& items = v.as_array(context);
    for (size_t i = 0; i < items.size(); ++i)
    {
        out.push_back(items[i].as_string(context + "[" + std::to_string(i) + "]"));
    }
    return out;
}

FieldValue read_field_value(const JsonValue& v, const std::string& context)
{
    switch (v.kind)
    {
    case JsonValue::Kind::Bool:
        return FieldValue{v.bool_value};
    case JsonValue::Kind::Number:
        return FieldValue{v.number_value};
    case JsonValue::Kind::String:
        return FieldValue{v.string_value};
    case JsonValue::Kind::Array:
        return FieldValue{read_string_list(v, context)};
    default:
        throw ConfigError(context + ": value must be a bool, number, string or string list");
    }
}

Condition read_condition(const JsonValue& v, const std::string& context);

Condition read_group(const JsonValue& v, const std::string& context)
{
    v.expect_only_keys({"logic", "conditions"}, context);

    std::string logic = "AND";
    if (const auto* f = v.find("logic"))
    {
        logic = f->as_string(context + ".logic");
    }

    std::vector<Condition> children;
    const auto& items = v.at("conditions", context).as_array(context + ".conditions");
    for (size_t i = 0; i < items.size(); ++i)
    {
        children.push_back(
            read_condition(items[i], context + ".conditions[" + std::to_string(i) + "]"));
    }

    if (logic == "AND")
    {
        return Condition{AllOf{std::move(children)}};
    }
    if (logic == "OR")
    {
        return Condition{AnyOf{std::move(children)}};
    }
    throw ConfigError(context + ".logic: expected AND or OR, got '" + logic + "'");
}

Condition read_condition(const JsonValue& v, const std::string& context)
{
    if (v.find("conditions") != nullptr)
    {
        return read_group(v, context);
    }

    v.expect_only_keys({"field", "operator", "value"}, context);
    std::string field = v.at("field", context).as_string(context + ".field");
    std::string op = v.at("operator", context).as_string(context + ".operator");
    FieldValue value = read_field_value(v.at("value", context), context + ".value");
    try
    {
        return Condition{make_comparison(field, parse_comparison_operator(op), std::move(value))};
    }
    catch (const InvalidInputError& e)
    {
        throw ConfigError(context + ": " + e.what());
    }
}

RuleAction read_actions(const JsonValue& v, const std::string& context)
{
    v.expect_only_keys(
        {"task_types", "required_capabilities", "resource_types", "grouping_pattern",
         "tactical_notes"},
        context);

    RuleAction actions;
    if (const auto* f = v.find("task_types"))
    {
        actions.task_types = read_string_list(*f, context + ".task_types");
    }
    if (const auto* f = v.find("required_capabilities"))
    {
        const auto& items = f->as_array(context + ".required_capabilities");
        for (size_t i = 0; i < items.size(); ++i)
        {
            std::string item_ctx = context + ".required_capabilities[" + std::to_string(i) + "]";
            items[i].expect_only_keys({"code", "priority", "min_quantity"}, item_ctx);

            CapabilityNeed need;
            need.code = items[i].at("code", item_ctx).as_string(item_ctx + ".code");
            if (const auto* p = items[i].find("priority"))
            {
                need.priority = parse_priority(p->as_string(item_ctx + ".priority"));
            }
            if (const auto* q = items[i].find("min_quantity"))
            {
                need.min_quantity = q->as_int(item_ctx + ".min_quantity");
            }
            actions.required_capabilities.push_back(std::move(need));
        }
    }
    if (const auto* f = v.find("resource_types"))
    {
        actions.resource_types = read_string_list(*f, context + ".resource_types");
    }
    if (const auto* f = v.find("grouping_pattern"))
    {
        actions.grouping_pattern = f->as_string(context + ".grouping_pattern");
    }
    if (const auto* f = v.find("tactical_notes"))
    {
        actions.tactical_notes = f->as_string(context + ".tactical_notes");
    }
    return actions;
}

TriggerRule read_trigger_rule(const JsonValue& v, const std::string& context)
{
    v.expect_only_keys(
        {"id", "name", "description", "trigger", "actions", "priority", "weight"}, context);

    TriggerRule rule;
    rule.id = v.at("id", context).as_string(context + ".id");
    std::string rule_ctx = "rule '" + rule.id + "'";
    if (const auto* f = v.find("name"))
        rule.name = f->as_string(rule_ctx + ".name");
    if (const auto* f = v.find("description"))
        rule.description = f->as_string(rule_ctx + ".description");
    rule.condition = read_group(v.at("trigger", rule_ctx), rule_ctx + ".trigger");
    rule.actions = read_actions(v.at("actions", rule_ctx), rule_ctx + ".actions");
    if (const auto* f = v.find("priority"))
        rule.priority = parse_priority(f->as_string(rule_ctx + ".priority"));
    if (const auto* f = v.find("weight"))
        rule.weight = f->as_number(rule_ctx + ".weight");
    return rule;
}

HardRule read_hard_rule(const JsonValue& v, const std::string& context)
{
    v.expect_only_keys(
        {"id", "name", "check", "condition", "action", "message", "severity"}, context);

    HardRule rule;
    rule.id = v.at("id", context).as_string(context + ".id");
    std::string rule_ctx = "hard rule '" + rule.id + "'";
    if (const auto* f = v.find("name"))
        rule.name = f->as_string(rule_ctx + ".name");

    const JsonValue& check = v.at("check", rule_ctx);
    std::string check_ctx = rule_ctx + ".check";
    check.expect_only_keys({"field", "operator", "threshold", "threshold_field"}, check_ctx);
    rule.check.field = check.at("field", check_ctx).as_string(check_ctx + ".field");
    rule.check.op =
        parse_comparison_operator(check.at("operator", check_ctx).as_string(check_ctx + ".operator"));
    if (const auto* f = check.find("threshold"))
        rule.check.threshold = f->as_number(check_ctx + ".threshold");
    if (const auto* f = check.find("threshold_field"))
        rule.check.threshold_field = f->as_string(check_ctx + ".threshold_field");

    if (const auto* cond = v.find("condition"))
    {
        std::string cond_ctx = rule_ctx + ".condition";
        cond->expect_only_keys({"field", "operator", "value"}, cond_ctx);
        MetricPrecondition pre;
        pre.field = cond->at("field", cond_ctx).as_string(cond_ctx + ".field");
        pre.op = parse_comparison_operator(
            cond->at("operator", cond_ctx).as_string(cond_ctx + ".operator"));
        pre.value = cond->at("value", cond_ctx).as_number(cond_ctx + ".value");
        rule.precondition = pre;
    }

    std::string action = v.at("action", rule_ctx).as_string(rule_ctx + ".action");
    if (action == "reject")
        rule.action = HardRuleAction::Reject;
    else if (action == "warn")
        rule.action = HardRuleAction::Warn;
    else
        throw ConfigError(rule_ctx + ".action: expected reject or warn, got '" + action + "'");

    if (const auto* f = v.find("message"))
        rule.message_template = f->as_string(rule_ctx + ".message");

    if (const auto* f = v.find("severity"))
    {
        std::string severity = f->as_string(rule_ctx + ".severity");
        if (severity == "critical")
            rule.severity = HardRuleSeverity::Critical;
        else if (severity == "high")
            rule.severity = HardRuleSeverity::High;
        else if (severity == "medium")
            rule.severity = HardRuleSeverity::Medium;
        else
            throw ConfigError(rule_ctx + ".severity: unknown severity '" + severity + "'");
    }
    return rule;
}

} // namespace

std::vector<TriggerRule> load_trigger_rules(const JsonValue& doc)
{
    std::vector<TriggerRule> rules;
    try
    {
        const auto& items = doc.at("rules", "rule source").as_array("rules");
        for (size_t i = 0; i < items.size(); ++i)
        {
            rules.push_back(read_trigger_rule(items[i], "rules[" + std::to_string(i) + "]"));
        }
    }
    catch (const ResqError& e)
    {
        if (e.code() == ErrorCode::RuleLoad)
        {
            throw;
        }
        throw RuleLoadError(e.what());
    }
    if (rules.empty())
    {
        throw RuleLoadError("Rule source contains no rules");
    }
    return rules;
}

std::vector<TriggerRule> load_trigger_rules_file(const std::string& path)
{
    try
    {
        return load_trigger_rules(json_parse_file(path));
    }
    catch (const ConfigError& e)
    {
        throw RuleLoadError(e.what());
    }
    catch (const RuleLoadError& e)
    {
        throw RuleLoadError(path + ": " + e.what());
    }
}

std::vector<HardRule> load_hard_rules(const JsonValue& doc)
{
    std::vector<HardRule> rules;
    try
    {
        const auto& items = doc.at("hard_rules", "hard rule source").as_array("hard_rules");
        for (size_t i = 0; i < items.size(); ++i)
        {
            rules.push_back(read_hard_rule(items[i], "hard_rules[" + std::to_string(i) + "]"));
        }
    }
    catch (const ResqError& e)
    {
        if (e.code() == ErrorCode::RuleLoad)
        {
            throw;
        }
        throw RuleLoadError(e.what());
    }
    if (rules.empty())
    {
        throw RuleLoadError("Hard rule source contains no rules");
    }

    std::set<std::string> seen;
    for (const auto& rule : rules)
    {
        validate_hard_rule(rule);
        if (!seen.insert(rule.id).second)
        {
            throw RuleLoadError("Duplicate hard rule id '" + rule.id + "'");
        }
    }
    return rules;
}

std::vector<HardRule> load_hard_rules_file(const std::string& path)
{
    try
    {
        return load_hard_rules(json_parse_file(path));
    }
    catch (const ConfigError& e)
    {
        throw RuleLoadError(e.what());
    }
    catch (const RuleLoadError& e)
    {
        throw RuleLoadError(path + ": " + e.what());
    }
}

} // namespace resq
