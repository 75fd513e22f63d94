/**
 * @file condition.cpp
 */
#include "resq/rules/condition.hpp"
#include "resq/common/errors.hpp"

namespace resq
{

// ============================================================================
// Operators
// ============================================================================

const char* to_string(ComparisonOperator op) noexcept
{
    switch (op)
    {
    case ComparisonOperator::Eq:
        return "eq";
    case ComparisonOperator::Ne:
        return "ne";
    case ComparisonOperator::Gt:
        return "gt";
    case ComparisonOperator::Gte:
        return "gte";
    case ComparisonOperator::Lt:
        return "lt";
    case ComparisonOperator::Lte:
        return "lte";
    case ComparisonOperator::In:
        return "in";
    case ComparisonOperator::NotIn:
        return "not_in";
    case ComparisonOperator::Contains:
        return "contains";
    case ComparisonOperator::Regex:
        return "regex";
    }
    return "eq";
}

ComparisonOperator parse_comparison_operator(const std::string& text)
{
    static const std::map<std::string, ComparisonOperator> table = {
        {"eq", ComparisonOperator::Eq},
        {"ne", ComparisonOperator::Ne},
        {"gt", ComparisonOperator::Gt},
        {"gte", ComparisonOperator::Gte},
        {"lt", ComparisonOperator::Lt},
        {"lte", ComparisonOperator::Lte},
        {"in", ComparisonOperator::In},
        {"not_in", ComparisonOperator::NotIn},
        {"contains", ComparisonOperator::Contains},
        {"regex", ComparisonOperator::Regex},
    };
    auto it = table.find(text);
    if (it == table.end())
    {
        throw InvalidInputError("Unknown comparison operator '" + text + "'");
    }
    return it->second;
}

// ============================================================================
// Comparisons
// ============================================================================

Comparison make_comparison(std::string field, ComparisonOperator op, FieldValue value)
{
    if (field.empty())
    {
        throw InvalidInputError("Comparison field must not be empty");
    }

    Comparison cmp;
    cmp.field = std::move(field);
    cmp.op = op;
    cmp.value = std::move(value);

    switch (op)
    {
    case ComparisonOperator::In:
    case ComparisonOperator::NotIn:
        if (!std::holds_alternative<std::vector<std::string>>(cmp.value))
        {
            throw InvalidInputError(
                "Operator '" + std::string(to_string(op)) + "' on field '" + cmp.field +
                "' requires a list operand");
        }
        break;
    case ComparisonOperator::Gt:
    case ComparisonOperator::Gte:
    case ComparisonOperator::Lt:
    case ComparisonOperator::Lte:
        if (!std::holds_alternative<double>(cmp.value))
        {
            throw InvalidInputError(
                "Operator '" + std::string(to_string(op)) + "' on field '" + cmp.field +
                "' requires a numeric operand");
        }
        break;
    case ComparisonOperator::Regex:
        if (!std::holds_alternative<std::string>(cmp.value))
        {
            throw InvalidInputError(
                "Operator 'regex' on field '" + cmp.field + "' requires a string pattern");
        }
        try
        {
            cmp.pattern = std::make_shared<const std::regex>(std::get<std::string>(cmp.value));
        }
        catch (const std::regex_error& e)
        {
            throw InvalidInputError(
                "Invalid regex on field '" + cmp.field + "': " + e.what());
        }
        break;
    default:
        break;
    }
    return cmp;
}

bool compare_values(const FieldValue& actual, const Comparison& comparison)
{
    const FieldValue& expected = comparison.value;

    switch (comparison.op)
    {
    case ComparisonOperator::Eq:
        return actual == expected;

    case ComparisonOperator::Ne:
        return actual != expected;

    case ComparisonOperator::Gt:
    case ComparisonOperator::Gte:
    case ComparisonOperator::Lt:
    case ComparisonOperator::Lte:
    {
        const double* a = std::get_if<double>(&actual);
        const double* b = std::get_if<double>(&expected);
        if (a == nullptr || b == nullptr)
        {
            return false;
        }
        switch (comparison.op)
        {
        case ComparisonOperator::Gt:
            return *a > *b;
        case ComparisonOperator::Gte:
            return *a >= *b;
        case ComparisonOperator::Lt:
            return *a < *b;
        default:
            return *a <= *b;
        }
    }

    case ComparisonOperator::In:
    case ComparisonOperator::NotIn:
    {
        const auto* list = std::get_if<std::vector<std::string>>(&expected);
        const auto* item = std::get_if<std::string>(&actual);
        if (list == nullptr || item == nullptr)
        {
            return false;
        }
        bool found = std::find(list->begin(), list->end(), *item) != list->end();
        return comparison.op == ComparisonOperator::In ? found : !found;
    }

    case ComparisonOperator::Contains:
    {
        const auto* needle = std::get_if<std::string>(&expected);
        if (needle == nullptr)
        {
            return false;
        }
        if (const auto* list = std::get_if<std::vector<std::string>>(&actual))
        {
            return std::find(list->begin(), list->end(), *needle) != list->end();
        }
        if (const auto* text = std::get_if<std::string>(&actual))
        {
            return text->find(*needle) != std::string::npos;
        }
        return false;
    }

    case ComparisonOperator::Regex:
    {
        const auto* text = std::get_if<std::string>(&actual);
        if (text == nullptr || !comparison.pattern)
        {
            return false;
        }
        return std::regex_search(*text, *comparison.pattern);
    }
    }
    return false;
}

std::string describe(const Comparison& comparison)
{
    return comparison.field + " " + to_string(comparison.op) + " " + to_string(comparison.value);
}

// ============================================================================
// Tree evaluation
// ============================================================================

namespace
{

struct ConditionEvaluator
{
    const EventContext& context;
    std::vector<std::string>& matched;

    bool operator()(const Comparison& cmp) const
    {
        std::optional<FieldValue> actual = context.lookup(cmp.field);
        if (!actual)
        {
            return false;
        }
        if (!compare_values(*actual, cmp))
        {
            return false;
        }
        matched.push_back(describe(cmp));
        return true;
    }

    bool operator()(const AllOf& group) const
    {
        std::vector<std::string> local;
        for (const auto& child : group.children)
        {
            if (!evaluate_condition(child, context, local))
            {
                return false;
            }
        }
        matched.insert(matched.end(), local.begin(), local.end());
        return true;
    }

    bool operator()(const AnyOf& group) const
    {
        bool any = false;
        for (const auto& child : group.children)
        {
            std::vector<std::string> local;
            if (evaluate_condition(child, context, local))
            {
                any = true;
                matched.insert(matched.end(), local.begin(), local.end());
            }
        }
        return any;
    }
};

} // namespace

bool evaluate_condition(
    const Condition& condition,
    const EventContext& context,
    std::vector<std::string>& matched)
{
    return std::visit(ConditionEvaluator{context, matched}, condition.node);
}

} // namespace resq
