/**
 * @file condition.hpp
 * @brief Condition expression tree evaluated by the rule engine.
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/rules/event_context.hpp"

#include <regex>

namespace resq
{

enum class ComparisonOperator
{
    Eq,
    Ne,
    Gt,
    Gte,
    Lt,
    Lte,
    In,
    NotIn,
    Contains,
    Regex
};

const char* to_string(ComparisonOperator op) noexcept;

/**
 * @brief Parse an operator name ("eq", "gte", "not_in", ...).
 * @throw InvalidInputError for unknown names.
 */
ComparisonOperator parse_comparison_operator(const std::string& text);

/**
 * @brief Leaf of the condition tree: `field <op> value`.
 *
 * @details
 * Built through `make_comparison()`, which precompiles the pattern of a
 * `Regex` comparison so an invalid pattern fails at load time.
 */
struct Comparison
{
    std::string field;
    ComparisonOperator op{ComparisonOperator::Eq};
    FieldValue value;
    std::shared_ptr<const std::regex> pattern;
};

/**
 * @brief Build a comparison, validating the operand against the operator.
 * @throw InvalidInputError if `In`/`NotIn` lacks a list operand or a regex
 *        pattern does not compile.
 */
Comparison make_comparison(std::string field, ComparisonOperator op, FieldValue value);

/**
 * @brief Compare a context value against a comparison operand.
 *
 * @details
 * Ordering operators apply to numbers only; any other operand kind makes the
 * comparison false rather than an error.
 */
bool compare_values(const FieldValue& actual, const Comparison& comparison);

/// Human-readable form, e.g. "estimated_affected gte 100".
std::string describe(const Comparison& comparison);

struct Condition;

/// All children must hold. An empty group holds.
struct AllOf
{
    std::vector<Condition> children;
};

/// At least one child must hold. An empty group does not hold.
struct AnyOf
{
    std::vector<Condition> children;
};

/**
 * @brief A node of the condition tree.
 */
struct Condition
{
    std::variant<Comparison, AllOf, AnyOf> node;
};

/**
 * @brief Evaluate a condition tree against an event.
 * @param condition The tree to evaluate.
 * @param context The event.
 * @param matched Receives descriptions of the leaf comparisons that made the
 *        tree hold. Untouched when the tree does not hold.
 * @return True if the tree holds.
 *
 * @details
 * A comparison on a field missing from the context is false. `AnyOf` tests
 * every child so that all matching leaves are recorded.
 */
bool evaluate_condition(
    const Condition& condition,
    const EventContext& context,
    std::vector<std::string>& matched);

} // namespace resq
