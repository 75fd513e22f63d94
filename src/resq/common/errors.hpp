/**
 * @file errors.hpp
 */
#pragma once
#include "resq/common/common.hpp"

namespace resq
{

/**
 * @brief Error codes carried by every exception thrown from the allocation core.
 *
 * @details
 * The code identifies the failure class independently of the concrete
 * exception type, so callers that only catch `ResqError` can still decide
 * whether a failure is retryable.
 */
enum class ErrorCode
{
    RuleLoad,
    Config,
    Template,
    CyclicDependency,
    InvalidInput,
    OptimizerTimeout,
    OptimizerNonConvergence,
    LockConflict,
    StaleResource,
    RunCancelled
};

/**
 * @brief Get a stable name for an error code.
 */
inline const char* to_string(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::RuleLoad:
        return "RuleLoad";
    case ErrorCode::Config:
        return "Config";
    case ErrorCode::Template:
        return "Template";
    case ErrorCode::CyclicDependency:
        return "CyclicDependency";
    case ErrorCode::InvalidInput:
        return "InvalidInput";
    case ErrorCode::OptimizerTimeout:
        return "OptimizerTimeout";
    case ErrorCode::OptimizerNonConvergence:
        return "OptimizerNonConvergence";
    case ErrorCode::LockConflict:
        return "LockConflict";
    case ErrorCode::StaleResource:
        return "StaleResource";
    case ErrorCode::RunCancelled:
        return "RunCancelled";
    }
    return "Unknown";
}

/**
 * @brief Base exception class for the allocation core.
 *
 * @details
 * Each exception carries an error code and a descriptive message. Derived
 * classes add structured payloads (conflicting resources, cycle members)
 * where a caller needs more than the message to react.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ResqError : public std::exception
{
public:
    /**
     * @brief Construct a ResqError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    ResqError(ErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

    /**
     * @brief Check whether the caller may retry the same request unchanged.
     */
    bool is_retryable() const noexcept
    {
        return m_code == ErrorCode::LockConflict || m_code == ErrorCode::StaleResource;
    }

private:
    ErrorCode m_code;
    std::string m_message;
};

/**
 * @brief The rule source is unavailable, empty, or malformed. Fatal for the run.
 */
class RuleLoadError : public ResqError
{
public:
    explicit RuleLoadError(std::string message)
        : ResqError(ErrorCode::RuleLoad, std::move(message))
    {
    }
};

/**
 * @brief A configuration document is missing, malformed, or fails validation.
 */
class ConfigError : public ResqError
{
public:
    explicit ConfigError(std::string message)
        : ResqError(ErrorCode::Config, std::move(message))
    {
    }
};

/**
 * @brief A task template is malformed or a scene code has no template.
 */
class TemplateError : public ResqError
{
public:
    explicit TemplateError(std::string message)
        : ResqError(ErrorCode::Template, std::move(message))
    {
    }
};

/**
 * @brief Caller-supplied data violates a precondition.
 */
class InvalidInputError : public ResqError
{
public:
    explicit InvalidInputError(std::string message)
        : ResqError(ErrorCode::InvalidInput, std::move(message))
    {
    }
};

/**
 * @brief The merged task graph contains a cycle.
 *
 * @details
 * `involved_tasks()` lists the tasks left with a non-zero in-degree after
 * topological sorting. `blamed_edges()` lists the dependency edges between
 * those tasks as (dependency, dependent) pairs, advisory edges first.
 */
class CyclicDependencyError : public ResqError
{
public:
    CyclicDependencyError(
        std::string message,
        std::vector<std::string> involved_tasks,
        std::vector<std::pair<std::string, std::string>> blamed_edges)
        : ResqError(ErrorCode::CyclicDependency, std::move(message))
        , m_involved_tasks(std::move(involved_tasks))
        , m_blamed_edges(std::move(blamed_edges))
    {
    }

    const std::vector<std::string>& involved_tasks() const noexcept
    {
        return m_involved_tasks;
    }

    const std::vector<std::pair<std::string, std::string>>& blamed_edges() const noexcept
    {
        return m_blamed_edges;
    }

private:
    std::vector<std::string> m_involved_tasks;
    std::vector<std::pair<std::string, std::string>> m_blamed_edges;
};

/**
 * @brief The multi-objective optimizer hit its time budget without any
 *        feasible individual.
 */
class OptimizerTimeoutError : public ResqError
{
public:
    explicit OptimizerTimeoutError(std::string message)
        : ResqError(ErrorCode::OptimizerTimeout, std::move(message))
    {
    }
};

/**
 * @brief The multi-objective optimizer exhausted its generation budget
 *        without producing a feasible individual.
 */
class OptimizerNonConvergenceError : public ResqError
{
public:
    explicit OptimizerNonConvergenceError(std::string message)
        : ResqError(ErrorCode::OptimizerNonConvergence, std::move(message))
    {
    }
};

/**
 * @brief A batch lock request overlaps resources locked by another holder.
 *
 * @details
 * Retryable by the caller after `retry_after()`. The lock manager never
 * retries or queues internally.
 */
class LockConflictError : public ResqError
{
public:
    LockConflictError(
        std::string message,
        std::vector<std::string> conflicting_resources,
        std::chrono::seconds retry_after)
        : ResqError(ErrorCode::LockConflict, std::move(message))
        , m_conflicting_resources(std::move(conflicting_resources))
        , m_retry_after(retry_after)
    {
    }

    const std::vector<std::string>& conflicting_resources() const noexcept
    {
        return m_conflicting_resources;
    }

    std::chrono::seconds retry_after() const noexcept
    {
        return m_retry_after;
    }

private:
    std::vector<std::string> m_conflicting_resources;
    std::chrono::seconds m_retry_after;
};

/**
 * @brief Resources chosen from a snapshot are no longer available at commit time.
 */
class StaleResourceError : public ResqError
{
public:
    StaleResourceError(std::string message, std::vector<std::string> stale_resources)
        : ResqError(ErrorCode::StaleResource, std::move(message))
        , m_stale_resources(std::move(stale_resources))
    {
    }

    const std::vector<std::string>& stale_resources() const noexcept
    {
        return m_stale_resources;
    }

private:
    std::vector<std::string> m_stale_resources;
};

/**
 * @brief The run observed a cancellation request at a suspension point.
 */
class RunCancelledError : public ResqError
{
public:
    explicit RunCancelledError(std::string message)
        : ResqError(ErrorCode::RunCancelled, std::move(message))
    {
    }
};

} // namespace resq
