/**
 * @file cancellation_token.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/errors.hpp"

namespace resq
{

/**
 * @brief Cooperative stop flag shared between a caller and a running pipeline.
 *
 * @details
 * The pipeline and the multi-objective optimizer poll the token at their
 * suspension points. Cancellation is cooperative, not preemptive: work in
 * progress between two checks completes normally.
 *
 * @par Thread safety
 * - All methods may be called from any thread.
 */
class CancellationToken
{
public:
    /**
     * @brief Request that the run stop at its next suspension point.
     */
    void request_stop() noexcept
    {
        m_stop_requested.store(true, std::memory_order_release);
    }

    bool stop_requested() const noexcept
    {
        return m_stop_requested.load(std::memory_order_acquire);
    }

    /**
     * @brief Throw `RunCancelledError` naming `stage` if a stop was requested.
     */
    void throw_if_stop_requested(const std::string& stage) const
    {
        if (stop_requested())
        {
            throw RunCancelledError("Run cancelled before stage '" + stage + "'");
        }
    }

private:
    std::atomic<bool> m_stop_requested{false};
};

} // namespace resq
