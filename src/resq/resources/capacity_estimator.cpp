/**
 * @file capacity_estimator.cpp
 */
#include "resq/resources/capacity_estimator.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

#include <cmath>
#include <limits>

namespace resq
{

CapacityEstimator::CapacityEstimator(CapacityCoefficients coefficients)
    : m_coefficients(std::move(coefficients))
{
    m_coefficients.validate_or_throw();
}

int CapacityEstimator::estimate(const ResourceCandidate& candidate) const
{
    if (candidate.available_personnel < 0)
    {
        throw InvalidInputError(
            "Resource '" + candidate.id + "' has negative personnel " +
            std::to_string(candidate.available_personnel));
    }

    double coefficient = m_coefficients.coefficient_for(candidate.resource_type);
    double scaled = std::floor(static_cast<double>(candidate.available_personnel) * coefficient);
    if (scaled >= static_cast<double>(std::numeric_limits<int>::max()))
    {
        log(LogLevel::Warn, "Capacity estimate for resource '" + candidate.id +
                                "' clamped to " + std::to_string(std::numeric_limits<int>::max()));
        return std::numeric_limits<int>::max();
    }
    int estimate = static_cast<int>(scaled);
    if (estimate == 0 && coefficient > 0.0 && candidate.available_personnel > 0)
    {
        estimate = 1;
    }
    return estimate;
}

size_t CapacityEstimator::apply(std::vector<ResourceCandidate>& candidates) const
{
    size_t estimated = 0;
    for (auto& candidate : candidates)
    {
        if (candidate.rescue_capacity)
        {
            if (*candidate.rescue_capacity < 0)
            {
                throw InvalidInputError(
                    "Resource '" + candidate.id + "' has negative rescue capacity");
            }
            continue;
        }
        candidate.rescue_capacity = estimate(candidate);
        candidate.capacity_estimated = true;
        ++estimated;
    }
    if (estimated > 0)
    {
        log(LogLevel::Debug,
            "Estimated rescue capacity for " + std::to_string(estimated) + " of " +
                std::to_string(candidates.size()) + " candidates");
    }
    return estimated;
}

} // namespace resq
