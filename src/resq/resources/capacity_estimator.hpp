/**
 * @file capacity_estimator.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/config.hpp"
#include "resq/common/domain_types.hpp"

namespace resq
{

/**
 * @brief Fills missing rescue capacities from personnel and resource type.
 *
 * @details
 * Estimated capacity is `floor(available_personnel * coefficient)`. With a
 * positive coefficient and at least one person the estimate is at least 1,
 * so a staffed team never counts as zero capacity because of rounding.
 * Supplied capacities are kept as they are.
 */
class CapacityEstimator
{
public:
    explicit CapacityEstimator(CapacityCoefficients coefficients);

    /**
     * @brief Capacity estimate for one resource, ignoring any supplied value.
     * @throw InvalidInputError if personnel is negative.
     */
    int estimate(const ResourceCandidate& candidate) const;

    /**
     * @brief Fill `rescue_capacity` where it is unset.
     * @return Number of candidates whose capacity was estimated.
     * @throw InvalidInputError on negative personnel or a negative supplied capacity.
     */
    size_t apply(std::vector<ResourceCandidate>& candidates) const;

private:
    CapacityCoefficients m_coefficients;
};

} // namespace resq
