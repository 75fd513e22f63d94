/**
 * @file resource_catalog.hpp
 * @brief Interface to the external store of teams and vehicles.
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"

namespace resq
{

/**
 * @brief Adapter to the resource pool consumed by the allocation pipeline.
 *
 * @details
 * `query()` returns a snapshot. The pipeline never trusts a snapshot for a
 * commit decision: it locks the chosen resources, calls `revalidate()`, and
 * only then `commit()`s. `commit()` is the only mutation the core performs.
 *
 * @par Thread safety
 * - Implementations must allow concurrent calls from independent runs.
 */
class ResourceCatalog
{
public:
    virtual ~ResourceCatalog() = default;

    /**
     * @brief Candidates able to contribute to `required_capabilities` in `area`.
     * @param max_results Explicit result bound; the caller always supplies it.
     * @throw InvalidInputError if `max_results` is zero.
     */
    virtual std::vector<ResourceCandidate> query(
        const std::set<CapabilityCode>& required_capabilities,
        const Area& area,
        size_t max_results) = 0;

    /**
     * @brief Check that resources are still available for commit.
     * @return The ids that are no longer available (empty when all are).
     */
    virtual std::vector<ResourceId> revalidate(const std::vector<ResourceId>& resource_ids) = 0;

    /**
     * @brief Mark resources as deployed for `run_id`.
     * @throw StaleResourceError if any resource is no longer available; no
     *        resource is modified in that case.
     */
    virtual void commit(const std::string& run_id, const std::vector<ResourceId>& resource_ids) = 0;
};

} // namespace resq
