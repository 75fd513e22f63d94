/**
 * @file in_memory_resource_catalog.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/json_value.hpp"
#include "resq/resources/resource_catalog.hpp"

#include <shared_mutex>

namespace resq
{

/**
 * @brief Resource pool held in memory.
 *
 * @details
 * Queries return available resources sharing at least one required
 * capability (all available resources when none are required), within the
 * area radius when one is set. Results are ordered by capability overlap
 * (descending), then distance, then id, and truncated to `max_results`.
 *
 * A resource without an ETA gets one from its distance at `travel_speed_kmh`.
 *
 * @par Thread safety
 * - Reads take a shared lock, `commit()` and `release()` an exclusive one.
 */
class InMemoryResourceCatalog : public ResourceCatalog
{
public:
    /**
     * @throw InvalidInputError on duplicate or empty ids, or a non-positive speed.
     */
    explicit InMemoryResourceCatalog(
        std::vector<ResourceCandidate> resources,
        double travel_speed_kmh = 40.0);

    std::vector<ResourceCandidate> query(
        const std::set<CapabilityCode>& required_capabilities,
        const Area& area,
        size_t max_results) override;

    std::vector<ResourceId> revalidate(const std::vector<ResourceId>& resource_ids) override;

    void commit(const std::string& run_id, const std::vector<ResourceId>& resource_ids) override;

    /**
     * @brief Return the resources committed by `run_id` to the pool.
     * @return Number of resources made available again.
     */
    size_t release(const std::string& run_id);

    /// Change a resource's status, as an external system would.
    void set_status(const ResourceId& resource_id, ResourceStatus status);

    /// @throw InvalidInputError if the id is unknown.
    ResourceStatus status_of(const ResourceId& resource_id) const;

    size_t size() const;

private:
    double m_travel_speed_kmh;
    mutable std::shared_mutex m_mutex;
    std::vector<ResourceCandidate> m_resources;
    std::unordered_map<ResourceId, size_t> m_index;
    std::map<std::string, std::vector<ResourceId>> m_deployments;
};

/**
 * @brief Read resources from `{"resources": [...]}`.
 *
 * @details
 * Each entry has `id`, `resource_type`, `capabilities`, `available_personnel`
 * and optional `name`, `rescue_capacity`, `location {lat, lng}`, `status`,
 * `eta_minutes`, `availability`, `cost`, `risk`. An absent `rescue_capacity`
 * stays unset for `CapacityEstimator` to fill.
 *
 * @throw ConfigError on any structural problem.
 */
std::vector<ResourceCandidate> load_resources(const JsonValue& doc);

std::vector<ResourceCandidate> load_resources_file(const std::string& path);

} // namespace resq
