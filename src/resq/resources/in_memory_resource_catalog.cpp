/**
 * @file in_memory_resource_catalog.cpp
 */
#include "resq/resources/in_memory_resource_catalog.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

#include <mutex>

namespace resq
{

InMemoryResourceCatalog::InMemoryResourceCatalog(
    std::vector<ResourceCandidate> resources,
    double travel_speed_kmh)
    : m_travel_speed_kmh(travel_speed_kmh)
    , m_resources(std::move(resources))
{
    if (!(m_travel_speed_kmh > 0.0))
    {
        throw InvalidInputError("Travel speed must be positive");
    }
    for (size_t i = 0; i < m_resources.size(); ++i)
    {
        if (m_resources[i].id.empty())
        {
            throw InvalidInputError("Resource at position " + std::to_string(i) + " has no id");
        }
        if (!m_index.emplace(m_resources[i].id, i).second)
        {
            throw InvalidInputError("Duplicate resource id '" + m_resources[i].id + "'");
        }
    }
}

std::vector<ResourceCandidate> InMemoryResourceCatalog::query(
    const std::set<CapabilityCode>& required_capabilities,
    const Area& area,
    size_t max_results)
{
    if (max_results == 0)
    {
        throw InvalidInputError("Catalog query requires max_results >= 1");
    }

    struct Hit
    {
        ResourceCandidate candidate;
        size_t overlap;
    };
    std::vector<Hit> hits;

    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& resource : m_resources)
        {
            if (resource.status != ResourceStatus::Available)
            {
                continue;
            }

            size_t overlap = 0;
            for (const auto& cap : resource.capabilities)
            {
                overlap += required_capabilities.count(cap);
            }
            if (!required_capabilities.empty() && overlap == 0)
            {
                continue;
            }

            double distance = haversine_km(area.center, resource.location);
            if (area.radius_km > 0.0 && distance > area.radius_km)
            {
                continue;
            }

            Hit hit{resource, overlap};
            hit.candidate.distance_km = distance;
            if (hit.candidate.eta_minutes <= 0.0)
            {
                hit.candidate.eta_minutes = distance / m_travel_speed_kmh * 60.0;
            }
            hits.push_back(std::move(hit));
        }
    }

    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        if (a.overlap != b.overlap)
            return a.overlap > b.overlap;
        if (a.candidate.distance_km != b.candidate.distance_km)
            return a.candidate.distance_km < b.candidate.distance_km;
        return a.candidate.id < b.candidate.id;
    });

    if (hits.size() > max_results)
    {
        log(LogLevel::Warn,
            "Catalog query truncated " + std::to_string(hits.size()) + " matches to max_results=" +
                std::to_string(max_results));
        hits.resize(max_results);
    }

    std::vector<ResourceCandidate> out;
    out.reserve(hits.size());
    for (auto& hit : hits)
    {
        out.push_back(std::move(hit.candidate));
    }
    return out;
}

std::vector<ResourceId> InMemoryResourceCatalog::revalidate(
    const std::vector<ResourceId>& resource_ids)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ResourceId> stale;
    for (const auto& id : resource_ids)
    {
        auto it = m_index.find(id);
        if (it == m_index.end() || m_resources[it->second].status != ResourceStatus::Available)
        {
            stale.push_back(id);
        }
    }
    return stale;
}

void InMemoryResourceCatalog::commit(
    const std::string& run_id, const std::vector<ResourceId>& resource_ids)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    std::vector<ResourceId> stale;
    for (const auto& id : resource_ids)
    {
        auto it = m_index.find(id);
        if (it == m_index.end() || m_resources[it->second].status != ResourceStatus::Available)
        {
            stale.push_back(id);
        }
    }
    if (!stale.empty())
    {
        throw StaleResourceError(
            "Run '" + run_id + "' cannot commit " + std::to_string(stale.size()) +
                " resources that are no longer available",
            std::move(stale));
    }

    for (const auto& id : resource_ids)
    {
        m_resources[m_index.at(id)].status = ResourceStatus::Deployed;
    }
    auto& deployed = m_deployments[run_id];
    deployed.insert(deployed.end(), resource_ids.begin(), resource_ids.end());
}

size_t InMemoryResourceCatalog::release(const std::string& run_id)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_deployments.find(run_id);
    if (it == m_deployments.end())
    {
        return 0;
    }
    size_t released = 0;
    for (const auto& id : it->second)
    {
        ResourceCandidate& resource = m_resources[m_index.at(id)];
        if (resource.status == ResourceStatus::Deployed)
        {
            resource.status = ResourceStatus::Available;
            ++released;
        }
    }
    m_deployments.erase(it);
    return released;
}

void InMemoryResourceCatalog::set_status(const ResourceId& resource_id, ResourceStatus status)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_index.find(resource_id);
    if (it == m_index.end())
    {
        throw InvalidInputError("Unknown resource '" + resource_id + "'");
    }
    m_resources[it->second].status = status;
}

ResourceStatus InMemoryResourceCatalog::status_of(const ResourceId& resource_id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_index.find(resource_id);
    if (it == m_index.end())
    {
        throw InvalidInputError("Unknown resource '" + resource_id + "'");
    }
    return m_resources[it->second].status;
}

size_t InMemoryResourceCatalog::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_resources.size();
}

// ============================================================================
// JSON loading
// ============================================================================

std::vector<ResourceCandidate> load_resources(const JsonValue& doc)
{
    std::vector<ResourceCandidate> out;
    const auto& items = doc.at("resources", "resource list").as_array("resources");
    for (size_t i = 0; i < items.size(); ++i)
    {
        const JsonValue& v = items[i];
        std::string ctx = "resources[" + std::to_string(i) + "]";
        v.expect_only_keys(
            {"id", "name", "resource_type", "capabilities", "available_personnel",
             "rescue_capacity", "location", "status", "eta_minutes", "availability", "cost",
             "risk"},
            ctx);

        ResourceCandidate r;
        r.id = v.at("id", ctx).as_string(ctx + ".id");
        ctx = "resource '" + r.id + "'";
        if (const auto* f = v.find("name"))
            r.name = f->as_string(ctx + ".name");
        r.resource_type = v.at("resource_type", ctx).as_string(ctx + ".resource_type");
        for (const auto& cap : v.at("capabilities", ctx).as_array(ctx + ".capabilities"))
        {
            r.capabilities.insert(cap.as_string(ctx + ".capabilities"));
        }
        r.available_personnel =
            v.at("available_personnel", ctx).as_int(ctx + ".available_personnel");
        if (const auto* f = v.find("rescue_capacity"))
        {
            if (!f->is_null())
                r.rescue_capacity = f->as_int(ctx + ".rescue_capacity");
        }
        if (const auto* f = v.find("location"))
        {
            f->expect_only_keys({"lat", "lng"}, ctx + ".location");
            r.location.latitude = f->at("lat", ctx + ".location").as_number(ctx + ".location.lat");
            r.location.longitude =
                f->at("lng", ctx + ".location").as_number(ctx + ".location.lng");
        }
        if (const auto* f = v.find("status"))
            r.status = parse_resource_status(f->as_string(ctx + ".status"));
        if (const auto* f = v.find("eta_minutes"))
            r.eta_minutes = f->as_number(ctx + ".eta_minutes");
        if (const auto* f = v.find("availability"))
            r.availability = f->as_number(ctx + ".availability");
        if (const auto* f = v.find("cost"))
            r.cost = f->as_number(ctx + ".cost");
        if (const auto* f = v.find("risk"))
            r.risk = f->as_number(ctx + ".risk");
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<ResourceCandidate> load_resources_file(const std::string& path)
{
    JsonValue doc = json_parse_file(path);
    try
    {
        return load_resources(doc);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace resq
