/**
 * @file resource_lock_manager.cpp
 */
#include "resq/locking/resource_lock_manager.hpp"
#include "resq/common/errors.hpp"
#include "resq/common/logging.hpp"

namespace resq
{

// ============================================================================
// LockHandle
// ============================================================================

LockHandle::LockHandle(
    std::weak_ptr<ResourceLockManager> manager,
    uint64_t token,
    std::vector<ResourceId> resource_ids,
    std::string holder_run_id,
    Lock::TimePoint acquired_at,
    std::chrono::seconds ttl)
    : m_manager(std::move(manager))
    , m_token(token)
    , m_resource_ids(std::move(resource_ids))
    , m_holder_run_id(std::move(holder_run_id))
    , m_acquired_at(acquired_at)
    , m_ttl(ttl)
{
}

LockHandle::~LockHandle()
{
    release_silently();
}

LockHandle::LockHandle(LockHandle&& other) noexcept
    : m_manager(std::move(other.m_manager))
    , m_token(other.m_token)
    , m_resource_ids(std::move(other.m_resource_ids))
    , m_holder_run_id(std::move(other.m_holder_run_id))
    , m_acquired_at(other.m_acquired_at)
    , m_ttl(other.m_ttl)
{
    other.m_token = 0;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept
{
    if (this != &other)
    {
        release_silently();
        m_manager = std::move(other.m_manager);
        m_token = other.m_token;
        m_resource_ids = std::move(other.m_resource_ids);
        m_holder_run_id = std::move(other.m_holder_run_id);
        m_acquired_at = other.m_acquired_at;
        m_ttl = other.m_ttl;
        other.m_token = 0;
    }
    return *this;
}

void LockHandle::release()
{
    if (m_token == 0)
    {
        return;
    }
    if (auto manager = m_manager.lock())
    {
        manager->release(*this);
    }
    m_token = 0;
}

void LockHandle::release_silently() noexcept
{
    if (m_token == 0)
    {
        return;
    }
    if (auto manager = m_manager.lock())
    {
        manager->release_token(m_token, m_resource_ids);
    }
    m_token = 0;
}

// ============================================================================
// ResourceLockManager
// ============================================================================

ResourceLockManager::ResourceLockManager(ConstructionKey, LockConfig config, Clock clock)
    : m_config(config)
    , m_clock(std::move(clock))
{
    m_config.validate_or_throw();
    if (!m_clock)
    {
        m_clock = [] { return std::chrono::steady_clock::now(); };
    }
}

std::shared_ptr<ResourceLockManager> make_resource_lock_manager(
    LockConfig config, LockClock clock)
{
    return std::make_shared<ResourceLockManager>(
        ResourceLockManager::ConstructionKey{}, config, std::move(clock));
}

const LockConfig& ResourceLockManager::config() const noexcept
{
    return m_config;
}

ResourceLockManager::TimePoint ResourceLockManager::now() const
{
    return m_clock();
}

LockHandle ResourceLockManager::acquire(
    const std::vector<ResourceId>& resource_ids, const std::string& holder_run_id)
{
    return acquire(resource_ids, holder_run_id, m_config.ttl);
}

LockHandle ResourceLockManager::acquire(
    const std::vector<ResourceId>& resource_ids,
    const std::string& holder_run_id,
    std::chrono::seconds ttl)
{
    if (resource_ids.empty())
    {
        throw InvalidInputError("Lock request from '" + holder_run_id + "' names no resources");
    }
    if (ttl.count() <= 0)
    {
        throw InvalidInputError("Lock TTL must be positive");
    }

    std::vector<ResourceId> ids;
    std::set<ResourceId> unique;
    for (const auto& id : resource_ids)
    {
        if (id.empty())
        {
            throw InvalidInputError("Lock request from '" + holder_run_id + "' has an empty id");
        }
        if (unique.insert(id).second)
        {
            ids.push_back(id);
        }
    }

    std::lock_guard<std::mutex> guard(m_mutex);
    const TimePoint t = now();

    std::vector<ResourceId> conflicts;
    for (const auto& id : ids)
    {
        auto it = m_entries.find(id);
        if (it == m_entries.end())
        {
            continue;
        }
        if (it->second.lock.expires_at() <= t)
        {
            log(LogLevel::Warn,
                "Lock on '" + id + "' held by '" + it->second.lock.holder_run_id +
                    "' expired and was reclaimed");
            m_entries.erase(it);
            continue;
        }
        conflicts.push_back(id);
    }
    if (!conflicts.empty())
    {
        std::string holders;
        for (const auto& id : conflicts)
        {
            holders += (holders.empty() ? "" : ", ") + id + " (" +
                       m_entries.at(id).lock.holder_run_id + ")";
        }
        throw LockConflictError(
            "Run '" + holder_run_id + "' cannot lock " + std::to_string(conflicts.size()) +
                " of " + std::to_string(ids.size()) + " resources: " + holders,
            std::move(conflicts),
            m_config.retry_after);
    }

    const uint64_t token = m_next_token++;
    for (const auto& id : ids)
    {
        m_entries[id] = Entry{Lock{id, holder_run_id, t, ttl}, token};
    }
    log(LogLevel::Debug,
        "Run '" + holder_run_id + "' locked " + std::to_string(ids.size()) + " resources");
    return LockHandle(weak_from_this(), token, std::move(ids), holder_run_id, t, ttl);
}

size_t ResourceLockManager::release_token(uint64_t token, const std::vector<ResourceId>& resource_ids)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    size_t released = 0;
    for (const auto& id : resource_ids)
    {
        auto it = m_entries.find(id);
        if (it != m_entries.end() && it->second.token == token)
        {
            m_entries.erase(it);
            ++released;
        }
    }
    return released;
}

size_t ResourceLockManager::release(LockHandle& handle)
{
    if (!handle.held())
    {
        return 0;
    }
    size_t released = release_token(handle.m_token, handle.m_resource_ids);
    handle.m_token = 0;
    log(LogLevel::Debug,
        "Run '" + handle.m_holder_run_id + "' released " + std::to_string(released) + " locks");
    return released;
}

bool ResourceLockManager::is_valid(const LockHandle& handle) const
{
    if (!handle.held())
    {
        return false;
    }
    std::lock_guard<std::mutex> guard(m_mutex);
    const TimePoint t = now();
    for (const auto& id : handle.m_resource_ids)
    {
        auto it = m_entries.find(id);
        if (it == m_entries.end() || it->second.token != handle.m_token ||
            it->second.lock.expires_at() <= t)
        {
            return false;
        }
    }
    return true;
}

bool ResourceLockManager::is_locked(const ResourceId& resource_id) const
{
    return holder_of(resource_id).has_value();
}

std::optional<std::string> ResourceLockManager::holder_of(const ResourceId& resource_id) const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    auto it = m_entries.find(resource_id);
    if (it == m_entries.end() || it->second.lock.expires_at() <= now())
    {
        return std::nullopt;
    }
    return it->second.lock.holder_run_id;
}

size_t ResourceLockManager::active_lock_count() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    const TimePoint t = now();
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(), [t](const auto& kv) {
        return kv.second.lock.expires_at() > t;
    }));
}

size_t ResourceLockManager::purge_expired()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    const TimePoint t = now();
    size_t purged = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();)
    {
        if (it->second.lock.expires_at() <= t)
        {
            it = m_entries.erase(it);
            ++purged;
        }
        else
        {
            ++it;
        }
    }
    return purged;
}

std::vector<Lock> ResourceLockManager::snapshot() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    const TimePoint t = now();
    std::vector<Lock> out;
    for (const auto& kv : m_entries)
    {
        if (kv.second.lock.expires_at() > t)
        {
            out.push_back(kv.second.lock);
        }
    }
    std::sort(out.begin(), out.end(), [](const Lock& a, const Lock& b) {
        return a.resource_id < b.resource_id;
    });
    return out;
}

} // namespace resq
