/**
 * @file resource_lock_manager.hpp
 * @brief Batch-atomic, TTL-bounded locks over resource ids.
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/config.hpp"
#include "resq/common/domain_types.hpp"

#include <mutex>

namespace resq
{

class ResourceLockManager;

/// Time source of a lock manager.
using LockClock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Create a lock manager.
 * @param clock Time source; empty means `steady_clock::now`.
 * @throw ConfigError if `config` is invalid.
 */
std::shared_ptr<ResourceLockManager> make_resource_lock_manager(
    LockConfig config = {}, LockClock clock = {});

/**
 * @brief One active lock on one resource.
 */
struct Lock
{
    using TimePoint = std::chrono::steady_clock::time_point;

    ResourceId resource_id;
    std::string holder_run_id;
    TimePoint acquired_at;
    std::chrono::seconds ttl{0};

    TimePoint expires_at() const noexcept
    {
        return acquired_at + ttl;
    }
};

/**
 * @brief Ownership of a batch of locks acquired together.
 *
 * @details
 * Move-only. Destroying or move-assigning over a handle that still holds
 * its locks releases them without logging.
 * The handle refers to its manager weakly; if the manager is gone, releasing
 * does nothing.
 */
class LockHandle
{
public:
    LockHandle() = default;
    ~LockHandle();

    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;
    LockHandle(LockHandle&& other) noexcept;
    LockHandle& operator=(LockHandle&& other) noexcept;

    /// True until the handle is released or moved from.
    bool held() const noexcept
    {
        return m_token != 0;
    }

    const std::vector<ResourceId>& resource_ids() const noexcept
    {
        return m_resource_ids;
    }

    const std::string& holder_run_id() const noexcept
    {
        return m_holder_run_id;
    }

    Lock::TimePoint acquired_at() const noexcept
    {
        return m_acquired_at;
    }

    std::chrono::seconds ttl() const noexcept
    {
        return m_ttl;
    }

    /**
     * @brief Release the locks now. Safe to call more than once.
     */
    void release();

private:
    friend class ResourceLockManager;

    void release_silently() noexcept;

    LockHandle(
        std::weak_ptr<ResourceLockManager> manager,
        uint64_t token,
        std::vector<ResourceId> resource_ids,
        std::string holder_run_id,
        Lock::TimePoint acquired_at,
        std::chrono::seconds ttl);

    std::weak_ptr<ResourceLockManager> m_manager;
    uint64_t m_token{0};
    std::vector<ResourceId> m_resource_ids;
    std::string m_holder_run_id;
    Lock::TimePoint m_acquired_at{};
    std::chrono::seconds m_ttl{0};
};

/**
 * @brief Serializes concurrent allocation attempts over shared resources.
 *
 * @details
 * At any instant a resource id has at most one active lock. Acquisition is
 * all-or-nothing: if any requested resource holds an unexpired lock, the
 * whole request fails with `LockConflictError` and nothing is locked. The
 * manager never queues or retries; the error carries the retry hint from
 * `LockConfig::retry_after`.
 *
 * Locks expire `ttl` after acquisition. Expired locks are purged lazily on
 * the next call that inspects them, so a crashed holder never blocks a
 * resource for longer than its TTL.
 *
 * Create through `make_resource_lock_manager()`; handles refer back to the
 * manager through a `weak_ptr`.
 *
 * @par Thread safety
 * - All methods are safe to call concurrently; state is guarded by one mutex.
 */
class ResourceLockManager : public std::enable_shared_from_this<ResourceLockManager>
{
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

public:
    using TimePoint = Lock::TimePoint;
    using Clock = LockClock;

    /// Only reachable through `make_resource_lock_manager()`.
    ResourceLockManager(ConstructionKey, LockConfig config, Clock clock);

    const LockConfig& config() const noexcept;

    /**
     * @brief Lock `resource_ids` for `holder_run_id` with the configured TTL.
     * @throw InvalidInputError if `resource_ids` is empty or contains an empty id.
     * @throw LockConflictError if any resource is already locked.
     */
    LockHandle acquire(const std::vector<ResourceId>& resource_ids, const std::string& holder_run_id);

    /**
     * @brief Lock `resource_ids` for `holder_run_id` with an explicit TTL.
     * @throw InvalidInputError additionally if `ttl` is not positive.
     */
    LockHandle acquire(
        const std::vector<ResourceId>& resource_ids,
        const std::string& holder_run_id,
        std::chrono::seconds ttl);

    /**
     * @brief Release the locks of `handle`.
     *
     * @details
     * Only entries still owned by the handle are removed; a lock that expired
     * and was re-acquired by another run is left alone. The handle no longer
     * holds anything afterwards.
     *
     * @return Number of locks removed.
     */
    size_t release(LockHandle& handle);

    /// True if every lock of `handle` is still owned by it and unexpired.
    bool is_valid(const LockHandle& handle) const;

    bool is_locked(const ResourceId& resource_id) const;

    /// Holder of the active lock on `resource_id`, if any.
    std::optional<std::string> holder_of(const ResourceId& resource_id) const;

    /// Number of unexpired locks.
    size_t active_lock_count() const;

    /// Drop expired entries now. @return Number dropped.
    size_t purge_expired();

    /// Unexpired locks sorted by resource id.
    std::vector<Lock> snapshot() const;

private:
    friend class LockHandle;
    friend std::shared_ptr<ResourceLockManager> make_resource_lock_manager(LockConfig, LockClock);

    struct Entry
    {
        Lock lock;
        uint64_t token{0};
    };

    TimePoint now() const;
    size_t release_token(uint64_t token, const std::vector<ResourceId>& resource_ids);

    LockConfig m_config;
    Clock m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<ResourceId, Entry> m_entries;
    uint64_t m_next_token{1};
};

} // namespace resq
