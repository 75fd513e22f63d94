#include <gtest/gtest.h>
#include "resq/common/errors.hpp"
#include "resq/locking/resource_lock_manager.hpp"
#include "support/test_support.hpp"

#include <thread>

using namespace resq;
using resq_test::FakeClock;
using resq_test::LogCapture;

namespace
{

LockConfig short_ttl()
{
    LockConfig config;
    config.ttl = std::chrono::seconds(60);
    config.retry_after = std::chrono::seconds(5);
    return config;
}

} // namespace

// ============================================================================
// Acquisition
// ============================================================================

TEST(ResourceLockManagerTests, Acquire_LocksEveryResource)
{
    auto manager = make_resource_lock_manager(short_ttl());
    auto handle = manager->acquire({"usar-01", "med-01", "usar-01"}, "run-a");

    EXPECT_TRUE(handle.held());
    EXPECT_EQ(handle.resource_ids(), (std::vector<ResourceId>{"usar-01", "med-01"}));
    EXPECT_EQ(handle.holder_run_id(), "run-a");
    EXPECT_EQ(handle.ttl(), std::chrono::seconds(60));
    EXPECT_EQ(manager->holder_of("usar-01"), std::optional<std::string>("run-a"));
    EXPECT_EQ(manager->active_lock_count(), 2u);
    EXPECT_TRUE(manager->is_valid(handle));
}

TEST(ResourceLockManagerTests, Acquire_InvalidRequestRejected)
{
    auto manager = make_resource_lock_manager();
    EXPECT_THROW(manager->acquire({}, "run-a"), InvalidInputError);
    EXPECT_THROW(manager->acquire({"a", ""}, "run-a"), InvalidInputError);
    EXPECT_THROW(manager->acquire({"a"}, "run-a", std::chrono::seconds(0)), InvalidInputError);
    EXPECT_EQ(manager->active_lock_count(), 0u);
}

TEST(ResourceLockManagerTests, Acquire_InvalidConfigRejected)
{
    LockConfig config;
    config.ttl = std::chrono::seconds(0);
    EXPECT_THROW(make_resource_lock_manager(config), ConfigError);
}

TEST(ResourceLockManagerTests, Acquire_ConflictIsAllOrNothing)
{
    auto manager = make_resource_lock_manager(short_ttl());
    auto first = manager->acquire({"a", "b"}, "run-a");

    try
    {
        manager->acquire({"c", "b", "d"}, "run-b");
        FAIL() << "expected LockConflictError";
    }
    catch (const LockConflictError& e)
    {
        EXPECT_EQ(e.conflicting_resources(), (std::vector<std::string>{"b"}));
        EXPECT_EQ(e.retry_after(), std::chrono::seconds(5));
        EXPECT_TRUE(e.is_retryable());
        EXPECT_NE(std::string(e.what()).find("run-a"), std::string::npos);
    }

    // Nothing from the failed request is held
    EXPECT_FALSE(manager->is_locked("c"));
    EXPECT_FALSE(manager->is_locked("d"));
    EXPECT_EQ(manager->holder_of("b"), std::optional<std::string>("run-a"));
}

// ============================================================================
// Release
// ============================================================================

TEST(ResourceLockManagerTests, Release_ExplicitAndIdempotent)
{
    auto manager = make_resource_lock_manager(short_ttl());
    auto handle = manager->acquire({"a", "b"}, "run-a");

    EXPECT_EQ(manager->release(handle), 2u);
    EXPECT_FALSE(handle.held());
    EXPECT_EQ(manager->release(handle), 0u);
    handle.release();
    EXPECT_EQ(manager->active_lock_count(), 0u);
    EXPECT_FALSE(manager->is_valid(handle));
}

TEST(ResourceLockManagerTests, Release_HandleDestructionReleases)
{
    auto manager = make_resource_lock_manager(short_ttl());
    {
        auto handle = manager->acquire({"a"}, "run-a");
        EXPECT_TRUE(manager->is_locked("a"));
    }
    EXPECT_FALSE(manager->is_locked("a"));
    EXPECT_NO_THROW(manager->acquire({"a"}, "run-b"));
}

TEST(ResourceLockManagerTests, Release_MovedHandleKeepsOwnership)
{
    auto manager = make_resource_lock_manager(short_ttl());
    LockHandle outer;
    {
        auto inner = manager->acquire({"a"}, "run-a");
        outer = std::move(inner);
        EXPECT_FALSE(inner.held());
    }
    EXPECT_TRUE(outer.held());
    EXPECT_TRUE(manager->is_locked("a"));
    outer.release();
    EXPECT_FALSE(manager->is_locked("a"));
}

TEST(ResourceLockManagerTests, Release_ImplicitReleaseIsSilent)
{
    LogCapture logs;
    auto manager = make_resource_lock_manager(short_ttl());
    {
        auto scoped = manager->acquire({"a"}, "run-a");
    }
    LockHandle reused = manager->acquire({"b"}, "run-b");
    reused = manager->acquire({"c"}, "run-c");
    EXPECT_FALSE(manager->is_locked("a"));
    EXPECT_FALSE(manager->is_locked("b"));
    EXPECT_TRUE(manager->is_locked("c"));
    EXPECT_FALSE(logs.contains(LogLevel::Debug, "released"));

    reused.release();
    EXPECT_FALSE(manager->is_locked("c"));
    EXPECT_TRUE(logs.contains(LogLevel::Debug, "Run 'run-c' released 1 locks"));
}

TEST(ResourceLockManagerTests, Release_HandleOutlivingManagerIsHarmless)
{
    LockHandle handle;
    {
        auto manager = make_resource_lock_manager(short_ttl());
        handle = manager->acquire({"a"}, "run-a");
    }
    EXPECT_TRUE(handle.held());
    EXPECT_NO_THROW(handle.release());
    EXPECT_FALSE(handle.held());
}

// ============================================================================
// Expiry
// ============================================================================

TEST(ResourceLockManagerTests, Expiry_ExpiredLockIsReclaimed)
{
    FakeClock clock;
    auto manager = make_resource_lock_manager(short_ttl(), clock);
    auto stale = manager->acquire({"a", "b"}, "run-a");

    clock.advance(std::chrono::seconds(59));
    EXPECT_TRUE(manager->is_valid(stale));
    EXPECT_THROW(manager->acquire({"a"}, "run-b"), LockConflictError);

    clock.advance(std::chrono::seconds(1));
    EXPECT_FALSE(manager->is_valid(stale));
    EXPECT_FALSE(manager->is_locked("a"));
    EXPECT_EQ(manager->active_lock_count(), 0u);

    auto fresh = manager->acquire({"a"}, "run-b");
    EXPECT_EQ(manager->holder_of("a"), std::optional<std::string>("run-b"));

    // Releasing the expired handle leaves the new owner alone
    EXPECT_EQ(manager->release(stale), 1u);
    EXPECT_EQ(manager->holder_of("a"), std::optional<std::string>("run-b"));
    EXPECT_TRUE(manager->is_valid(fresh));
}

TEST(ResourceLockManagerTests, Expiry_PurgeDropsExpiredEntries)
{
    FakeClock clock;
    auto manager = make_resource_lock_manager(short_ttl(), clock);
    auto short_lived = manager->acquire({"a"}, "run-a", std::chrono::seconds(10));
    auto long_lived = manager->acquire({"b"}, "run-b", std::chrono::seconds(100));

    clock.advance(std::chrono::seconds(30));
    EXPECT_EQ(manager->purge_expired(), 1u);

    auto locks = manager->snapshot();
    ASSERT_EQ(locks.size(), 1u);
    EXPECT_EQ(locks[0].resource_id, "b");
    EXPECT_EQ(locks[0].holder_run_id, "run-b");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(ResourceLockManagerTests, Concurrency_OverlappingBatchesNeverShareResources)
{
    auto manager = make_resource_lock_manager(short_ttl());
    const std::vector<std::vector<ResourceId>> batches{
        {"a", "b"}, {"b", "c"}, {"c", "d"}, {"d", "a"}, {"e"}, {"a", "e"}};

    std::atomic<int> acquired{0};
    std::atomic<int> conflicted{0};
    std::vector<LockHandle> handles(batches.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < batches.size(); ++i)
    {
        threads.emplace_back([&, i] {
            try
            {
                handles[i] = manager->acquire(batches[i], "run-" + std::to_string(i));
                ++acquired;
            }
            catch (const LockConflictError&)
            {
                ++conflicted;
            }
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_EQ(acquired + conflicted, static_cast<int>(batches.size()));
    EXPECT_GE(acquired.load(), 1);

    // Each held handle owns all of its resources; no resource has two holders
    std::map<ResourceId, std::string> owner;
    for (const auto& h : handles)
    {
        if (!h.held())
        {
            continue;
        }
        EXPECT_TRUE(manager->is_valid(h));
        for (const auto& id : h.resource_ids())
        {
            EXPECT_TRUE(owner.emplace(id, h.holder_run_id()).second) << id;
            EXPECT_EQ(manager->holder_of(id), std::optional<std::string>(h.holder_run_id()));
        }
    }
    EXPECT_EQ(manager->active_lock_count(), owner.size());
}

TEST(ResourceLockManagerTests, Concurrency_ContendedResourceHasOneWinner)
{
    auto manager = make_resource_lock_manager(short_ttl());
    constexpr int threads_count = 8;
    std::atomic<int> winners{0};
    std::vector<LockHandle> handles(threads_count);
    std::vector<std::thread> threads;
    for (int i = 0; i < threads_count; ++i)
    {
        threads.emplace_back([&, i] {
            try
            {
                handles[i] = manager->acquire({"usar-01", "res-" + std::to_string(i)},
                                              "run-" + std::to_string(i));
                ++winners;
            }
            catch (const LockConflictError&)
            {
            }
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(manager->active_lock_count(), 2u);
}
