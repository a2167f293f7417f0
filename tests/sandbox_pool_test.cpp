#include "sandbox/sandbox_pool.hpp"

#include <chrono>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <gtest/gtest.h>

#include "fake_engine.hpp"

namespace kivybot::sandbox {
namespace {

using testutil::FakeEngine;
using testutil::RunCoroutine;
using namespace std::chrono_literals;

config::PoolConfig SmallPool(int size) {
    config::PoolConfig config;
    config.pool_size = size;
    config.settle_delay_ms = 0;
    return config;
}

class SandboxPoolTest : public ::testing::Test {
protected:
    boost::asio::io_context io_;
    FakeEngine engine_{io_.get_executor()};
};

TEST_F(SandboxPoolTest, InitializeProvisionsHardenedHandles) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(2), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        EXPECT_TRUE(pool.Initialize(yield));
    });
    EXPECT_TRUE(pool.IsInitialized());
    EXPECT_EQ(pool.ReadyCount(), 2u);
    EXPECT_EQ(pool.TrackedCount(), 2u);

    const auto live = engine_.LiveWithLabels(pool.Config().labels);
    ASSERT_EQ(live.size(), 2u);
    const auto& spec = engine_.containers.at(live.front()).spec;
    EXPECT_TRUE(spec.network_disabled);
    EXPECT_EQ(spec.memory_bytes, 512LL * 1024 * 1024);
    EXPECT_EQ(spec.tmpfs.at("/tmp"), "rw,size=80m,noexec,nosuid,nodev");
    EXPECT_EQ(spec.ulimits.size(), 2u);
    EXPECT_TRUE(engine_.containers.at(live.front()).running);
}

TEST_F(SandboxPoolTest, RemovesLeftoversBeforeProvisioning) {
    const auto config = SmallPool(1);
    const auto stale = engine_.AddLeftover(config.labels, "kivy-pool-0");
    const auto unrelated = engine_.AddLeftover({{"app", "other"}}, "other");
    SandboxPool pool(io_.get_executor(), engine_, config, 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        EXPECT_TRUE(pool.Initialize(yield));
    });
    EXPECT_TRUE(engine_.containers.at(stale).removed);
    EXPECT_FALSE(engine_.containers.at(unrelated).removed);
    EXPECT_EQ(pool.ReadyCount(), 1u);
}

TEST_F(SandboxPoolTest, PartialProvisioningFailureLeavesSmallerPool) {
    engine_.failing_creates = {1};
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(3), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        EXPECT_TRUE(pool.Initialize(yield));
    });
    EXPECT_TRUE(pool.IsInitialized());
    EXPECT_EQ(pool.ReadyCount(), 2u);
}

TEST_F(SandboxPoolTest, TotalFailureLeavesPoolUninitialized) {
    engine_.failing_creates = {0, 1};
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(2), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        EXPECT_FALSE(pool.Initialize(yield));
        const auto start = std::chrono::steady_clock::now();
        EXPECT_FALSE(pool.Lease(500ms, yield).has_value());
        EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
    });
    EXPECT_FALSE(pool.IsInitialized());
}

TEST_F(SandboxPoolTest, ReinitializeDoesNotGrowPool) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(2), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        pool.Initialize(yield);
        pool.Initialize(yield);
    });
    EXPECT_EQ(pool.ReadyCount(), 2u);
    EXPECT_EQ(pool.TrackedCount(), 2u);
    EXPECT_EQ(engine_.LiveWithLabels(pool.Config().labels).size(), 2u);
}

TEST_F(SandboxPoolTest, LeaseNeverHandsOutTheSameHandleTwice) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(2), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        pool.Initialize(yield);
        const auto first = pool.Lease(100ms, yield);
        const auto second = pool.Lease(100ms, yield);
        ASSERT_TRUE(first && second);
        EXPECT_NE(first->id, second->id);
        EXPECT_EQ(pool.LeasedCount(), 2u);
        EXPECT_EQ(pool.StateOf(first->id), HandleState::kLeased);
        EXPECT_FALSE(pool.Lease(50ms, yield).has_value());
    });
}

TEST_F(SandboxPoolTest, LeaseTimesOutWhenExhausted) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(1), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        pool.Initialize(yield);
        ASSERT_TRUE(pool.Lease(0ms, yield).has_value());
        const auto start = std::chrono::steady_clock::now();
        EXPECT_FALSE(pool.Lease(80ms, yield).has_value());
        EXPECT_GE(std::chrono::steady_clock::now() - start, 70ms);
    });
}

TEST_F(SandboxPoolTest, ReleaseHandsHandleToWaiter) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(1), 1s);
    std::optional<SandboxHandle> held;
    std::optional<SandboxHandle> waited;
    RunCoroutine(io_, [&](engine::Yield yield) {
        pool.Initialize(yield);
        held = pool.Lease(0ms, yield);
    });
    ASSERT_TRUE(held);

    boost::asio::spawn(io_, [&](engine::Yield yield) {
        waited = pool.Lease(2s, yield);
    });
    boost::asio::spawn(io_, [&](engine::Yield yield) {
        boost::asio::steady_timer timer(io_);
        timer.expires_after(20ms);
        timer.async_wait(yield);
        pool.Release(*held);
    });
    const auto start = std::chrono::steady_clock::now();
    io_.run();
    io_.restart();

    ASSERT_TRUE(waited);
    EXPECT_EQ(waited->id, held->id);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(pool.StateOf(held->id), HandleState::kLeased);
    EXPECT_EQ(pool.ReadyCount(), 0u);
}

TEST_F(SandboxPoolTest, ReleaseReturnsHandleToReady) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(1), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        pool.Initialize(yield);
        const auto handle = pool.Lease(0ms, yield);
        ASSERT_TRUE(handle);
        pool.Release(*handle);
        EXPECT_EQ(pool.StateOf(handle->id), HandleState::kReady);
        pool.Release(*handle);
        EXPECT_EQ(pool.ReadyCount(), 1u);
    });
}

TEST_F(SandboxPoolTest, ReleaseBeforeInitializeIsNoOp) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(1), 1s);
    pool.Release(SandboxHandle{"unknown", "kivy-pool-0"});
    EXPECT_EQ(pool.ReadyCount(), 0u);
    EXPECT_EQ(pool.TrackedCount(), 0u);
}

TEST_F(SandboxPoolTest, DrainRemovesEverything) {
    SandboxPool pool(io_.get_executor(), engine_, SmallPool(2), 1s);
    RunCoroutine(io_, [&](engine::Yield yield) {
        pool.Initialize(yield);
        ASSERT_TRUE(pool.Lease(0ms, yield).has_value());
        pool.Drain(yield);
        EXPECT_FALSE(pool.Lease(100ms, yield).has_value());
    });
    EXPECT_FALSE(pool.IsInitialized());
    EXPECT_EQ(pool.TrackedCount(), 0u);
    EXPECT_TRUE(engine_.LiveWithLabels(pool.Config().labels).empty());
    EXPECT_TRUE(engine_.closed);
}

}  // namespace
}  // namespace kivybot::sandbox
