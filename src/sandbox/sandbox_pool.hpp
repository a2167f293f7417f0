#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "config/config_schema.hpp"
#include "engine/engine.hpp"

namespace kivybot::sandbox {

enum class HandleState {
    kProvisioning,
    kReady,
    kLeased,
    kDraining,
    kDead
};

const char* ToString(HandleState state);

struct SandboxHandle {
    std::string id;
    std::string name;
};

// Container spec with the resource and isolation ceilings shared by pooled and
// disposable handles. Callers fill in command, mounts and environment.
engine::ContainerSpec HardenedSpec(const config::PoolConfig& config, const std::string& image);

// Fixed-size set of pre-warmed containers. Lease/Release/Drain must run on the pool's
// executor; the ready queue is the only state shared between jobs.
class SandboxPool {
public:
    SandboxPool(boost::asio::any_io_executor executor,
                engine::Engine& engine,
                config::PoolConfig config,
                std::chrono::milliseconds request_timeout);

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // Removes leftovers from earlier runs, then provisions pool_size handles one by
    // one. Returns whether at least one handle became ready.
    bool Initialize(engine::Yield yield);

    // Ready handle, or nullopt once `timeout` elapses. Never waits when uninitialized.
    std::optional<SandboxHandle> Lease(std::chrono::milliseconds timeout, engine::Yield yield);

    void Release(const SandboxHandle& handle);

    // Stops and removes every tracked and leftover handle, then closes the engine.
    void Drain(engine::Yield yield);

    bool IsInitialized() const { return initialized_; }
    std::size_t ReadyCount() const { return ready_.size(); }
    std::size_t LeasedCount() const;
    std::size_t TrackedCount() const { return handles_.size(); }
    std::optional<HandleState> StateOf(const std::string& id) const;

    const config::PoolConfig& Config() const { return config_; }

private:
    struct Record {
        SandboxHandle handle;
        HandleState state = HandleState::kProvisioning;
    };

    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& executor)
            : timer(executor) {}

        boost::asio::steady_timer timer;
        std::optional<SandboxHandle> slot;
    };

    engine::CallOptions Options() const;
    void RemoveLeftovers(engine::Yield yield);
    void TeardownTracked(engine::Yield yield);
    void Provision(int index, engine::Yield yield);
    void Settle(engine::Yield yield);
    void WakeAllWaiters();

    boost::asio::any_io_executor executor_;
    engine::Engine& engine_;
    config::PoolConfig config_;
    std::chrono::milliseconds request_timeout_;

    std::map<std::string, Record> handles_;
    std::deque<std::string> ready_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    bool initialized_ = false;
    bool draining_ = false;
};

}  // namespace kivybot::sandbox
