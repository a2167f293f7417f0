#include "sandbox/sandbox_pool.hpp"

#include <algorithm>
#include <vector>

#include "utils/logging.hpp"

namespace kivybot::sandbox {

const char* ToString(HandleState state) {
    switch (state) {
        case HandleState::kProvisioning: return "provisioning";
        case HandleState::kReady: return "ready";
        case HandleState::kLeased: return "leased";
        case HandleState::kDraining: return "draining";
        case HandleState::kDead: return "dead";
    }
    return "unknown";
}

engine::ContainerSpec HardenedSpec(const config::PoolConfig& config, const std::string& image) {
    engine::ContainerSpec spec;
    spec.image = image;
    spec.labels = config.labels;
    spec.env = {"DISPLAY=:99", "PYTHONUNBUFFERED=1"};
    spec.memory_bytes = config.memory_bytes;
    spec.cpu_quota = config.cpu_quota;
    spec.network_disabled = config.network_isolated;
    spec.tmpfs["/tmp"] = "rw,size=" + config.tmpfs_size + ",noexec,nosuid,nodev";
    spec.ulimits.push_back({"fsize", config.file_size_limit_bytes, config.file_size_limit_bytes});
    spec.ulimits.push_back({"nofile", config.open_files_limit, config.open_files_limit});
    spec.security_opt.push_back("no-new-privileges:true");
    return spec;
}

SandboxPool::SandboxPool(boost::asio::any_io_executor executor,
                         engine::Engine& engine,
                         config::PoolConfig config,
                         std::chrono::milliseconds request_timeout)
    : executor_(std::move(executor))
    , engine_(engine)
    , config_(std::move(config))
    , request_timeout_(request_timeout) {}

engine::CallOptions SandboxPool::Options() const {
    engine::CallOptions options;
    options.timeout = request_timeout_;
    return options;
}

bool SandboxPool::Initialize(engine::Yield yield) {
    initialized_ = false;
    draining_ = false;
    if (!handles_.empty()) {
        utils::LogInfo("pool", "re-initializing; tearing down " + std::to_string(handles_.size()) + " tracked handles");
        TeardownTracked(yield);
    }
    RemoveLeftovers(yield);

    utils::LogInfo("pool", "provisioning " + std::to_string(config_.pool_size) + " handles from " + config_.image);
    for (int i = 0; i < config_.pool_size; ++i) {
        Provision(i, yield);
    }

    initialized_ = !ready_.empty();
    if (initialized_) {
        utils::LogInfo("pool", "ready with " + std::to_string(ready_.size()) + "/"
                                   + std::to_string(config_.pool_size) + " handles");
    } else {
        utils::LogWarn("pool", "no handle could be provisioned; jobs will use disposable containers");
    }
    return initialized_;
}

void SandboxPool::Provision(int index, engine::Yield yield) {
    auto spec = HardenedSpec(config_, config_.image);
    spec.name = config_.name_prefix + "-" + std::to_string(index);

    std::string id;
    try {
        id = engine_.CreateContainer(spec, Options(), yield);
        handles_[id] = Record{SandboxHandle{id, spec.name}, HandleState::kProvisioning};
        engine_.StartContainer(id, Options(), yield);
    } catch (const std::exception& e) {
        utils::LogError("pool", "failed to provision " + spec.name + ": " + e.what());
        if (!id.empty()) {
            handles_[id].state = HandleState::kDead;
            try {
                engine_.RemoveContainer(id, true, Options(), yield);
            } catch (const std::exception& remove_error) {
                utils::LogWarn("pool", "failed to remove " + spec.name + ": " + remove_error.what());
            }
            handles_.erase(id);
        }
        return;
    }

    auto it = handles_.find(id);
    if (it == handles_.end()) {
        // Torn down by a concurrent Drain while starting.
        return;
    }
    it->second.state = HandleState::kReady;
    ready_.push_back(id);
    utils::LogInfo("pool", "started " + spec.name + " (" + id.substr(0, 12) + ")");
    Settle(yield);
}

void SandboxPool::Settle(engine::Yield yield) {
    if (config_.settle_delay_ms <= 0) {
        return;
    }
    boost::asio::steady_timer timer(executor_);
    timer.expires_after(std::chrono::milliseconds(config_.settle_delay_ms));
    boost::system::error_code ec;
    timer.async_wait(yield[ec]);
}

void SandboxPool::RemoveLeftovers(engine::Yield yield) {
    std::vector<engine::ContainerSummary> leftovers;
    try {
        leftovers = engine_.ListContainers(config_.labels, Options(), yield);
    } catch (const std::exception& e) {
        utils::LogWarn("pool", std::string("could not list leftover handles: ") + e.what());
        return;
    }
    for (const auto& container : leftovers) {
        if (handles_.count(container.id) > 0) {
            continue;
        }
        const auto label = container.names.empty() ? container.id : container.names.front();
        try {
            engine_.KillContainer(container.id, Options(), yield);
        } catch (const std::exception& e) {
            utils::LogDebug("pool", "kill " + label + ": " + e.what());
        }
        try {
            engine_.RemoveContainer(container.id, true, Options(), yield);
            utils::LogInfo("pool", "removed leftover handle " + label);
        } catch (const std::exception& e) {
            utils::LogWarn("pool", "failed to remove leftover " + label + ": " + e.what());
        }
    }
}

void SandboxPool::TeardownTracked(engine::Yield yield) {
    WakeAllWaiters();
    ready_.clear();

    std::vector<std::string> ids;
    for (auto& [id, record] : handles_) {
        record.state = HandleState::kDraining;
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        const auto name = handles_[id].handle.name;
        try {
            engine_.StopContainer(id, 2, Options(), yield);
        } catch (const std::exception& e) {
            utils::LogDebug("pool", "stop " + name + ": " + e.what());
        }
        try {
            engine_.RemoveContainer(id, true, Options(), yield);
        } catch (const std::exception& e) {
            utils::LogWarn("pool", "failed to remove " + name + ": " + e.what());
        }
        handles_[id].state = HandleState::kDead;
    }
    handles_.clear();
}

void SandboxPool::WakeAllWaiters() {
    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto& waiter : waiters) {
        waiter->timer.cancel();
    }
}

std::optional<SandboxHandle> SandboxPool::Lease(std::chrono::milliseconds timeout, engine::Yield yield) {
    if (!initialized_ || draining_) {
        return std::nullopt;
    }
    while (!ready_.empty()) {
        const auto id = ready_.front();
        ready_.pop_front();
        auto it = handles_.find(id);
        if (it == handles_.end() || it->second.state != HandleState::kReady) {
            continue;
        }
        it->second.state = HandleState::kLeased;
        return it->second.handle;
    }
    if (timeout.count() <= 0) {
        return std::nullopt;
    }

    auto waiter = std::make_shared<Waiter>(executor_);
    waiters_.push_back(waiter);
    waiter->timer.expires_after(timeout);
    boost::system::error_code ec;
    waiter->timer.async_wait(yield[ec]);

    auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
    if (it != waiters_.end()) {
        waiters_.erase(it);
    }
    return waiter->slot;
}

void SandboxPool::Release(const SandboxHandle& handle) {
    if (!initialized_) {
        return;
    }
    auto it = handles_.find(handle.id);
    if (it == handles_.end()) {
        utils::LogDebug("pool", "release of untracked handle " + handle.name);
        return;
    }
    if (it->second.state != HandleState::kLeased) {
        utils::LogWarn("pool", "ignoring release of " + handle.name + " in state " + ToString(it->second.state));
        return;
    }
    if (!waiters_.empty()) {
        auto waiter = waiters_.front();
        waiters_.pop_front();
        waiter->slot = it->second.handle;
        waiter->timer.cancel();
        return;
    }
    it->second.state = HandleState::kReady;
    ready_.push_back(handle.id);
}

void SandboxPool::Drain(engine::Yield yield) {
    draining_ = true;
    initialized_ = false;
    utils::LogInfo("pool", "draining " + std::to_string(handles_.size()) + " handles");
    TeardownTracked(yield);
    RemoveLeftovers(yield);
    engine_.Close();
    utils::LogInfo("pool", "drained");
}

std::size_t SandboxPool::LeasedCount() const {
    return static_cast<std::size_t>(std::count_if(handles_.begin(), handles_.end(), [](const auto& entry) {
        return entry.second.state == HandleState::kLeased;
    }));
}

std::optional<HandleState> SandboxPool::StateOf(const std::string& id) const {
    auto it = handles_.find(id);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

}  // namespace kivybot::sandbox
