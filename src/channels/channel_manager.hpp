#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <unordered_map>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace kivybot::channels {

// Owns the enabled chat channels and pumps outbound bus messages to them.
class ChannelManager {
public:
    ChannelManager(const kivybot::config::Config& config, kivybot::bus::MessageBus& bus);
    ~ChannelManager();

    void Register(std::unique_ptr<ChannelBase> channel);
    ChannelBase* GetChannel(const std::string& name);
    void StartAll();
    void StopAll();

    std::unordered_map<std::string, bool> Status() const;

private:
    void RegisterTelegram(const kivybot::config::TelegramConfig& config);
    void RunOutboundDispatcher();

    kivybot::bus::MessageBus& bus_;
    std::atomic<bool> dispatch_running_{false};
    std::thread dispatch_thread_;
    std::unordered_map<std::string, std::unique_ptr<ChannelBase>> channels_;
};

}  // namespace kivybot::channels
