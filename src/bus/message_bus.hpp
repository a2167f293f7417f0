#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

#include "bus/events.hpp"

namespace kivybot::bus {

// Thread-safe inbound/outbound queues between chat channels and the render gateway.
class MessageBus {
public:
    void PublishInbound(const InboundMessage& msg);
    bool TryConsumeInbound(InboundMessage& msg, std::chrono::milliseconds timeout);
    std::size_t InboundSize() const;
    void PublishOutbound(const OutboundMessage& msg);
    bool TryConsumeOutbound(OutboundMessage& msg, std::chrono::milliseconds timeout);
    std::size_t OutboundSize() const;

private:
    std::queue<InboundMessage> inbound_;
    std::queue<OutboundMessage> outbound_;
    mutable std::mutex mutex_;
    std::condition_variable inbound_cv_;
    std::condition_variable outbound_cv_;
};

}  // namespace kivybot::bus
