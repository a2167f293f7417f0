#include "bus/message_bus.hpp"

namespace kivybot::bus {

void MessageBus::PublishInbound(const InboundMessage& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push(msg);
    }
    inbound_cv_.notify_one();
}

bool MessageBus::TryConsumeInbound(InboundMessage& msg, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!inbound_cv_.wait_for(lock, timeout, [this] { return !inbound_.empty(); })) {
        return false;
    }
    msg = std::move(inbound_.front());
    inbound_.pop();
    return true;
}

std::size_t MessageBus::InboundSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbound_.size();
}

void MessageBus::PublishOutbound(const OutboundMessage& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outbound_.push(msg);
    }
    outbound_cv_.notify_one();
}

bool MessageBus::TryConsumeOutbound(OutboundMessage& msg, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!outbound_cv_.wait_for(lock, timeout, [this] { return !outbound_.empty(); })) {
        return false;
    }
    msg = std::move(outbound_.front());
    outbound_.pop();
    return true;
}

std::size_t MessageBus::OutboundSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound_.size();
}

}  // namespace kivybot::bus
