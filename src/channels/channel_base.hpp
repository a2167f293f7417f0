#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"
#include "bus/message_bus.hpp"

namespace kivybot::channels {

// Chat senders are published as "id" or "id|username".
struct SenderIdentity {
    std::string id;
    std::string username;

    static SenderIdentity Parse(const std::string& sender_id);
};

enum class InboundVerdict {
    kPublished,
    kOwnMessage,
    kNotAllowed,
    kEmpty
};

class ChannelBase {
public:
    ChannelBase(std::string name,
                kivybot::bus::MessageBus& bus,
                std::vector<std::string> allow_from);
    virtual ~ChannelBase() = default;
    virtual std::string Name() const { return name_; }
    virtual void Start() = 0;
    virtual void Stop() = 0;
    virtual void Send(const kivybot::bus::OutboundMessage& msg) = 0;

    // An empty allow list admits everyone. Entries match the numeric id or the
    // username, with or without a leading '@'.
    bool IsAllowed(const std::string& sender_id) const;

    // Trims the text and publishes it on the bus unless it is the bot's own
    // message, comes from a sender outside the allow list, or is blank.
    InboundVerdict HandleMessage(
        const std::string& sender_id,
        const std::string& chat_id,
        const std::string& content,
        const std::unordered_map<std::string, std::string>& metadata);

    bool IsRunning() const { return running_; }

protected:
    void SetSelfId(std::string id) { self_id_ = std::move(id); }

    std::string name_;
    kivybot::bus::MessageBus& bus_;
    std::vector<std::string> allow_from_;
    std::string self_id_;
    bool running_ = false;
};

}  // namespace kivybot::channels
