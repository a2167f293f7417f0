#include "channels/channel_base.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kivybot::channels {
namespace {

std::string NormalizeHandle(const std::string& value) {
    auto handle = utils::Trim(value);
    if (!handle.empty() && handle.front() == '@') {
        handle.erase(0, 1);
    }
    return utils::ToLower(handle);
}

}  // namespace

SenderIdentity SenderIdentity::Parse(const std::string& sender_id) {
    SenderIdentity identity;
    const auto pipe = sender_id.find('|');
    identity.id = utils::Trim(sender_id.substr(0, pipe));
    if (pipe != std::string::npos) {
        identity.username = utils::Trim(sender_id.substr(pipe + 1));
    }
    return identity;
}

ChannelBase::ChannelBase(std::string name,
                         kivybot::bus::MessageBus& bus,
                         std::vector<std::string> allow_from)
    : name_(std::move(name))
    , bus_(bus)
    , allow_from_(std::move(allow_from)) {}

bool ChannelBase::IsAllowed(const std::string& sender_id) const {
    if (allow_from_.empty()) {
        return true;
    }
    const auto sender = SenderIdentity::Parse(sender_id);
    const auto username = NormalizeHandle(sender.username);
    return std::any_of(allow_from_.begin(), allow_from_.end(), [&](const std::string& entry) {
        const auto allowed = NormalizeHandle(entry);
        if (allowed.empty()) {
            return false;
        }
        return allowed == sender.id || (!username.empty() && allowed == username);
    });
}

InboundVerdict ChannelBase::HandleMessage(
    const std::string& sender_id,
    const std::string& chat_id,
    const std::string& content,
    const std::unordered_map<std::string, std::string>& metadata) {
    const auto sender = SenderIdentity::Parse(sender_id);
    if (!self_id_.empty() && sender.id == self_id_) {
        return InboundVerdict::kOwnMessage;
    }
    if (!IsAllowed(sender_id)) {
        utils::LogWarn("channel", "message from " + sender_id + " on " + name_ + " blocked by allowFrom");
        return InboundVerdict::kNotAllowed;
    }
    auto text = utils::Trim(content);
    if (text.empty()) {
        return InboundVerdict::kEmpty;
    }

    kivybot::bus::InboundMessage msg{};
    msg.channel = name_;
    msg.sender_id = sender_id;
    msg.chat_id = chat_id;
    msg.content = std::move(text);
    msg.metadata = metadata;
    if (!sender.username.empty()) {
        msg.metadata.emplace("username", sender.username);
    }
    bus_.PublishInbound(msg);
    return InboundVerdict::kPublished;
}

}  // namespace kivybot::channels
