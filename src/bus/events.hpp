#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace kivybot::bus {

struct InboundMessage {
    std::string channel;
    std::string sender_id;
    std::string chat_id;
    std::string content;
    std::unordered_map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::string MetadataOr(const std::string& key, const std::string& fallback) const {
        auto it = metadata.find(key);
        return it == metadata.end() ? fallback : it->second;
    }
};

// `media` holds local file paths to attach, in order.
struct OutboundMessage {
    std::string channel;
    std::string chat_id;
    std::string content;
    std::string reply_to;
    std::vector<std::string> media;
    std::unordered_map<std::string, std::string> metadata;
};

}  // namespace kivybot::bus
