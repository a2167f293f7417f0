#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

#include <tgbot/tgbot.h>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace kivybot::channels {

class TelegramChannel : public ChannelBase {
public:
    TelegramChannel(const kivybot::config::TelegramConfig& config,
                    kivybot::bus::MessageBus& bus);
    void Start() override;
    void Stop() override;
    void Send(const kivybot::bus::OutboundMessage& msg) override;

    // Escapes HTML and turns fenced and inline code into <pre>/<code>.
    static std::string ConvertMarkdownToHtml(const std::string& text);
    static std::string MimeTypeFor(const std::string& path);

private:
    void SendText(std::int64_t chat_id, const std::string& text, std::int32_t reply_to);
    void SendMedia(std::int64_t chat_id, const std::string& path, const std::string& caption);

    kivybot::config::TelegramConfig config_;
    std::unique_ptr<TgBot::HttpClient> http_client_;
    std::unique_ptr<TgBot::Bot> bot_;
    std::unique_ptr<TgBot::TgLongPoll> long_poll_;
    std::unique_ptr<std::thread> polling_thread_;
    std::atomic<bool> polling_{false};
};

}  // namespace kivybot::channels
