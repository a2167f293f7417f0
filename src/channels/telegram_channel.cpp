#include "channels/telegram_channel.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <vector>

#include <tgbot/net/CurlHttpClient.h>

#include "utils/logging.hpp"

namespace kivybot::channels {
namespace {

constexpr const char* kGreeting =
    "Hi! Send me a Kivy app in a ```python code block and I'll reply with a screenshot.\n"
    "Prefix it with /video for a short recording. /stats shows render statistics.";

std::string EscapeHtml(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    for (const auto ch : input) {
        switch (ch) {
            case '&': output += "&amp;"; break;
            case '<': output += "&lt;"; break;
            case '>': output += "&gt;"; break;
            default: output.push_back(ch); break;
        }
    }
    return output;
}

}  // namespace

TelegramChannel::TelegramChannel(const kivybot::config::TelegramConfig& config,
                                 kivybot::bus::MessageBus& bus)
    : ChannelBase("telegram", bus, config.allow_from)
    , config_(config) {}

void TelegramChannel::Start() {
    if (running_) {
        return;
    }
    if (config_.token.empty()) {
        utils::LogWarn("telegram", "token is empty; channel disabled");
        running_ = false;
        return;
    }
    running_ = true;
    polling_ = true;

    const bool use_curl = std::getenv("KIVYBOT_TELEGRAM_USE_CURL") != nullptr ||
                          std::getenv("HTTPS_PROXY") != nullptr ||
                          std::getenv("https_proxy") != nullptr ||
                          std::getenv("ALL_PROXY") != nullptr ||
                          std::getenv("all_proxy") != nullptr;
    if (use_curl) {
#ifdef HAVE_CURL
        http_client_ = std::make_unique<TgBot::CurlHttpClient>();
        bot_ = std::make_unique<TgBot::Bot>(config_.token, *http_client_);
        utils::LogInfo("telegram", "bot initialized with CurlHttpClient (proxy-aware)");
#else
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        utils::LogInfo("telegram", "curl not available, fallback to BoostHttpOnlySslClient");
#endif
    } else {
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        utils::LogInfo("telegram", "bot initialized with BoostHttpOnlySslClient");
    }

    bot_->getEvents().onCommand({"start", "help"}, [this](TgBot::Message::Ptr message) {
        if (!message || !message->chat) {
            return;
        }
        SendText(message->chat->id, kGreeting, 0);
    });

    bot_->getEvents().onAnyMessage([this](TgBot::Message::Ptr message) {
        if (!message || !message->from || !message->chat) {
            return;
        }
        if (message->text.rfind("/start", 0) == 0 || message->text.rfind("/help", 0) == 0) {
            return;
        }
        const auto& text = message->text.empty() ? message->caption : message->text;
        if (text.empty()) {
            return;
        }

        std::string sender_id = std::to_string(message->from->id);
        if (!message->from->username.empty()) {
            sender_id += "|" + message->from->username;
        }
        const std::string chat_id = std::to_string(message->chat->id);
        utils::LogDebug("telegram", "received message from " + sender_id + " in chat " + chat_id);

        std::unordered_map<std::string, std::string> metadata;
        metadata["message_id"] = std::to_string(message->messageId);
        metadata["user_id"] = std::to_string(message->from->id);
        metadata["username"] = message->from->username;
        metadata["is_group"] = message->chat->type != TgBot::Chat::Type::Private ? "true" : "false";
        if (HandleMessage(sender_id, chat_id, text, metadata) != InboundVerdict::kPublished) {
            utils::LogDebug("telegram", "dropped message from " + sender_id);
        }
    });

    polling_thread_ = std::make_unique<std::thread>([this]() {
        try {
            const auto me = bot_->getApi().getMe();
            if (me) {
                SetSelfId(std::to_string(me->id));
                utils::LogInfo("telegram", "logged in as @" + me->username);
            }
        } catch (const std::exception& ex) {
            utils::LogWarn("telegram", std::string("getMe failed: ") + ex.what());
        }
        long_poll_ = std::make_unique<TgBot::TgLongPoll>(*bot_, 100, 1);
        while (running_ && polling_) {
            try {
                long_poll_->start();
            } catch (const TgBot::TgException& ex) {
                utils::LogError("telegram", std::string("long poll error: ") + ex.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            } catch (const std::exception& ex) {
                utils::LogError("telegram", std::string("long poll error: ") + ex.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
    });
}

void TelegramChannel::Stop() {
    running_ = false;
    polling_ = false;
    if (polling_thread_ && polling_thread_->joinable()) {
        polling_thread_->join();
    }
    polling_thread_.reset();
    long_poll_.reset();
    bot_.reset();
    http_client_.reset();
}

void TelegramChannel::Send(const kivybot::bus::OutboundMessage& msg) {
    if (!bot_ || msg.chat_id.empty()) {
        return;
    }
    const auto chat_id = std::stoll(msg.chat_id);
    std::int32_t reply_to = 0;
    if (!msg.reply_to.empty()) {
        try {
            reply_to = static_cast<std::int32_t>(std::stol(msg.reply_to));
        } catch (const std::exception&) {
            reply_to = 0;
        }
    }
    if (!msg.content.empty()) {
        SendText(chat_id, msg.content, reply_to);
    }
    for (const auto& path : msg.media) {
        SendMedia(chat_id, path, "");
    }
}

void TelegramChannel::SendText(std::int64_t chat_id, const std::string& text, std::int32_t reply_to) {
    const auto html = ConvertMarkdownToHtml(text);
    try {
        bot_->getApi().sendMessage(chat_id, html, false, reply_to, nullptr, "HTML");
    } catch (const TgBot::TgException& ex) {
        utils::LogWarn("telegram", std::string("html send failed, retrying as plain text: ") + ex.what());
        bot_->getApi().sendMessage(chat_id, text);
    }
}

void TelegramChannel::SendMedia(std::int64_t chat_id, const std::string& path, const std::string& caption) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        utils::LogWarn("telegram", "attachment missing: " + path);
        return;
    }
    const auto mime = MimeTypeFor(path);
    const auto file = TgBot::InputFile::fromFile(path, mime);
    try {
        if (mime == "image/png") {
            bot_->getApi().sendPhoto(chat_id, file, caption);
        } else {
            bot_->getApi().sendDocument(chat_id, file, std::string(), caption);
        }
    } catch (const TgBot::TgException& ex) {
        utils::LogError("telegram", "failed to send " + path + ": " + ex.what());
    }
}

std::string TelegramChannel::ConvertMarkdownToHtml(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    static const std::regex fenced(R"(```[\w]*\n?([\s\S]*?)```)");
    static const std::regex inline_code(R"(`([^`\n]+)`)");
    static const std::regex bold(R"(\*\*(.+?)\*\*)");

    std::string result;
    std::smatch match;
    auto search_start = text.cbegin();
    while (std::regex_search(search_start, text.cend(), match, fenced)) {
        std::string prose(search_start, match[0].first);
        prose = EscapeHtml(prose);
        prose = std::regex_replace(prose, inline_code, "<code>$1</code>");
        prose = std::regex_replace(prose, bold, "<b>$1</b>");
        result += prose;
        result += "<pre>" + EscapeHtml(match[1].str()) + "</pre>";
        search_start = match[0].second;
    }
    std::string tail(search_start, text.cend());
    tail = EscapeHtml(tail);
    tail = std::regex_replace(tail, inline_code, "<code>$1</code>");
    tail = std::regex_replace(tail, bold, "<b>$1</b>");
    result += tail;
    return result;
}

std::string TelegramChannel::MimeTypeFor(const std::string& path) {
    const auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".png") return "image/png";
    if (ext == ".mp4") return "video/mp4";
    if (ext == ".txt") return "text/plain";
    return "application/octet-stream";
}

}  // namespace kivybot::channels
