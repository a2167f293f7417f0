#include "gateway/render_gateway.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <boost/asio/spawn.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kivybot::gateway {
namespace {

// "/cmd" or "/cmd@botname" at the start of `text`; returns the remainder.
std::optional<std::string> StripCommand(const std::string& text, const std::string& command) {
    if (text.rfind(command, 0) != 0) {
        return std::nullopt;
    }
    auto rest = text.substr(command.size());
    if (!rest.empty() && rest.front() == '@') {
        const auto end = rest.find_first_of(" \t\n");
        rest = end == std::string::npos ? std::string() : rest.substr(end);
    } else if (!rest.empty() && !std::isspace(static_cast<unsigned char>(rest.front()))) {
        return std::nullopt;
    }
    return utils::Trim(rest);
}

std::string Seconds(std::int64_t millis) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(millis) / 1000.0;
    return oss.str();
}

}  // namespace

ChatCommand ParseChatCommand(const std::string& text) {
    ChatCommand command;
    const auto trimmed = utils::Trim(text);
    if (StripCommand(trimmed, "/stats")) {
        command.kind = CommandKind::kStats;
        return command;
    }
    if (StripCommand(trimmed, "/ping")) {
        command.kind = CommandKind::kPing;
        return command;
    }
    if (auto body = StripCommand(trimmed, "/video")) {
        command.kind = CommandKind::kRender;
        command.mode = render::RenderMode::kVideo;
        command.body = *body;
        command.addressed = true;
        return command;
    }
    if (auto body = StripCommand(trimmed, "/render")) {
        command.kind = CommandKind::kRender;
        command.body = *body;
        command.addressed = true;
        return command;
    }
    if (trimmed.find("```") != std::string::npos) {
        command.kind = CommandKind::kRender;
        command.body = trimmed;
    }
    return command;
}

RenderGateway::RenderGateway(boost::asio::io_context& io,
                             bus::MessageBus& bus,
                             render::RenderService& service,
                             metrics::ResultSink& sink,
                             const config::RenderConfig& config)
    : io_(io)
    , bus_(bus)
    , service_(service)
    , sink_(sink)
    , config_(config) {}

void RenderGateway::Run() {
    running_ = true;
    while (running_) {
        bus::InboundMessage msg{};
        if (!bus_.TryConsumeInbound(msg, std::chrono::milliseconds(1000))) {
            continue;
        }
        try {
            Handle(msg);
        } catch (const std::exception& ex) {
            utils::LogError("gateway", std::string("failed to handle message: ") + ex.what());
            bus_.PublishOutbound(ReplyTo(msg, std::string("Sorry, I encountered an error: ") + ex.what()));
        }
    }
}

void RenderGateway::Stop() {
    running_ = false;
}

void RenderGateway::Handle(const bus::InboundMessage& msg) {
    const auto command = ParseChatCommand(msg.content);
    switch (command.kind) {
        case CommandKind::kStats:
            bus_.PublishOutbound(ReplyTo(msg, "```\n" + metrics::FormatStats(sink_.Snapshot()) + "\n```"));
            return;
        case CommandKind::kPing:
            bus_.PublishOutbound(ReplyTo(msg, "pong"));
            return;
        case CommandKind::kIgnore:
            return;
        case CommandKind::kRender:
            break;
    }
    boost::asio::spawn(io_, [this, msg, command](engine::Yield yield) {
        RenderAndReply(msg, command, yield);
    });
}

void RenderGateway::RenderAndReply(const bus::InboundMessage& msg, const ChatCommand& command, engine::Yield yield) {
    const auto stamp = std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        msg.timestamp.time_since_epoch()).count());
    const auto job_key = msg.channel + "-" + msg.chat_id + "-" + msg.MetadataOr("message_id", stamp);

    render::RenderOutcome outcome;
    try {
        outcome = service_.Submit(command.body, command.mode, job_key, yield);
    } catch (const render::InputError& e) {
        if (command.addressed || e.GetReason() == render::InputError::Reason::kRejected) {
            bus_.PublishOutbound(ReplyTo(msg, e.what()));
        } else {
            utils::LogDebug("gateway", "ignoring message " + job_key + ": " + e.what());
        }
        return;
    } catch (const std::exception& e) {
        utils::LogError("gateway", "render " + job_key + " failed: " + e.what());
        bus_.PublishOutbound(ReplyTo(msg, std::string("Sorry, rendering failed: ") + e.what()));
        return;
    }

    auto reply = ReplyTo(msg, "");
    try {
        switch (outcome.status) {
            case render::OutcomeStatus::kSuccess:
                reply.content = outcome.message + " (" + Seconds(outcome.duration_ms) + "s)";
                reply.media.push_back(WriteAttachment(job_key, outcome.artifact_name, *outcome.artifact_bytes));
                break;
            case render::OutcomeStatus::kTimeout:
                reply.content = outcome.message;
                reply.media.push_back(WriteAttachment(job_key, "timeout_logs.txt",
                    outcome.log_lines.empty() ? "No logs collected before timeout"
                                              : utils::Join(outcome.log_lines, "\n")));
                break;
            case render::OutcomeStatus::kFailure:
                reply.content = outcome.message;
                if (!outcome.log_lines.empty()) {
                    reply.media.push_back(WriteAttachment(job_key, "kivy_logs.txt", utils::Join(outcome.log_lines, "\n")));
                }
                break;
        }
    } catch (const std::exception& e) {
        utils::LogError("gateway", "failed to store attachment for " + job_key + ": " + e.what());
        reply.media.clear();
    }
    bus_.PublishOutbound(reply);
}

bus::OutboundMessage RenderGateway::ReplyTo(const bus::InboundMessage& msg, std::string content) const {
    bus::OutboundMessage outbound{};
    outbound.channel = msg.channel;
    outbound.chat_id = msg.chat_id;
    outbound.reply_to = msg.MetadataOr("message_id", "");
    outbound.content = std::move(content);
    return outbound;
}

std::string RenderGateway::WriteAttachment(const std::string& job_key,
                                           const std::string& name,
                                           const std::string& data) const {
    const auto dir = std::filesystem::path(config_.runs_dir) / (job_key + "-out");
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path.string();
}

}  // namespace kivybot::gateway
