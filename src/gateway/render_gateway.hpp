#pragma once

#include <atomic>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "bus/message_bus.hpp"
#include "config/config_schema.hpp"
#include "metrics/result_sink.hpp"
#include "render/render_service.hpp"

namespace kivybot::gateway {

enum class CommandKind {
    kRender,
    kStats,
    kPing,
    kIgnore
};

struct ChatCommand {
    CommandKind kind = CommandKind::kIgnore;
    render::RenderMode mode = render::RenderMode::kScreenshot;
    std::string body;
    // Explicit /render or /video; such requests always get a reply.
    bool addressed = false;
};

// "/stats", "/ping", "/render <code>", "/video <code>", or a bare message holding a
// fenced block. Anything else is ignored.
ChatCommand ParseChatCommand(const std::string& text);

// Consumes inbound chat messages and runs each render as its own coroutine on the
// io_context; replies go back through the bus.
class RenderGateway {
public:
    RenderGateway(boost::asio::io_context& io,
                  bus::MessageBus& bus,
                  render::RenderService& service,
                  metrics::ResultSink& sink,
                  const config::RenderConfig& config);

    void Run();
    void Stop();

    void Handle(const bus::InboundMessage& msg);

private:
    void RenderAndReply(const bus::InboundMessage& msg, const ChatCommand& command, engine::Yield yield);
    bus::OutboundMessage ReplyTo(const bus::InboundMessage& msg, std::string content) const;
    std::string WriteAttachment(const std::string& job_key, const std::string& name, const std::string& data) const;

    boost::asio::io_context& io_;
    bus::MessageBus& bus_;
    render::RenderService& service_;
    metrics::ResultSink& sink_;
    config::RenderConfig config_;
    std::atomic<bool> running_{false};
};

}  // namespace kivybot::gateway
