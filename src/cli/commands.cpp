#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include "bus/message_bus.hpp"
#include "channels/channel_manager.hpp"
#include "config/config_loader.hpp"
#include "engine/docker_engine.hpp"
#include "gateway/render_gateway.hpp"
#include "inspect/code_inspector.hpp"
#include "metrics/result_sink.hpp"
#include "render/execution_orchestrator.hpp"
#include "render/render_service.hpp"
#include "sandbox/sandbox_pool.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void ApplyLogging(const kivybot::config::Config& config) {
    kivybot::utils::LogConfig log_config;
    log_config.min_level = kivybot::utils::ParseLogLevel(config.logging.level);
    kivybot::utils::SetLogConfig(log_config);
}

// Engine, pool and render pipeline sharing one io_context.
struct RenderStack {
    RenderStack(boost::asio::io_context& io, const kivybot::config::Config& config)
        : sink(config.metrics.db_path)
        , engine(io.get_executor(), config.engine)
        , pool(io.get_executor(), engine, config.pool, std::chrono::milliseconds(config.engine.request_timeout_ms))
        , templates(config.render.templates_dir)
        , orchestrator(io.get_executor(), engine, pool, templates, sink, config.render, config.pool,
                       std::chrono::milliseconds(config.engine.request_timeout_ms))
        , inspector(config.inspector.reject_dangerous_code)
        , service(inspector, orchestrator, config.render) {}

    kivybot::metrics::ResultSink sink;
    kivybot::engine::DockerEngine engine;
    kivybot::sandbox::SandboxPool pool;
    kivybot::render::TemplateStore templates;
    kivybot::render::ExecutionOrchestrator orchestrator;
    kivybot::inspect::CodeInspector inspector;
    kivybot::render::RenderService service;
};

void PingEngine(kivybot::engine::Engine& engine, std::chrono::milliseconds timeout, kivybot::engine::Yield yield) {
    kivybot::engine::CallOptions options;
    options.timeout = timeout;
    try {
        engine.Ping(options, yield);
        kivybot::utils::LogInfo("gateway", "container engine reachable");
    } catch (const std::exception& ex) {
        kivybot::utils::LogWarn("gateway", std::string("container engine ping failed: ") + ex.what());
    }
}

int RunGateway() {
    const auto config = kivybot::config::LoadConfig();
    ApplyLogging(config);

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);
    RenderStack stack(io, config);
    kivybot::bus::MessageBus bus;
    kivybot::gateway::RenderGateway gateway(io, bus, stack.service, stack.sink, config.render);
    kivybot::channels::ChannelManager channels(config, bus);

    const auto request_timeout = std::chrono::milliseconds(config.engine.request_timeout_ms);
    boost::asio::spawn(io, [&stack, request_timeout](kivybot::engine::Yield yield) {
        PingEngine(stack.engine, request_timeout, yield);
        stack.pool.Initialize(yield);
    });

    httplib::Server http_server;
    http_server.Get("/metrics", [&stack](const httplib::Request&, httplib::Response& res) {
        res.set_content(kivybot::metrics::ToJson(stack.sink.Snapshot()).dump(2), "application/json");
    });
    http_server.Get("/stats", [&stack](const httplib::Request&, httplib::Response& res) {
        res.set_content(kivybot::metrics::FormatStats(stack.sink.Snapshot()), "text/plain");
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::thread io_thread([&io]() {
        try {
            io.run();
        } catch (const std::exception& ex) {
            kivybot::utils::LogError("gateway", std::string("event loop stopped: ") + ex.what());
        }
    });
    std::thread gateway_thread([&gateway]() { gateway.Run(); });
    std::thread http_thread;
    if (config.metrics.http_enabled) {
        const auto host = config.metrics.http_host;
        const auto port = config.metrics.http_port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                kivybot::utils::LogError("gateway", "metrics http server failed to listen on " + host + ":"
                                                        + std::to_string(port));
            }
        });
    }
    channels.StartAll();

    std::cout << "kivybot gateway started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    kivybot::utils::LogInfo("gateway", "shutting down");

    channels.StopAll();
    gateway.Stop();
    if (gateway_thread.joinable()) {
        gateway_thread.join();
    }
    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }

    auto drained = std::make_shared<std::promise<void>>();
    auto drained_future = drained->get_future();
    boost::asio::spawn(io, [&stack, drained](kivybot::engine::Yield yield) {
        stack.pool.Drain(yield);
        drained->set_value();
    });
    if (drained_future.wait_for(std::chrono::seconds(60)) != std::future_status::ready) {
        kivybot::utils::LogWarn("gateway", "pool drain did not finish in time");
    }

    work.reset();
    io.stop();
    if (io_thread.joinable()) {
        io_thread.join();
    }
    stack.sink.Close();
    return 0;
}

int RunRender(const std::string& file, const std::string& mode_name) {
    const auto config = kivybot::config::LoadConfig();
    ApplyLogging(config);

    const auto mode = kivybot::render::ParseRenderMode(mode_name);
    if (!mode) {
        std::cout << "Unknown render mode: " << mode_name << " (expected screenshot or video)" << std::endl;
        return 1;
    }
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        std::cout << "Cannot read " << file << std::endl;
        return 1;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto text = buffer.str();
    if (text.find("```") == std::string::npos) {
        text = "```python\n" + text + "\n```";
    }

    boost::asio::io_context io;
    RenderStack stack(io, config);
    int exit_code = 1;
    const auto job_key = "cli-" + std::filesystem::path(file).stem().string();
    boost::asio::spawn(io, [&](kivybot::engine::Yield yield) {
        try {
            const auto outcome = stack.service.Submit(text, *mode, job_key, yield);
            std::cout << kivybot::render::ToString(outcome.status) << ": " << outcome.message << std::endl;
            for (const auto& line : outcome.log_lines) {
                std::cout << "  | " << line << std::endl;
            }
            if (outcome.Succeeded()) {
                std::ofstream output(outcome.artifact_name, std::ios::binary | std::ios::trunc);
                output << *outcome.artifact_bytes;
                std::cout << "wrote " << outcome.artifact_name << " (" << *outcome.artifact_size_bytes
                          << " bytes)" << std::endl;
                exit_code = 0;
            }
        } catch (const kivybot::render::InputError& ex) {
            std::cout << ex.what() << std::endl;
        }
        stack.engine.Close();
    });
    io.run();
    return exit_code;
}

int RunStats() {
    const auto config = kivybot::config::LoadConfig();
    ApplyLogging(config);
    kivybot::metrics::ResultSink sink(config.metrics.db_path);
    std::cout << kivybot::metrics::FormatStats(sink.Snapshot()) << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: kivybot_cli gateway | kivybot_cli render <file> [screenshot|video] | kivybot_cli stats"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "gateway") {
        return RunGateway();
    }
    if (command == "render" && argc >= 3) {
        return RunRender(argv[2], argc >= 4 ? argv[3] : "screenshot");
    }
    if (command == "stats") {
        return RunStats();
    }
    PrintUsage();
    return 1;
}
