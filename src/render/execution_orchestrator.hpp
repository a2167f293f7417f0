#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include "config/config_schema.hpp"
#include "engine/engine.hpp"
#include "metrics/result_sink.hpp"
#include "render/render_types.hpp"
#include "render/script_assembler.hpp"
#include "sandbox/sandbox_pool.hpp"

namespace kivybot::render {

// Shell loop printing "<pid>\t<cmdline>" for every process except itself.
extern const char* const kProcessListingCommand;

// Pids from a process listing whose command line is not an exact baseline entry.
// Pid 1 and the listing shell are never selected.
std::vector<std::string> SelectOrphans(const std::vector<std::string>& listing,
                                       const std::vector<std::string>& baseline);

// Per-job driver. Prefers a pooled handle and falls back once to a disposable
// container. Execute never throws and always records exactly one attempt, one
// success-or-failure and one duration.
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(boost::asio::any_io_executor executor,
                          engine::Engine& engine,
                          sandbox::SandboxPool& pool,
                          TemplateStore& templates,
                          metrics::ResultSink& sink,
                          config::RenderConfig config,
                          config::PoolConfig hardening,
                          std::chrono::milliseconds request_timeout);

    RenderOutcome Execute(const RenderJob& job, engine::Yield yield);

    const config::RenderConfig& Config() const { return config_; }
    std::filesystem::path ScratchDirFor(const std::string& job_key) const;

private:
    RenderOutcome Dispatch(const RenderJob& job, engine::Yield yield);
    RenderOutcome RunPooled(const RenderJob& job, const sandbox::SandboxHandle& handle, engine::Yield yield);
    RenderOutcome RunCold(const RenderJob& job, engine::Yield yield);

    void ResetWorkDir(const sandbox::SandboxHandle& handle, const engine::CallOptions& options, engine::Yield yield);
    void CleanupOrphans(const sandbox::SandboxHandle& handle, engine::Yield yield);
    void KillDisposable(const std::string& id, engine::Yield yield);

    RenderOutcome Judge(const RenderJob& job,
                        ExecutionPath path,
                        std::optional<std::string> artifact,
                        std::vector<std::string> logs) const;
    RenderOutcome TooLarge(const RenderJob& job, ExecutionPath path, std::int64_t size) const;
    RenderOutcome TimedOut(ExecutionPath path, std::vector<std::string> logs) const;

    std::string PooledRunCommand() const;
    std::string ColdRunCommand() const;
    std::chrono::steady_clock::time_point OuterDeadline(const RenderJob& job) const;

    boost::asio::any_io_executor executor_;
    engine::Engine& engine_;
    sandbox::SandboxPool& pool_;
    TemplateStore& templates_;
    metrics::ResultSink& sink_;
    config::RenderConfig config_;
    config::PoolConfig hardening_;
    std::chrono::milliseconds request_timeout_;
};

}  // namespace kivybot::render
