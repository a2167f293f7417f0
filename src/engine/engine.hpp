#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/spawn.hpp>

#include "engine/cancellation.hpp"

namespace kivybot::engine {

using Yield = boost::asio::yield_context;

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message, int status = 0)
        : std::runtime_error(message)
        , status_(status) {}

    int Status() const { return status_; }

private:
    int status_ = 0;
};

struct Mount {
    std::string host_path;
    std::string container_path;
    bool read_only = false;
};

struct Ulimit {
    std::string name;
    std::int64_t soft = 0;
    std::int64_t hard = 0;
};

struct ContainerSpec {
    std::string image;
    std::string name;
    std::vector<std::string> cmd;
    std::vector<std::string> env;
    std::string working_dir;
    std::map<std::string, std::string> labels;
    std::int64_t memory_bytes = 0;
    std::int64_t cpu_quota = 0;
    bool network_disabled = true;
    bool auto_remove = false;
    std::map<std::string, std::string> tmpfs;
    std::vector<Ulimit> ulimits;
    std::vector<std::string> security_opt;
    std::vector<Mount> binds;
};

struct ContainerSummary {
    std::string id;
    std::vector<std::string> names;
    std::string state;
    std::map<std::string, std::string> labels;
};

struct ExecSpec {
    std::vector<std::string> cmd;
    std::vector<std::string> env;
    std::string working_dir;
};

struct ExecResult {
    std::optional<int> exit_code;
};

struct CallOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
    CancellationToken* cancel = nullptr;
};

using LineHandler = std::function<void(const std::string&)>;

// Container engine boundary. Every call suspends the calling coroutine only; failures
// throw EngineError, a fired CancellationToken throws OperationCancelled.
class Engine {
public:
    virtual ~Engine() = default;

    virtual void Ping(const CallOptions& options, Yield yield) = 0;

    virtual std::string CreateContainer(const ContainerSpec& spec, const CallOptions& options, Yield yield) = 0;
    virtual void StartContainer(const std::string& id, const CallOptions& options, Yield yield) = 0;
    virtual void StopContainer(const std::string& id, int grace_seconds, const CallOptions& options, Yield yield) = 0;
    virtual void KillContainer(const std::string& id, const CallOptions& options, Yield yield) = 0;
    virtual void RemoveContainer(const std::string& id, bool force, const CallOptions& options, Yield yield) = 0;
    virtual std::vector<ContainerSummary> ListContainers(const std::map<std::string, std::string>& labels,
                                                         const CallOptions& options,
                                                         Yield yield) = 0;

    // `tar` is an uncompressed tar stream extracted under `dest_dir`.
    virtual void PutArchive(const std::string& id,
                            const std::string& dest_dir,
                            const std::string& tar,
                            const CallOptions& options,
                            Yield yield) = 0;
    // Tar stream of `path`, or nullopt when the path does not exist.
    virtual std::optional<std::string> GetArchive(const std::string& id,
                                                  const std::string& path,
                                                  const CallOptions& options,
                                                  Yield yield) = 0;

    // Runs a command and feeds combined stdout/stderr to `on_line` as it arrives.
    virtual ExecResult Exec(const std::string& id,
                            const ExecSpec& spec,
                            const LineHandler& on_line,
                            const CallOptions& options,
                            Yield yield) = 0;

    // Follows container output until the container exits.
    virtual void FollowLogs(const std::string& id,
                            const LineHandler& on_line,
                            const CallOptions& options,
                            Yield yield) = 0;

    virtual void Close() = 0;
};

}  // namespace kivybot::engine
