#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include "engine/engine.hpp"
#include "engine/tar_archive.hpp"
#include "utils/common.hpp"

namespace kivybot::testutil {

struct FakeContainer {
    std::string id;
    engine::ContainerSpec spec;
    bool running = false;
    bool removed = false;
    std::map<std::string, std::string> files;
    // "<pid>\t<cmdline>" entries beyond the image baseline.
    std::vector<std::string> extra_processes;
};

// In-memory container engine running on the test's io_context. Recognises the
// commands the orchestrator issues (work dir reset, script run, process listing,
// kill) and simulates them against per-container state.
class FakeEngine : public engine::Engine {
public:
    explicit FakeEngine(boost::asio::any_io_executor executor)
        : executor_(std::move(executor)) {}

    // knobs
    std::set<int> failing_creates;
    bool fail_cold_create = false;
    bool fail_run = false;
    bool run_hangs = false;
    std::chrono::milliseconds run_delay{0};
    bool write_artifact = true;
    std::string artifact_data = "\x89PNG fake image";
    bool leak_process = false;
    bool start_hangs = false;
    int kill_exit_code = 0;
    std::vector<std::string> run_output = {"[INFO   ] [Kivy        ] v2.3.0", "🚀 Starting user code..."};

    // observations
    std::map<std::string, FakeContainer> containers;
    int create_calls = 0;
    int run_count = 0;
    int cold_runs = 0;
    std::vector<std::string> killed_pids;
    std::vector<std::string> kill_commands;
    std::vector<std::vector<std::string>> work_files_at_run;
    std::set<std::string> running_on;
    bool overlap_detected = false;
    bool closed = false;

    std::string AddLeftover(const std::map<std::string, std::string>& labels, const std::string& name) {
        engine::ContainerSpec spec;
        spec.name = name;
        spec.labels = labels;
        const auto id = NextId();
        containers[id] = FakeContainer{id, spec, true, false, {}, {}};
        return id;
    }

    std::vector<std::string> LiveWithLabels(const std::map<std::string, std::string>& labels) const {
        std::vector<std::string> ids;
        for (const auto& [id, container] : containers) {
            if (!container.removed && Matches(container, labels)) {
                ids.push_back(id);
            }
        }
        return ids;
    }

    void Ping(const engine::CallOptions&, engine::Yield) override {
        EnsureOpen();
    }

    std::string CreateContainer(const engine::ContainerSpec& spec,
                                const engine::CallOptions&,
                                engine::Yield) override {
        EnsureOpen();
        const int index = create_calls++;
        if (failing_creates.count(index) > 0 || (spec.auto_remove && fail_cold_create)) {
            throw engine::EngineError("create refused", 500);
        }
        for (const auto& [id, container] : containers) {
            if (!spec.name.empty() && !container.removed && container.spec.name == spec.name) {
                throw engine::EngineError("name " + spec.name + " already in use", 409);
            }
        }
        const auto id = NextId();
        containers[id] = FakeContainer{id, spec, false, false, {}, {}};
        return id;
    }

    void StartContainer(const std::string& id, const engine::CallOptions& options, engine::Yield yield) override {
        Find(id);
        if (start_hangs) {
            Sleep(std::chrono::hours(1), options, yield);
        }
        Find(id).running = true;
    }

    void StopContainer(const std::string& id, int, const engine::CallOptions&, engine::Yield) override {
        Find(id).running = false;
    }

    void KillContainer(const std::string& id, const engine::CallOptions&, engine::Yield) override {
        auto& container = Find(id);
        if (!container.running) {
            throw engine::EngineError("container is not running", 409);
        }
        container.running = false;
        if (container.spec.auto_remove) {
            container.removed = true;
        }
    }

    void RemoveContainer(const std::string& id, bool, const engine::CallOptions&, engine::Yield) override {
        auto it = containers.find(id);
        if (it != containers.end()) {
            it->second.running = false;
            it->second.removed = true;
        }
    }

    std::vector<engine::ContainerSummary> ListContainers(const std::map<std::string, std::string>& labels,
                                                         const engine::CallOptions&,
                                                         engine::Yield) override {
        EnsureOpen();
        std::vector<engine::ContainerSummary> result;
        for (const auto& [id, container] : containers) {
            if (!container.removed && Matches(container, labels)) {
                result.push_back({id, {"/" + container.spec.name}, container.running ? "running" : "created",
                                  container.spec.labels});
            }
        }
        return result;
    }

    void PutArchive(const std::string& id,
                    const std::string& dest_dir,
                    const std::string& tar,
                    const engine::CallOptions&,
                    engine::Yield) override {
        auto& container = Find(id);
        for (const auto& entry : engine::TarArchive::Parse(tar)) {
            container.files[dest_dir + "/" + entry.name] = entry.data;
        }
    }

    std::optional<std::string> GetArchive(const std::string& id,
                                          const std::string& path,
                                          const engine::CallOptions&,
                                          engine::Yield) override {
        auto& container = Find(id);
        auto it = container.files.find(path);
        if (it == container.files.end()) {
            return std::nullopt;
        }
        engine::TarArchive archive;
        archive.AddFile(std::filesystem::path(path).filename().string(), it->second);
        return archive.Finish();
    }

    engine::ExecResult Exec(const std::string& id,
                            const engine::ExecSpec& spec,
                            const engine::LineHandler& on_line,
                            const engine::CallOptions& options,
                            engine::Yield yield) override {
        auto& container = Find(id);
        const auto command = utils::Join(spec.cmd, " ");
        engine::ExecResult result;
        result.exit_code = 0;

        if (command.find("rm -rf") != std::string::npos) {
            for (auto it = container.files.begin(); it != container.files.end();) {
                it = it->first.rfind("/work/", 0) == 0 ? container.files.erase(it) : std::next(it);
            }
            return result;
        }
        if (command.find("/proc/") != std::string::npos) {
            const std::vector<std::string> baseline = {
                "1\t/bin/sh /entrypoint.sh",
                "7\tXvfb :99 -screen 0 800x600x24 -nolisten tcp -br",
                "9\ttail -f /dev/null"
            };
            for (const auto& line : baseline) {
                Emit(on_line, line);
            }
            for (const auto& line : container.extra_processes) {
                Emit(on_line, line);
            }
            return result;
        }
        // The sandbox image has no kill binary, only the shell builtin.
        if (!spec.cmd.empty() && spec.cmd.front() == "kill") {
            result.exit_code = 127;
            return result;
        }
        if (spec.cmd.size() == 3 && spec.cmd[0] == "/bin/sh" && spec.cmd[2].rfind("kill ", 0) == 0) {
            kill_commands.push_back(spec.cmd[2]);
            if (kill_exit_code != 0) {
                result.exit_code = kill_exit_code;
                return result;
            }
            std::istringstream args(spec.cmd[2].substr(5));
            std::string pid;
            while (args >> pid) {
                if (pid.rfind("-", 0) == 0) {
                    continue;
                }
                killed_pids.push_back(pid);
                auto& procs = container.extra_processes;
                procs.erase(std::remove_if(procs.begin(), procs.end(), [&](const std::string& entry) {
                    return entry.rfind(pid + "\t", 0) == 0;
                }), procs.end());
            }
            return result;
        }
        if (command.find("main.py") != std::string::npos) {
            return RunScript(container, on_line, options, yield, "/work");
        }
        result.exit_code = 127;
        return result;
    }

    void FollowLogs(const std::string& id,
                    const engine::LineHandler& on_line,
                    const engine::CallOptions& options,
                    engine::Yield yield) override {
        auto& container = Find(id);
        ++cold_runs;
        std::string host_dir;
        for (const auto& mount : container.spec.binds) {
            if (mount.container_path == "/work") {
                host_dir = mount.host_path;
            }
        }
        for (const auto& line : run_output) {
            Emit(on_line, line);
        }
        Wait(options, yield);
        if (write_artifact && !host_dir.empty()) {
            std::ofstream output(std::filesystem::path(host_dir) / ArtifactFromEnv(container.spec.env),
                                 std::ios::binary);
            output << artifact_data;
        }
        container.running = false;
        if (container.spec.auto_remove) {
            container.removed = true;
        }
    }

    void Close() override {
        closed = true;
    }

private:
    engine::ExecResult RunScript(FakeContainer& container,
                                 const engine::LineHandler& on_line,
                                 const engine::CallOptions& options,
                                 engine::Yield yield,
                                 const std::string& work_dir) {
        ++run_count;
        std::vector<std::string> present;
        for (const auto& [path, data] : container.files) {
            if (path.rfind(work_dir + "/", 0) == 0) {
                present.push_back(path);
            }
        }
        work_files_at_run.push_back(present);

        if (!running_on.insert(container.id).second) {
            overlap_detected = true;
        }
        container.extra_processes.push_back("42\t" + std::string("/app/.venv/bin/python main.py"));
        const auto id = container.id;
        struct RunningGuard {
            FakeEngine& self;
            std::string id;
            ~RunningGuard() { self.running_on.erase(id); }
        } guard{*this, id};

        if (fail_run) {
            throw engine::EngineError("exec failed", 500);
        }
        for (const auto& line : run_output) {
            Emit(on_line, line);
        }
        Wait(options, yield);

        auto& after = Find(id);
        if (!leak_process) {
            auto& procs = after.extra_processes;
            procs.erase(std::remove(procs.begin(), procs.end(), "42\t/app/.venv/bin/python main.py"), procs.end());
        }
        if (write_artifact) {
            after.files[work_dir + "/kivy_screenshot.png"] = artifact_data;
        }
        engine::ExecResult result;
        result.exit_code = 0;
        return result;
    }

    // Sleeps for run_delay, or until cancelled when run_hangs is set.
    void Wait(const engine::CallOptions& options, engine::Yield yield) {
        if (!run_hangs && run_delay.count() <= 0) {
            return;
        }
        const std::chrono::nanoseconds duration = run_hangs ? std::chrono::nanoseconds(std::chrono::hours(1))
                                                            : std::chrono::nanoseconds(run_delay);
        Sleep(duration, options, yield);
    }

    void Sleep(std::chrono::nanoseconds duration, const engine::CallOptions& options, engine::Yield yield) {
        boost::asio::steady_timer timer(executor_);
        timer.expires_after(duration);
        engine::CancellationRegistration registration(options.cancel, [&timer]() {
            timer.cancel();
        });
        boost::system::error_code ec;
        timer.async_wait(yield[ec]);
        if (options.cancel) {
            options.cancel->ThrowIfCancelled();
        }
    }

    static std::string ArtifactFromEnv(const std::vector<std::string>& env) {
        for (const auto& entry : env) {
            if (entry.rfind("OUT=", 0) == 0) {
                return std::filesystem::path(entry.substr(4)).filename().string();
            }
        }
        return "kivy_screenshot.png";
    }

    static bool Matches(const FakeContainer& container, const std::map<std::string, std::string>& labels) {
        for (const auto& [key, value] : labels) {
            auto it = container.spec.labels.find(key);
            if (it == container.spec.labels.end() || it->second != value) {
                return false;
            }
        }
        return true;
    }

    static void Emit(const engine::LineHandler& on_line, const std::string& line) {
        if (on_line) {
            on_line(line);
        }
    }

    FakeContainer& Find(const std::string& id) {
        auto it = containers.find(id);
        if (it == containers.end() || it->second.removed) {
            throw engine::EngineError("no such container: " + id, 404);
        }
        return it->second;
    }

    void EnsureOpen() const {
        if (closed) {
            throw engine::EngineError("engine connection closed");
        }
    }

    std::string NextId() {
        return "fake" + std::to_string(++next_id_) + "0000000000000";
    }

    boost::asio::any_io_executor executor_;
    int next_id_ = 0;
};

// Spawns `fn` as a coroutine and runs the loop until all work is done.
template <typename Fn>
void RunCoroutine(boost::asio::io_context& io, Fn&& fn) {
    boost::asio::spawn(io, std::forward<Fn>(fn));
    io.run();
    io.restart();
}

}  // namespace kivybot::testutil
