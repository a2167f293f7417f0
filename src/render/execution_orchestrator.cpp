#include "render/execution_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <fstream>
#include <sstream>

#include "engine/tar_archive.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kivybot::render {

const char* const kProcessListingCommand =
    "for p in /proc/[0-9]*; do "
    "pid=${p#/proc/}; "
    "[ \"$pid\" -eq \"$$\" ] && continue; "
    "cmd=$(tr '\\0' ' ' < \"$p/cmdline\" 2>/dev/null | sed 's/[[:space:]]*$//'); "
    "[ -z \"$cmd\" ] && continue; "
    "printf '%s\\t%s\\n' \"$pid\" \"$cmd\"; "
    "done";

namespace {

using Clock = std::chrono::steady_clock;

// Keeps the most recent lines of a run's output.
class LogBuffer {
public:
    explicit LogBuffer(std::size_t capacity)
        : capacity_(std::max<std::size_t>(capacity, 1)) {}

    engine::LineHandler Handler() {
        return [this](const std::string& line) {
            utils::LogDebug("render", "| " + line);
            lines_.push_back(line);
            if (lines_.size() > capacity_) {
                lines_.pop_front();
            }
        };
    }

    std::vector<std::string> Lines() const {
        return {lines_.begin(), lines_.end()};
    }

private:
    std::size_t capacity_;
    std::deque<std::string> lines_;
};

class LeaseGuard {
public:
    LeaseGuard(sandbox::SandboxPool& pool, sandbox::SandboxHandle handle)
        : pool_(pool)
        , handle_(std::move(handle)) {}

    ~LeaseGuard() {
        pool_.Release(handle_);
    }

    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

private:
    sandbox::SandboxPool& pool_;
    sandbox::SandboxHandle handle_;
};

engine::CallOptions CallWith(std::chrono::milliseconds timeout, engine::CancellationToken* token) {
    engine::CallOptions options;
    options.timeout = timeout;
    options.cancel = token;
    return options;
}

std::chrono::milliseconds Remaining(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

std::vector<std::string> Tail(const std::vector<std::string>& lines, int count) {
    const auto keep = static_cast<std::size_t>(std::max(count, 0));
    if (lines.size() <= keep) {
        return lines;
    }
    return {lines.end() - static_cast<std::ptrdiff_t>(keep), lines.end()};
}

bool IsDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

int ClampDimension(std::optional<int> requested, int fallback, int ceiling) {
    const int value = requested && *requested > 0 ? *requested : fallback;
    return std::min(std::max(value, 1), ceiling);
}

std::string SanitizeKey(const std::string& key) {
    std::string cleaned;
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            cleaned.push_back(static_cast<char>(c));
        }
    }
    return cleaned.empty() ? std::string("job") : cleaned;
}

}  // namespace

std::vector<std::string> SelectOrphans(const std::vector<std::string>& listing,
                                       const std::vector<std::string>& baseline) {
    std::vector<std::string> pids;
    for (const auto& entry : listing) {
        const auto tab = entry.find('\t');
        if (tab == std::string::npos) {
            continue;
        }
        const auto pid = utils::Trim(entry.substr(0, tab));
        const auto command = utils::Trim(entry.substr(tab + 1));
        if (!IsDigits(pid) || pid == "1") {
            continue;
        }
        if (command.find("/proc/[0-9]*") != std::string::npos) {
            continue;
        }
        if (std::find(baseline.begin(), baseline.end(), command) != baseline.end()) {
            continue;
        }
        pids.push_back(pid);
    }
    return pids;
}

ExecutionOrchestrator::ExecutionOrchestrator(boost::asio::any_io_executor executor,
                                             engine::Engine& engine,
                                             sandbox::SandboxPool& pool,
                                             TemplateStore& templates,
                                             metrics::ResultSink& sink,
                                             config::RenderConfig config,
                                             config::PoolConfig hardening,
                                             std::chrono::milliseconds request_timeout)
    : executor_(std::move(executor))
    , engine_(engine)
    , pool_(pool)
    , templates_(templates)
    , sink_(sink)
    , config_(std::move(config))
    , hardening_(std::move(hardening))
    , request_timeout_(request_timeout) {}

RenderOutcome ExecutionOrchestrator::Execute(const RenderJob& job, engine::Yield yield) {
    const auto started = Clock::now();
    sink_.RecordAttempt();

    RenderOutcome outcome;
    try {
        outcome = Dispatch(job, yield);
    } catch (const std::exception& e) {
        utils::LogError("render", "job " + job.job_key + " failed: " + e.what());
        outcome.status = OutcomeStatus::kFailure;
        outcome.failure = FailureKind::kEngineError;
        outcome.path = ExecutionPath::kCold;
        outcome.message = std::string("Rendering failed: ") + e.what();
    }

    const auto elapsed = Clock::now() - started;
    outcome.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (outcome.Succeeded()) {
        sink_.RecordSuccess();
        sink_.RecordArtifactBytes(outcome.artifact_size_bytes.value_or(0));
    } else {
        sink_.RecordFailure();
    }
    sink_.RecordDuration(std::chrono::duration<double>(elapsed).count());

    utils::Write(utils::LogMessage{
        outcome.Succeeded() ? utils::LogLevel::kInfo : utils::LogLevel::kWarn,
        "render",
        "job finished",
        {
            {"job", job.job_key},
            {"status", ToString(outcome.status)},
            {"path", outcome.path == ExecutionPath::kPooled ? "pooled" : "cold"},
            {"ms", std::to_string(outcome.duration_ms)}
        }
    });
    return outcome;
}

RenderOutcome ExecutionOrchestrator::Dispatch(const RenderJob& job, engine::Yield yield) {
    if (job.explicit_size) {
        utils::LogInfo("render", "job " + job.job_key + " requests its own display size; using a disposable container");
        return RunCold(job, yield);
    }

    auto handle = pool_.Lease(std::chrono::milliseconds(config_.lease_timeout_ms), yield);
    if (!handle) {
        utils::LogInfo("render", "no pooled handle for job " + job.job_key + "; using a disposable container");
        return RunCold(job, yield);
    }

    std::optional<RenderOutcome> pooled;
    {
        LeaseGuard guard(pool_, *handle);
        try {
            pooled = RunPooled(job, *handle, yield);
        } catch (const engine::OperationCancelled& e) {
            utils::LogWarn("render", "job " + job.job_key + " cancelled on " + handle->name + ": " + e.what());
            pooled = TimedOut(ExecutionPath::kPooled, {});
        } catch (const std::exception& e) {
            utils::LogWarn("render", "pooled render on " + handle->name + " failed: " + e.what()
                                         + "; falling back to a disposable container");
        }
    }
    if (pooled) {
        return *pooled;
    }
    if (Clock::now() >= job.deadline) {
        return TimedOut(ExecutionPath::kPooled, {});
    }
    return RunCold(job, yield);
}

RenderOutcome ExecutionOrchestrator::RunPooled(const RenderJob& job,
                                               const sandbox::SandboxHandle& handle,
                                               engine::Yield yield) {
    engine::CancellationToken token;
    engine::Watchdog watchdog(executor_, token);
    watchdog.ArmUntil(job.deadline, "job deadline exceeded");

    utils::LogInfo("render", "job " + job.job_key + " on pooled handle " + handle.name);
    const auto transfer = CallWith(std::chrono::milliseconds(config_.transfer_timeout_ms), &token);
    ResetWorkDir(handle, transfer, yield);

    engine::TarArchive archive;
    archive.AddFile("main.py", templates_.CreateScript(job.source_code, job.mode));
    engine_.PutArchive(handle.id, config_.work_dir, archive.Finish(), transfer, yield);

    LogBuffer logs(static_cast<std::size_t>(std::max(config_.log_tail_lines, config_.timeout_log_lines)));
    const auto outer_deadline = OuterDeadline(job);
    watchdog.ArmUntil(outer_deadline, "render timed out");

    engine::ExecSpec run;
    run.cmd = {"/bin/sh", "-c", PooledRunCommand()};
    run.env = {"DISPLAY=:99", "PYTHONUNBUFFERED=1"};
    run.working_dir = config_.work_dir;
    const auto exec_options = CallWith(Remaining(outer_deadline) + std::chrono::seconds(1), &token);

    engine::ExecResult result;
    try {
        result = engine_.Exec(handle.id, run, logs.Handler(), exec_options, yield);
    } catch (const engine::OperationCancelled&) {
        if (!watchdog.Fired()) {
            throw;
        }
        utils::LogWarn("render", "job " + job.job_key + " timed out on " + handle.name + "; killing its processes");
        CleanupOrphans(handle, yield);
        return TimedOut(ExecutionPath::kPooled, logs.Lines());
    }
    if (result.exit_code && *result.exit_code != 0) {
        utils::LogInfo("render", "job " + job.job_key + " exited with code " + std::to_string(*result.exit_code));
    }

    watchdog.ArmUntil(job.deadline, "job deadline exceeded");
    const auto extract = CallWith(std::chrono::milliseconds(config_.extract_timeout_ms), &token);
    const std::string artifact_name = ArtifactName(job.mode);
    std::optional<std::string> artifact;
    const auto tar = engine_.GetArchive(handle.id, config_.work_dir + "/" + artifact_name, extract, yield);
    if (tar) {
        artifact = engine::TarArchive::ExtractFile(*tar, artifact_name);
    }
    watchdog.Disarm();

    auto outcome = Judge(job, ExecutionPath::kPooled, std::move(artifact), logs.Lines());
    if (outcome.Succeeded()) {
        CleanupOrphans(handle, yield);
    }
    return outcome;
}

RenderOutcome ExecutionOrchestrator::RunCold(const RenderJob& job, engine::Yield yield) {
    engine::CancellationToken token;
    engine::Watchdog watchdog(executor_, token);
    watchdog.ArmUntil(job.deadline, "job deadline exceeded");

    const auto scratch = ScratchDirFor(job.job_key);
    std::filesystem::remove_all(scratch);
    std::filesystem::create_directories(scratch);
    {
        std::ofstream script(scratch / "main.py", std::ios::binary | std::ios::trunc);
        if (!script.is_open()) {
            throw std::runtime_error("cannot write script to " + scratch.string());
        }
        script << templates_.CreateScript(job.source_code, job.mode);
    }

    const int width = ClampDimension(job.requested_width, config_.default_width, config_.max_dimension);
    const int height = ClampDimension(job.requested_height, config_.default_height, config_.max_dimension);
    const std::string artifact_name = ArtifactName(job.mode);

    auto spec = sandbox::HardenedSpec(hardening_, config_.cold_image);
    spec.labels["role"] = "kivy-cold";
    spec.auto_remove = true;
    spec.cmd = {"/bin/sh", "-c", ColdRunCommand()};
    spec.env.push_back("WIDTH=" + std::to_string(width));
    spec.env.push_back("HEIGHT=" + std::to_string(height));
    spec.env.push_back("OUT=" + config_.work_dir + "/" + artifact_name);
    spec.binds.push_back({std::filesystem::absolute(scratch).string(), config_.work_dir, false});

    utils::LogInfo("render", "job " + job.job_key + " on disposable container " + std::to_string(width) + "x"
                                 + std::to_string(height));
    const auto request = CallWith(request_timeout_, &token);
    std::string id;
    try {
        id = engine_.CreateContainer(spec, request, yield);
        engine_.StartContainer(id, request, yield);
    } catch (const engine::OperationCancelled&) {
        if (!watchdog.Fired()) {
            throw;
        }
        utils::LogWarn("render", "job " + job.job_key + " ran out of time while its container was starting");
        if (!id.empty()) {
            KillDisposable(id, yield);
        }
        return TimedOut(ExecutionPath::kCold, {});
    } catch (const std::exception&) {
        if (!id.empty()) {
            KillDisposable(id, yield);
        }
        throw;
    }

    LogBuffer logs(static_cast<std::size_t>(std::max(config_.log_tail_lines, config_.timeout_log_lines)));
    const auto outer_deadline = OuterDeadline(job);
    watchdog.ArmUntil(outer_deadline, "render timed out");
    try {
        engine_.FollowLogs(id, logs.Handler(), CallWith(Remaining(outer_deadline) + std::chrono::seconds(1), &token),
                           yield);
    } catch (const engine::OperationCancelled&) {
        if (!watchdog.Fired()) {
            throw;
        }
        utils::LogWarn("render", "job " + job.job_key + " timed out; killing disposable container");
        KillDisposable(id, yield);
        return TimedOut(ExecutionPath::kCold, logs.Lines());
    }
    watchdog.Disarm();

    std::optional<std::string> artifact;
    const auto artifact_path = scratch / artifact_name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(artifact_path, ec)) {
        const auto size = std::filesystem::file_size(artifact_path, ec);
        if (!ec && static_cast<std::int64_t>(size) > config_.max_artifact_bytes) {
            // Rejected on size alone; the file is never read.
            return TooLarge(job, ExecutionPath::kCold, static_cast<std::int64_t>(size));
        }
        std::ifstream input(artifact_path, std::ios::binary);
        std::ostringstream buffer;
        buffer << input.rdbuf();
        artifact = buffer.str();
    }
    return Judge(job, ExecutionPath::kCold, std::move(artifact), logs.Lines());
}

void ExecutionOrchestrator::ResetWorkDir(const sandbox::SandboxHandle& handle,
                                         const engine::CallOptions& options,
                                         engine::Yield yield) {
    engine::ExecSpec reset;
    reset.cmd = {"/bin/sh", "-c", "rm -rf " + config_.work_dir + " && mkdir -p " + config_.work_dir};
    reset.working_dir = "/";
    const auto result = engine_.Exec(handle.id, reset, {}, options, yield);
    if (result.exit_code && *result.exit_code != 0) {
        throw engine::EngineError("work directory reset on " + handle.name + " exited with "
                                  + std::to_string(*result.exit_code));
    }
}

void ExecutionOrchestrator::CleanupOrphans(const sandbox::SandboxHandle& handle, engine::Yield yield) {
    const auto options = CallWith(std::chrono::milliseconds(config_.cleanup_timeout_ms), nullptr);
    try {
        std::vector<std::string> listing;
        engine::ExecSpec list;
        list.cmd = {"/bin/sh", "-c", kProcessListingCommand};
        engine_.Exec(handle.id, list, [&listing](const std::string& line) {
            listing.push_back(line);
        }, options, yield);

        const auto orphans = SelectOrphans(listing, config_.baseline_processes);
        if (orphans.empty()) {
            return;
        }
        // kill is a shell builtin; the slim image ships no /bin/kill.
        engine::ExecSpec kill;
        kill.cmd = {"/bin/sh", "-c", "kill -9 " + utils::Join(orphans, " ")};
        const auto result = engine_.Exec(handle.id, kill, {}, options, yield);
        if (result.exit_code && *result.exit_code != 0) {
            utils::LogWarn("render", "kill of stray processes " + utils::Join(orphans, " ") + " on " + handle.name
                                         + " exited with " + std::to_string(*result.exit_code));
            return;
        }
        utils::LogInfo("render", "killed " + std::to_string(orphans.size()) + " stray processes on " + handle.name
                                     + ": " + utils::Join(orphans, " "));
    } catch (const std::exception& e) {
        utils::LogWarn("render", "process cleanup on " + handle.name + " failed: " + e.what());
    }
}

void ExecutionOrchestrator::KillDisposable(const std::string& id, engine::Yield yield) {
    const auto options = CallWith(std::chrono::milliseconds(config_.cleanup_timeout_ms), nullptr);
    try {
        engine_.KillContainer(id, options, yield);
    } catch (const std::exception& e) {
        utils::LogWarn("render", "failed to kill " + id.substr(0, 12) + ": " + e.what());
    }
    try {
        engine_.RemoveContainer(id, true, options, yield);
    } catch (const std::exception& e) {
        utils::LogDebug("render", "remove " + id.substr(0, 12) + ": " + e.what());
    }
}

RenderOutcome ExecutionOrchestrator::Judge(const RenderJob& job,
                                           ExecutionPath path,
                                           std::optional<std::string> artifact,
                                           std::vector<std::string> logs) const {
    RenderOutcome outcome;
    outcome.path = path;
    outcome.artifact_name = ArtifactName(job.mode);
    if (!artifact) {
        outcome.status = OutcomeStatus::kFailure;
        outcome.failure = FailureKind::kArtifactMissing;
        outcome.message = job.mode == RenderMode::kVideo
            ? "No video was produced. Check the logs for errors."
            : "No screenshot was produced. Check the logs for errors.";
        outcome.log_lines = Tail(logs, config_.log_tail_lines);
        return outcome;
    }

    const auto size = static_cast<std::int64_t>(artifact->size());
    if (size > config_.max_artifact_bytes) {
        return TooLarge(job, path, size);
    }

    outcome.artifact_size_bytes = size;
    outcome.status = OutcomeStatus::kSuccess;
    outcome.message = job.mode == RenderMode::kVideo ? "Video rendered." : "Screenshot rendered.";
    outcome.artifact_bytes = std::move(artifact);
    outcome.log_lines = Tail(logs, config_.log_tail_lines);
    return outcome;
}

RenderOutcome ExecutionOrchestrator::TooLarge(const RenderJob& job, ExecutionPath path, std::int64_t size) const {
    utils::LogWarn("render", "artifact of job " + job.job_key + " is " + std::to_string(size)
                                 + " bytes (max " + std::to_string(config_.max_artifact_bytes) + "); withheld");
    RenderOutcome outcome;
    outcome.status = OutcomeStatus::kFailure;
    outcome.failure = FailureKind::kArtifactTooLarge;
    outcome.path = path;
    outcome.artifact_name = ArtifactName(job.mode);
    outcome.artifact_size_bytes = size;
    outcome.message = "Artifact is too large and may be malicious. Rendering aborted.";
    return outcome;
}

RenderOutcome ExecutionOrchestrator::TimedOut(ExecutionPath path, std::vector<std::string> logs) const {
    RenderOutcome outcome;
    outcome.status = OutcomeStatus::kTimeout;
    outcome.failure = FailureKind::kTimeout;
    outcome.path = path;
    outcome.message = "Rendering timed out after " + std::to_string(config_.outer_timeout_s)
                    + " seconds. The app might be hanging.";
    outcome.log_lines = Tail(logs, config_.timeout_log_lines);
    return outcome;
}

std::string ExecutionOrchestrator::PooledRunCommand() const {
    return "cd " + config_.work_dir + " && timeout " + std::to_string(config_.inner_timeout_s) + "s "
         + config_.python_command + " main.py";
}

std::string ExecutionOrchestrator::ColdRunCommand() const {
    return "Xvfb :99 -screen 0 ${WIDTH:-800}x${HEIGHT:-600}x24 -nolisten tcp & xp=$!; "
           "for i in $(seq 1 50); do DISPLAY=:99 xdpyinfo >/dev/null 2>&1 && break; sleep 0.1; done; "
           "DISPLAY=:99 timeout " + std::to_string(config_.inner_timeout_s) + "s " + config_.python_command + " "
         + config_.work_dir + "/main.py; "
           "status=$?; kill \"$xp\"; wait \"$xp\" 2>/dev/null || true; exit $status";
}

Clock::time_point ExecutionOrchestrator::OuterDeadline(const RenderJob& job) const {
    return std::min(job.deadline, Clock::now() + std::chrono::seconds(config_.outer_timeout_s));
}

std::filesystem::path ExecutionOrchestrator::ScratchDirFor(const std::string& job_key) const {
    return std::filesystem::path(config_.runs_dir) / SanitizeKey(job_key);
}

}  // namespace kivybot::render
