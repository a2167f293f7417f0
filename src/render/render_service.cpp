#include "render/render_service.hpp"

#include "utils/logging.hpp"

namespace kivybot::render {

RenderService::RenderService(const inspect::CodeInspector& inspector,
                             ExecutionOrchestrator& orchestrator,
                             const config::RenderConfig& config)
    : inspector_(inspector)
    , orchestrator_(orchestrator)
    , config_(config) {}

RenderJob RenderService::Prepare(const std::string& raw_text, RenderMode mode, const std::string& job_key) const {
    const auto snippet = inspector_.SelectRenderable(raw_text);
    if (!snippet) {
        throw InputError(InputError::Reason::kNoSnippet,
                         "No Kivy app found. Send a ```python code block that imports kivy and calls run().");
    }
    const auto verdict = inspector_.CheckSafety(*snippet);
    if (!verdict.allowed) {
        utils::LogWarn("render", "rejected job " + job_key + ": matched '" + verdict.matched_pattern + "'");
        throw InputError(InputError::Reason::kRejected,
                         "Code contains potentially dangerous operations (" + verdict.matched_pattern
                             + ") and cannot be executed.");
    }

    const auto hint = inspect::CodeInspector::ParseDisplayHint(*snippet);
    RenderJob job;
    job.job_key = job_key;
    job.source_code = *snippet;
    job.mode = mode;
    job.requested_width = hint.width;
    job.requested_height = hint.height;
    job.explicit_size = hint.IsExplicit();
    job.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.job_deadline_s);
    if (job.explicit_size) {
        utils::LogDebug("render", "job " + job_key + " size hint from " + hint.source);
    }
    return job;
}

RenderOutcome RenderService::Submit(const std::string& raw_text,
                                    RenderMode mode,
                                    const std::string& job_key,
                                    engine::Yield yield) {
    const auto job = Prepare(raw_text, mode, job_key);
    return orchestrator_.Execute(job, yield);
}

}  // namespace kivybot::render
