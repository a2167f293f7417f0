#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "engine/engine.hpp"
#include "inspect/code_inspector.hpp"
#include "render/execution_orchestrator.hpp"
#include "render/render_types.hpp"

namespace kivybot::render {

// Entry point for callers holding raw message text.
class RenderService {
public:
    RenderService(const inspect::CodeInspector& inspector,
                  ExecutionOrchestrator& orchestrator,
                  const config::RenderConfig& config);

    // Throws InputError before any job exists (nothing is recorded in that case).
    RenderJob Prepare(const std::string& raw_text, RenderMode mode, const std::string& job_key) const;

    RenderOutcome Submit(const std::string& raw_text,
                         RenderMode mode,
                         const std::string& job_key,
                         engine::Yield yield);

private:
    const inspect::CodeInspector& inspector_;
    ExecutionOrchestrator& orchestrator_;
    config::RenderConfig config_;
};

}  // namespace kivybot::render
