#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kivybot::render {

enum class RenderMode {
    kScreenshot,
    kVideo
};

inline const char* ToString(RenderMode mode) {
    switch (mode) {
        case RenderMode::kScreenshot: return "screenshot";
        case RenderMode::kVideo: return "video";
    }
    return "screenshot";
}

inline std::optional<RenderMode> ParseRenderMode(const std::string& value) {
    if (value == "screenshot") {
        return RenderMode::kScreenshot;
    }
    if (value == "video") {
        return RenderMode::kVideo;
    }
    return std::nullopt;
}

// File the sandboxed script writes into the work directory for each mode.
inline const char* ArtifactName(RenderMode mode) {
    switch (mode) {
        case RenderMode::kScreenshot: return "kivy_screenshot.png";
        case RenderMode::kVideo: return "kivy_video.mp4";
    }
    return "kivy_screenshot.png";
}

struct RenderJob {
    std::string job_key;
    std::string source_code;
    std::optional<int> requested_width;
    std::optional<int> requested_height;
    bool explicit_size = false;
    RenderMode mode = RenderMode::kScreenshot;
    std::chrono::steady_clock::time_point deadline;
};

enum class OutcomeStatus {
    kSuccess,
    kFailure,
    kTimeout
};

inline const char* ToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::kSuccess: return "success";
        case OutcomeStatus::kFailure: return "failure";
        case OutcomeStatus::kTimeout: return "timeout";
    }
    return "failure";
}

enum class FailureKind {
    kNone,
    kTimeout,
    kArtifactTooLarge,
    kArtifactMissing,
    kEngineError
};

enum class ExecutionPath {
    kPooled,
    kCold
};

struct RenderOutcome {
    OutcomeStatus status = OutcomeStatus::kFailure;
    FailureKind failure = FailureKind::kNone;
    ExecutionPath path = ExecutionPath::kCold;
    std::string message;
    std::optional<std::string> artifact_bytes;
    std::string artifact_name;
    std::vector<std::string> log_lines;
    std::int64_t duration_ms = 0;
    std::optional<std::int64_t> artifact_size_bytes;

    bool Succeeded() const { return status == OutcomeStatus::kSuccess; }
};

// No renderable snippet, or the snippet was refused before a job was created.
class InputError : public std::runtime_error {
public:
    enum class Reason {
        kNoSnippet,
        kRejected
    };

    InputError(Reason reason, const std::string& message)
        : std::runtime_error(message)
        , reason_(reason) {}

    Reason GetReason() const { return reason_; }

private:
    Reason reason_;
};

}  // namespace kivybot::render
