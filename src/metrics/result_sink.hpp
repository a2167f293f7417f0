#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "sqlite3.h"

namespace kivybot::metrics {

struct HistogramSnapshot {
    std::int64_t count = 0;
    double sum = 0.0;
    std::optional<double> min;
    std::optional<double> max;

    double Average() const { return count > 0 ? sum / static_cast<double>(count) : 0.0; }
};

struct MetricsSnapshot {
    std::map<std::string, std::int64_t> counters;
    HistogramSnapshot render_duration_seconds;
    HistogramSnapshot artifact_bytes;
    std::optional<std::string> last_update_ts;

    std::int64_t Counter(const std::string& name) const;
};

// Durable render counters and count/sum/min/max aggregates backed by SQLite.
// Thread-safe; every write also stamps last_update_ts.
class ResultSink {
public:
    static constexpr const char* kAttempted = "renders_attempted_total";
    static constexpr const char* kSuccess = "renders_success_total";
    static constexpr const char* kFailure = "renders_failure_total";
    static constexpr const char* kDuration = "render_duration_seconds";
    static constexpr const char* kArtifactBytes = "artifact_bytes";

    explicit ResultSink(std::filesystem::path db_path);
    ~ResultSink();

    ResultSink(const ResultSink&) = delete;
    ResultSink& operator=(const ResultSink&) = delete;

    void RecordAttempt();
    void RecordSuccess();
    void RecordFailure();
    void RecordDuration(double seconds);
    void RecordArtifactBytes(std::int64_t bytes);

    MetricsSnapshot Snapshot() const;
    void Close();

private:
    void Increment(const std::string& name, std::int64_t delta);
    void Observe(const std::string& name, double value);
    void Touch();
    void Open();
    static bool Exec(sqlite3* db, const std::string& sql);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);
std::string FormatStats(const MetricsSnapshot& snapshot);

}  // namespace kivybot::metrics
