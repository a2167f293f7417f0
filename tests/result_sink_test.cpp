#include "metrics/result_sink.hpp"

#include <chrono>
#include <filesystem>

#include <gtest/gtest.h>

namespace kivybot::metrics {
namespace {

TEST(ResultSinkTest, FreshStoreHasZeroCounters) {
    ResultSink sink(":memory:");
    const auto snapshot = sink.Snapshot();
    EXPECT_EQ(snapshot.Counter(ResultSink::kAttempted), 0);
    EXPECT_EQ(snapshot.Counter(ResultSink::kSuccess), 0);
    EXPECT_EQ(snapshot.Counter(ResultSink::kFailure), 0);
    EXPECT_EQ(snapshot.render_duration_seconds.count, 0);
    EXPECT_FALSE(snapshot.last_update_ts.has_value());
}

TEST(ResultSinkTest, CountersAndAggregates) {
    ResultSink sink(":memory:");
    sink.RecordAttempt();
    sink.RecordAttempt();
    sink.RecordSuccess();
    sink.RecordFailure();
    sink.RecordDuration(1.5);
    sink.RecordDuration(0.5);
    sink.RecordArtifactBytes(100);
    sink.RecordArtifactBytes(300);

    const auto snapshot = sink.Snapshot();
    EXPECT_EQ(snapshot.Counter(ResultSink::kAttempted), 2);
    EXPECT_EQ(snapshot.Counter(ResultSink::kSuccess), 1);
    EXPECT_EQ(snapshot.Counter(ResultSink::kFailure), 1);
    EXPECT_EQ(snapshot.render_duration_seconds.count, 2);
    EXPECT_DOUBLE_EQ(snapshot.render_duration_seconds.sum, 2.0);
    EXPECT_DOUBLE_EQ(*snapshot.render_duration_seconds.min, 0.5);
    EXPECT_DOUBLE_EQ(*snapshot.render_duration_seconds.max, 1.5);
    EXPECT_DOUBLE_EQ(snapshot.artifact_bytes.Average(), 200.0);
    ASSERT_TRUE(snapshot.last_update_ts.has_value());
    EXPECT_NE(snapshot.last_update_ts->find("+00:00"), std::string::npos);
}

TEST(ResultSinkTest, FormatStatsShowsNullsForEmptyAggregates) {
    ResultSink sink(":memory:");
    sink.RecordAttempt();
    const auto text = FormatStats(sink.Snapshot());
    EXPECT_NE(text.find("renders_attempted_total: 1"), std::string::npos);
    EXPECT_NE(text.find("render_duration_seconds.min:   null"), std::string::npos);
    EXPECT_NE(text.find("artifact_bytes.max:   null"), std::string::npos);
}

TEST(ResultSinkTest, JsonSnapshot) {
    ResultSink sink(":memory:");
    sink.RecordDuration(2.0);
    const auto json = ToJson(sink.Snapshot());
    EXPECT_EQ(json["version"], 1);
    EXPECT_EQ(json["counters"][ResultSink::kAttempted], 0);
    EXPECT_EQ(json[ResultSink::kDuration]["count"], 1);
    EXPECT_TRUE(json[ResultSink::kArtifactBytes]["min"].is_null());
}

TEST(ResultSinkTest, SurvivesReopen) {
    const auto path = std::filesystem::temp_directory_path()
        / ("kivybot-metrics-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))
        / "metrics.db";
    {
        ResultSink sink(path);
        sink.RecordAttempt();
        sink.RecordSuccess();
    }
    ResultSink reopened(path);
    const auto snapshot = reopened.Snapshot();
    EXPECT_EQ(snapshot.Counter(ResultSink::kAttempted), 1);
    EXPECT_EQ(snapshot.Counter(ResultSink::kSuccess), 1);
    reopened.Close();
    std::filesystem::remove_all(path.parent_path());
}

TEST(ResultSinkTest, ClosedSinkIgnoresWrites) {
    ResultSink sink(":memory:");
    sink.Close();
    sink.RecordAttempt();
    EXPECT_TRUE(sink.Snapshot().counters.empty());
}

}  // namespace
}  // namespace kivybot::metrics
