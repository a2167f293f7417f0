#include "metrics/result_sink.hpp"

#include <iomanip>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kivybot::metrics {
namespace {

std::string SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::string Fixed6(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}

nlohmann::json HistogramJson(const HistogramSnapshot& histogram) {
    return {
        {"count", histogram.count},
        {"sum", histogram.sum},
        {"min", histogram.min ? nlohmann::json(*histogram.min) : nlohmann::json(nullptr)},
        {"max", histogram.max ? nlohmann::json(*histogram.max) : nlohmann::json(nullptr)}
    };
}

}  // namespace

std::int64_t MetricsSnapshot::Counter(const std::string& name) const {
    auto it = counters.find(name);
    return it == counters.end() ? 0 : it->second;
}

ResultSink::ResultSink(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    Open();
}

ResultSink::~ResultSink() {
    Close();
}

void ResultSink::Open() {
    const auto location = db_path_.string();
    if (location != ":memory:" && db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(location.c_str(), &db_) != SQLITE_OK) {
        utils::LogError("metrics", "failed to open sqlite db " + location + "; using in-memory store");
        sqlite3_close(db_);
        db_ = nullptr;
        if (sqlite3_open(":memory:", &db_) != SQLITE_OK) {
            sqlite3_close(db_);
            db_ = nullptr;
            return;
        }
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "PRAGMA synchronous=NORMAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS counters ("
             "name TEXT PRIMARY KEY,"
             "value INTEGER NOT NULL"
             ");");
    Exec(db_, "CREATE TABLE IF NOT EXISTS aggs ("
             "name TEXT PRIMARY KEY,"
             "count INTEGER NOT NULL,"
             "sum REAL NOT NULL,"
             "min REAL,"
             "max REAL"
             ");");
    Exec(db_, "CREATE TABLE IF NOT EXISTS meta ("
             "k TEXT PRIMARY KEY,"
             "v TEXT"
             ");");
    for (const char* name : {kAttempted, kSuccess, kFailure}) {
        Exec(db_, std::string("INSERT OR IGNORE INTO counters(name, value) VALUES ('") + name + "', 0);");
    }
}

void ResultSink::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ResultSink::RecordAttempt() {
    Increment(kAttempted, 1);
}

void ResultSink::RecordSuccess() {
    Increment(kSuccess, 1);
}

void ResultSink::RecordFailure() {
    Increment(kFailure, 1);
}

void ResultSink::RecordDuration(double seconds) {
    Observe(kDuration, seconds);
}

void ResultSink::RecordArtifactBytes(std::int64_t bytes) {
    Observe(kArtifactBytes, static_cast<double>(bytes));
}

void ResultSink::Increment(const std::string& name, std::int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return;
    }
    Exec(db_, "BEGIN TRANSACTION;");
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "INSERT INTO counters(name, value) VALUES(?, ?) "
        "ON CONFLICT(name) DO UPDATE SET value = counters.value + excluded.value;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, delta);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            utils::LogError("metrics", "counter update failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }
    sqlite3_finalize(stmt);
    Touch();
    Exec(db_, "COMMIT;");
}

void ResultSink::Observe(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return;
    }
    Exec(db_, "BEGIN TRANSACTION;");
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "INSERT INTO aggs(name, count, sum, min, max) VALUES(?, 1, ?, ?, ?) "
        "ON CONFLICT(name) DO UPDATE SET "
        "count = aggs.count + 1, "
        "sum = aggs.sum + excluded.sum, "
        "min = CASE WHEN aggs.min IS NULL OR excluded.min < aggs.min THEN excluded.min ELSE aggs.min END, "
        "max = CASE WHEN aggs.max IS NULL OR excluded.max > aggs.max THEN excluded.max ELSE aggs.max END;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 2, value);
        sqlite3_bind_double(stmt, 3, value);
        sqlite3_bind_double(stmt, 4, value);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            utils::LogError("metrics", "observation failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }
    sqlite3_finalize(stmt);
    Touch();
    Exec(db_, "COMMIT;");
}

void ResultSink::Touch() {
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "INSERT INTO meta(k, v) VALUES('last_update_ts', ?) "
        "ON CONFLICT(k) DO UPDATE SET v = excluded.v;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        const auto now = utils::UtcIsoNow();
        sqlite3_bind_text(stmt, 1, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
}

MetricsSnapshot ResultSink::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot snapshot;
    if (!db_) {
        return snapshot;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT name, value FROM counters;", -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            snapshot.counters[SafeText(sqlite3_column_text(stmt, 0))] = sqlite3_column_int64(stmt, 1);
        }
    }
    sqlite3_finalize(stmt);

    if (sqlite3_prepare_v2(db_, "SELECT name, count, sum, min, max FROM aggs;", -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            HistogramSnapshot histogram;
            histogram.count = sqlite3_column_int64(stmt, 1);
            histogram.sum = sqlite3_column_double(stmt, 2);
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
                histogram.min = sqlite3_column_double(stmt, 3);
            }
            if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
                histogram.max = sqlite3_column_double(stmt, 4);
            }
            const auto name = SafeText(sqlite3_column_text(stmt, 0));
            if (name == kDuration) {
                snapshot.render_duration_seconds = histogram;
            } else if (name == kArtifactBytes) {
                snapshot.artifact_bytes = histogram;
            }
        }
    }
    sqlite3_finalize(stmt);

    if (sqlite3_prepare_v2(db_, "SELECT v FROM meta WHERE k = 'last_update_ts';", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            snapshot.last_update_ts = SafeText(sqlite3_column_text(stmt, 0));
        }
    }
    sqlite3_finalize(stmt);
    return snapshot;
}

bool ResultSink::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            utils::LogError("metrics", std::string("sqlite exec error: ") + err);
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
    nlohmann::json counters = nlohmann::json::object();
    for (const auto& [name, value] : snapshot.counters) {
        counters[name] = value;
    }
    return {
        {"version", 1},
        {"counters", counters},
        {ResultSink::kDuration, HistogramJson(snapshot.render_duration_seconds)},
        {ResultSink::kArtifactBytes, HistogramJson(snapshot.artifact_bytes)},
        {"last_update_ts", snapshot.last_update_ts ? nlohmann::json(*snapshot.last_update_ts)
                                                   : nlohmann::json(nullptr)}
    };
}

std::string FormatStats(const MetricsSnapshot& snapshot) {
    const auto& duration = snapshot.render_duration_seconds;
    const auto& bytes = snapshot.artifact_bytes;
    const auto optional_fixed = [](const std::optional<double>& value) {
        return value ? Fixed6(*value) : std::string("null");
    };
    const auto optional_int = [](const std::optional<double>& value) {
        return value ? std::to_string(static_cast<std::int64_t>(*value)) : std::string("null");
    };

    std::ostringstream oss;
    oss << "kivybot metrics\n"
        << ResultSink::kAttempted << ": " << snapshot.Counter(ResultSink::kAttempted) << "\n"
        << ResultSink::kSuccess << ":  " << snapshot.Counter(ResultSink::kSuccess) << "\n"
        << ResultSink::kFailure << ":  " << snapshot.Counter(ResultSink::kFailure) << "\n"
        << "render_duration_seconds.count: " << duration.count << "\n"
        << "render_duration_seconds.sum:   " << Fixed6(duration.sum) << "\n"
        << "render_duration_seconds.min:   " << optional_fixed(duration.min) << "\n"
        << "render_duration_seconds.max:   " << optional_fixed(duration.max) << "\n"
        << "render_duration_seconds.avg:   " << Fixed6(duration.Average()) << "\n"
        << "artifact_bytes.count: " << bytes.count << "\n"
        << "artifact_bytes.sum:   " << static_cast<std::int64_t>(bytes.sum) << "\n"
        << "artifact_bytes.min:   " << optional_int(bytes.min) << "\n"
        << "artifact_bytes.max:   " << optional_int(bytes.max) << "\n"
        << "artifact_bytes.avg:   " << static_cast<std::int64_t>(bytes.Average()) << "\n"
        << "last_update_ts: " << snapshot.last_update_ts.value_or("null");
    return oss.str();
}

}  // namespace kivybot::metrics
