#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace kivybot::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("KIVYBOT_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".kivybot" / "config.json";
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

template <typename T>
void ReadInt(const nlohmann::json& source, const char* key, T& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<T>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("engine") && data["engine"].is_object()) {
        const auto& engine = data["engine"];
        ReadString(engine, "socketPath", config.engine.socket_path);
        ReadString(engine, "apiVersion", config.engine.api_version);
        ReadInt(engine, "requestTimeoutMs", config.engine.request_timeout_ms);
    }

    if (data.contains("pool") && data["pool"].is_object()) {
        const auto& pool = data["pool"];
        ReadString(pool, "image", config.pool.image);
        ReadInt(pool, "poolSize", config.pool.pool_size);
        ReadInt(pool, "memoryBytes", config.pool.memory_bytes);
        ReadInt(pool, "cpuQuota", config.pool.cpu_quota);
        ReadBool(pool, "networkIsolated", config.pool.network_isolated);
        ReadString(pool, "tmpfsSize", config.pool.tmpfs_size);
        ReadInt(pool, "fileSizeLimitBytes", config.pool.file_size_limit_bytes);
        ReadInt(pool, "openFilesLimit", config.pool.open_files_limit);
        ReadInt(pool, "settleDelayMs", config.pool.settle_delay_ms);
        ReadString(pool, "namePrefix", config.pool.name_prefix);
        if (pool.contains("labels") && pool["labels"].is_object()) {
            config.pool.labels.clear();
            for (const auto& item : pool["labels"].items()) {
                if (item.value().is_string()) {
                    config.pool.labels[item.key()] = item.value().get<std::string>();
                }
            }
        }
    }

    if (data.contains("render") && data["render"].is_object()) {
        const auto& render = data["render"];
        ReadString(render, "coldImage", config.render.cold_image);
        ReadString(render, "runsDir", config.render.runs_dir);
        ReadString(render, "templatesDir", config.render.templates_dir);
        ReadString(render, "workDir", config.render.work_dir);
        ReadString(render, "pythonCommand", config.render.python_command);
        ReadInt(render, "leaseTimeoutMs", config.render.lease_timeout_ms);
        ReadInt(render, "transferTimeoutMs", config.render.transfer_timeout_ms);
        ReadInt(render, "innerTimeoutS", config.render.inner_timeout_s);
        ReadInt(render, "outerTimeoutS", config.render.outer_timeout_s);
        ReadInt(render, "extractTimeoutMs", config.render.extract_timeout_ms);
        ReadInt(render, "cleanupTimeoutMs", config.render.cleanup_timeout_ms);
        ReadInt(render, "jobDeadlineS", config.render.job_deadline_s);
        ReadInt(render, "maxArtifactBytes", config.render.max_artifact_bytes);
        ReadInt(render, "logTailLines", config.render.log_tail_lines);
        ReadInt(render, "timeoutLogLines", config.render.timeout_log_lines);
        ReadInt(render, "defaultWidth", config.render.default_width);
        ReadInt(render, "defaultHeight", config.render.default_height);
        ReadInt(render, "maxDimension", config.render.max_dimension);
        ReadStringList(render, "baselineProcesses", config.render.baseline_processes);
    }

    if (data.contains("inspector") && data["inspector"].is_object()) {
        ReadBool(data["inspector"], "rejectDangerousCode", config.inspector.reject_dangerous_code);
    }

    if (data.contains("metrics") && data["metrics"].is_object()) {
        const auto& metrics = data["metrics"];
        ReadString(metrics, "dbPath", config.metrics.db_path);
        ReadBool(metrics, "httpEnabled", config.metrics.http_enabled);
        ReadString(metrics, "httpHost", config.metrics.http_host);
        ReadInt(metrics, "httpPort", config.metrics.http_port);
    }

    if (data.contains("channels") && data["channels"].is_object()) {
        const auto& channels = data["channels"];
        if (channels.contains("telegram") && channels["telegram"].is_object()) {
            const auto& telegram = channels["telegram"];
            ReadBool(telegram, "enabled", config.channels.telegram.enabled);
            ReadString(telegram, "token", config.channels.telegram.token);
            ReadStringList(telegram, "allowFrom", config.channels.telegram.allow_from);
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Values that would make the pool or the watchdog misbehave are pulled back to a safe range.
void Sanitize(Config& config) {
    if (config.pool.pool_size < 0) {
        utils::LogWarn("config", "pool.poolSize < 0; using 0");
        config.pool.pool_size = 0;
    }
    if (config.render.outer_timeout_s <= 0) {
        config.render.outer_timeout_s = 30;
    }
    if (config.render.inner_timeout_s <= 0 || config.render.inner_timeout_s >= config.render.outer_timeout_s) {
        utils::LogWarn("config", "render.innerTimeoutS must be below render.outerTimeoutS; adjusting");
        config.render.inner_timeout_s = std::max(1, config.render.outer_timeout_s - 5);
    }
    if (config.render.job_deadline_s < config.render.outer_timeout_s) {
        config.render.job_deadline_s = config.render.outer_timeout_s;
    }
    if (config.render.log_tail_lines <= 0) {
        config.render.log_tail_lines = 50;
    }
    if (config.render.timeout_log_lines <= 0) {
        config.render.timeout_log_lines = 20;
    }
    if (config.render.default_width <= 0) {
        config.render.default_width = 800;
    }
    if (config.render.default_height <= 0) {
        config.render.default_height = 600;
    }
}

}  // namespace

Config ParseConfig(const std::string& json_text) {
    Config config{};
    auto data = nlohmann::json::parse(json_text, nullptr, false);
    if (data.is_discarded()) {
        utils::LogWarn("config", "config is not valid JSON; keeping defaults");
    } else {
        ApplyConfigFromJson(config, data);
    }
    Sanitize(config);
    return config;
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "failed to parse " + config_path.string() + ": " + ex.what());
        }
    }

    const auto socket_path = GetEnvFallback("KIVYBOT_ENGINE__SOCKET_PATH", "DOCKER_SOCKET");
    if (!socket_path.empty()) {
        config.engine.socket_path = socket_path;
    }

    const auto pool_image = GetEnvFallback("KIVYBOT_POOL__IMAGE", "KIVYBOT_POOL_IMAGE");
    if (!pool_image.empty()) {
        config.pool.image = pool_image;
    }

    const auto pool_size = GetEnvFallback("KIVYBOT_POOL__POOL_SIZE", "KIVYBOT_POOL_SIZE");
    if (!pool_size.empty()) {
        config.pool.pool_size = ParseInt(pool_size, config.pool.pool_size);
    }

    const auto cold_image = GetEnvFallback("KIVYBOT_RENDER__COLD_IMAGE", "KIVYBOT_RENDER_IMAGE");
    if (!cold_image.empty()) {
        config.render.cold_image = cold_image;
    }

    const auto runs_dir = GetEnvFallback("KIVYBOT_RENDER__RUNS_DIR", "KIVYBOT_RUNS_DIR");
    if (!runs_dir.empty()) {
        config.render.runs_dir = runs_dir;
    }

    const auto templates_dir = GetEnvFallback("KIVYBOT_RENDER__TEMPLATES_DIR", "KIVYBOT_TEMPLATES_DIR");
    if (!templates_dir.empty()) {
        config.render.templates_dir = templates_dir;
    }

    const auto outer_timeout = GetEnvFallback("KIVYBOT_RENDER__OUTER_TIMEOUT_S", "KIVYBOT_RENDER_TIMEOUT");
    if (!outer_timeout.empty()) {
        config.render.outer_timeout_s = ParseInt(outer_timeout, config.render.outer_timeout_s);
    }

    const auto reject_dangerous = GetEnvFallback(
        "KIVYBOT_INSPECTOR__REJECT_DANGEROUS_CODE",
        "KIVYBOT_REJECT_DANGEROUS_CODE");
    if (!reject_dangerous.empty()) {
        config.inspector.reject_dangerous_code = ParseBool(reject_dangerous);
    }

    const auto metrics_db = GetEnvFallback("KIVYBOT_METRICS__DB_PATH", "KIVYBOT_METRICS_DB");
    if (!metrics_db.empty()) {
        config.metrics.db_path = metrics_db;
    }

    const auto metrics_http = GetEnvFallback("KIVYBOT_METRICS__HTTP_ENABLED", "KIVYBOT_METRICS_HTTP");
    if (!metrics_http.empty()) {
        config.metrics.http_enabled = ParseBool(metrics_http);
    }

    const auto telegram_enabled = GetEnv("KIVYBOT_TELEGRAM_ENABLED");
    if (!telegram_enabled.empty()) {
        config.channels.telegram.enabled = ParseBool(telegram_enabled);
    }

    const auto telegram_token = GetEnv("KIVYBOT_TELEGRAM_TOKEN");
    if (!telegram_token.empty()) {
        config.channels.telegram.token = telegram_token;
        config.channels.telegram.enabled = true;
    }

    const auto telegram_allow_from = GetEnv("KIVYBOT_TELEGRAM_ALLOW_FROM");
    if (!telegram_allow_from.empty()) {
        config.channels.telegram.allow_from = SplitCsv(telegram_allow_from);
    }

    const auto log_level = GetEnvFallback("KIVYBOT_LOGGING__LEVEL", "KIVYBOT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    Sanitize(config);
    return config;
}

}  // namespace kivybot::config
