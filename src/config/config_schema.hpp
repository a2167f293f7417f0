#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace kivybot::config {

struct TelegramConfig {
    bool enabled = false;
    std::string token;
    std::vector<std::string> allow_from;
};

struct ChannelsConfig {
    TelegramConfig telegram;
};

struct EngineConfig {
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    int request_timeout_ms = 10000;
};

struct PoolConfig {
    std::string image = "kivy-renderer:prewarmed";
    int pool_size = 2;
    std::int64_t memory_bytes = 512LL * 1024 * 1024;
    std::int64_t cpu_quota = 50000;
    bool network_isolated = true;
    std::string tmpfs_size = "80m";
    std::int64_t file_size_limit_bytes = 100LL * 1024 * 1024;
    std::int64_t open_files_limit = 100;
    int settle_delay_ms = 5000;
    std::string name_prefix = "kivy-pool";
    std::map<std::string, std::string> labels = {
        {"app", "doctor-kivy"},
        {"role", "kivy-pool"}
    };
};

struct RenderConfig {
    std::string cold_image = "kivy-renderer:latest";
    std::string runs_dir = "./runs";
    std::string templates_dir = "./templates";
    std::string work_dir = "/work";
    std::string python_command = "/app/.venv/bin/python";
    int lease_timeout_ms = 1000;
    int transfer_timeout_ms = 10000;
    int inner_timeout_s = 25;
    int outer_timeout_s = 30;
    int extract_timeout_ms = 10000;
    int cleanup_timeout_ms = 5000;
    int job_deadline_s = 45;
    std::int64_t max_artifact_bytes = 50LL * 1024 * 1024;
    int log_tail_lines = 50;
    int timeout_log_lines = 20;
    int default_width = 800;
    int default_height = 600;
    int max_dimension = 3840;
    std::vector<std::string> baseline_processes = {
        "/bin/sh /entrypoint.sh",
        "Xvfb :99 -screen 0 800x600x24 -nolisten tcp -br",
        "tail -f /dev/null"
    };
};

struct InspectorConfig {
    bool reject_dangerous_code = true;
};

struct MetricsConfig {
    std::string db_path = "./metrics.db";
    bool http_enabled = false;
    std::string http_host = "127.0.0.1";
    int http_port = 18790;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    EngineConfig engine;
    PoolConfig pool;
    RenderConfig render;
    InspectorConfig inspector;
    MetricsConfig metrics;
    ChannelsConfig channels;
    LoggingConfig logging;
};

}  // namespace kivybot::config
