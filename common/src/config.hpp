#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

struct Config {
    // Probe targets
    std::string ping_host = "8.8.8.8";
    std::string dns_host = "www.google.com";
    std::string ping_command = "fping";
    int pings = 5;                       // echoes per sample

    // Cadence and timeouts (seconds)
    int interval = 60;
    int probe_timeout_seconds = 30;
    int dns_timeout_seconds = 5;
    int notify_timeout_seconds = 10;

    // Debounce thresholds (consecutive bad samples)
    int trigger = 3;
    int latency_trigger = 3;
    int dns_trigger = 3;
    int loss_trigger = 3;

    double latency_threshold_ms = 1000.0;
    int loss_threshold_percent = 0;
    bool track_packet_loss = true;

    // Files
    std::string log_path = "/var/log/connection.log";
    std::string status_path;             // empty: next to log_path
    std::string credentials_path = "/etc/pushover.creds";

    // General
    std::string display_tz;              // empty: system local time
    std::string log_level = "info";
    bool verbose = false;

    // Viewer
    std::string web_title = "Internet Connection Monitor";
    std::string web_listen_addr = "0.0.0.0";
    int web_port = 5005;
    int web_log_lines = 100;
    int status_max_age = 300;            // <= 0 disables the staleness check
    std::vector<std::string> allowed_hosts;

    // Loads INETMON_CONFIG (or config_file when given), then environment overrides
    static Config from_env(const std::string& config_file = "");

    void load_file(const std::string& path);
    void load_json(const nlohmann::json& j);
    void apply_env();
    void normalize();
};
