#include "config.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {

void read_string(const nlohmann::json& section, const char* key, std::string& out) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (value.is_string()) {
        out = value.get<std::string>();
    } else {
        spdlog::warn("Config key '{}' must be a string, keeping '{}'", key, out);
    }
}

void read_int(const nlohmann::json& section, const char* key, int& out) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (value.is_number_integer()) {
        out = value.get<int>();
    } else if (value.is_string() && util::parse_int(value.get<std::string>())) {
        out = *util::parse_int(value.get<std::string>());
    } else {
        spdlog::warn("Config key '{}' must be an integer, keeping {}", key, out);
    }
}

void read_double(const nlohmann::json& section, const char* key, double& out) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (value.is_number()) {
        out = value.get<double>();
    } else if (value.is_string() && util::parse_double(value.get<std::string>())) {
        out = *util::parse_double(value.get<std::string>());
    } else {
        spdlog::warn("Config key '{}' must be a number, keeping {}", key, out);
    }
}

void read_bool(const nlohmann::json& section, const char* key, bool& out) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (value.is_boolean()) {
        out = value.get<bool>();
    } else if (value.is_string() && util::parse_bool(value.get<std::string>())) {
        out = *util::parse_bool(value.get<std::string>());
    } else {
        spdlog::warn("Config key '{}' must be a boolean, keeping {}", key, out);
    }
}

void env_string(const char* name, std::string& out) {
    if (auto value = util::get_env(name)) {
        out = *value;
    }
}

void env_int(const char* name, int& out) {
    if (auto value = util::get_env(name)) {
        if (auto parsed = util::parse_int(*value)) {
            out = *parsed;
        } else {
            spdlog::warn("Invalid integer value for {}: {}", name, *value);
        }
    }
}

void env_double(const char* name, double& out) {
    if (auto value = util::get_env(name)) {
        if (auto parsed = util::parse_double(*value)) {
            out = *parsed;
        } else {
            spdlog::warn("Invalid numeric value for {}: {}", name, *value);
        }
    }
}

void env_bool(const char* name, bool& out) {
    if (auto value = util::get_env(name)) {
        if (auto parsed = util::parse_bool(*value)) {
            out = *parsed;
        } else {
            spdlog::warn("Invalid boolean value for {}: {}", name, *value);
        }
    }
}

void clamp_setting(const char* name, int& value, int low, int high) {
    if (value < low || value > high) {
        int fixed = std::clamp(value, low, high);
        spdlog::warn("Config value {}={} out of range [{}, {}], using {}", name, value, low, high, fixed);
        value = fixed;
    }
}

} // namespace

Config Config::from_env(const std::string& config_file) {
    Config config;

    std::string path = config_file;
    if (path.empty()) {
        path = util::get_env("INETMON_CONFIG").value_or("");
    }
    if (!path.empty()) {
        config.load_file(path);
    }

    config.apply_env();
    config.normalize();
    return config;
}

void Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Config file {} not readable, using defaults", path);
        return;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        load_json(j);
        spdlog::info("Configuration loaded from {}", path);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config file {} is malformed ({}), using defaults", path, e.what());
    }
}

void Config::load_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        spdlog::warn("Config document must be a JSON object, using defaults");
        return;
    }

    if (j.contains("monitor") && j["monitor"].is_object()) {
        const auto& m = j["monitor"];
        read_string(m, "ping_host", ping_host);
        read_string(m, "dns_host", dns_host);
        read_string(m, "ping_command", ping_command);
        read_int(m, "pings", pings);
        read_int(m, "interval", interval);
        read_int(m, "probe_timeout_seconds", probe_timeout_seconds);
        read_int(m, "dns_timeout_seconds", dns_timeout_seconds);
        read_int(m, "notify_timeout_seconds", notify_timeout_seconds);
        read_int(m, "trigger", trigger);
        read_int(m, "latency_trigger", latency_trigger);
        read_int(m, "dns_trigger", dns_trigger);
        read_int(m, "loss_trigger", loss_trigger);
        read_double(m, "latency_threshold_ms", latency_threshold_ms);
        read_int(m, "loss_threshold_percent", loss_threshold_percent);
        read_bool(m, "track_packet_loss", track_packet_loss);
        read_string(m, "log_path", log_path);
        read_string(m, "status_path", status_path);
        read_string(m, "credentials_path", credentials_path);
        read_string(m, "display_tz", display_tz);
        read_string(m, "log_level", log_level);
        read_bool(m, "verbose", verbose);
    }

    if (j.contains("web") && j["web"].is_object()) {
        const auto& w = j["web"];
        read_string(w, "title", web_title);
        read_string(w, "listen_addr", web_listen_addr);
        read_int(w, "port", web_port);
        read_int(w, "log_lines", web_log_lines);
        read_int(w, "status_max_age", status_max_age);
        // The viewer reads the monitor's files; these only fill in paths the monitor section left out
        bool monitor_has = j.contains("monitor") && j["monitor"].is_object();
        if (!monitor_has || !j["monitor"].contains("log_path")) {
            read_string(w, "log_path", log_path);
        }
        if (!monitor_has || !j["monitor"].contains("status_path")) {
            read_string(w, "status_path", status_path);
        }

        if (w.contains("allowed_hosts")) {
            const auto& hosts = w["allowed_hosts"];
            if (hosts.is_string()) {
                allowed_hosts = util::split_list(hosts.get<std::string>());
            } else if (hosts.is_array()) {
                allowed_hosts.clear();
                for (const auto& host : hosts) {
                    if (host.is_string()) allowed_hosts.push_back(host.get<std::string>());
                }
            } else {
                spdlog::warn("Config key 'allowed_hosts' must be a string or array");
            }
        }
    }
}

void Config::apply_env() {
    env_string("PING_HOST", ping_host);
    env_string("DNS_HOST", dns_host);
    env_string("PING_COMMAND", ping_command);
    env_int("PINGS", pings);

    env_int("INTERVAL", interval);
    env_int("PROBE_TIMEOUT_SECONDS", probe_timeout_seconds);
    env_int("DNS_TIMEOUT_SECONDS", dns_timeout_seconds);
    env_int("NOTIFY_TIMEOUT_SECONDS", notify_timeout_seconds);

    env_int("TRIGGER", trigger);
    env_int("LATENCY_TRIGGER", latency_trigger);
    env_int("DNS_TRIGGER", dns_trigger);
    env_int("LOSS_TRIGGER", loss_trigger);
    env_double("LATENCY_THRESHOLD_MS", latency_threshold_ms);
    env_int("LOSS_THRESHOLD_PERCENT", loss_threshold_percent);
    env_bool("TRACK_PACKET_LOSS", track_packet_loss);

    env_string("LOG_PATH", log_path);
    env_string("STATUS_PATH", status_path);
    env_string("CREDENTIALS_PATH", credentials_path);

    env_string("DISPLAY_TZ", display_tz);
    env_string("LOG_LEVEL", log_level);
    env_bool("VERBOSE", verbose);

    env_string("WEB_TITLE", web_title);
    env_string("WEB_LISTEN_ADDR", web_listen_addr);
    env_int("WEB_PORT", web_port);
    env_int("WEB_LOG_LINES", web_log_lines);
    env_int("STATUS_MAX_AGE", status_max_age);
    if (auto hosts = util::get_env("ALLOWED_HOSTS")) {
        allowed_hosts = util::split_list(*hosts);
    }
}

void Config::normalize() {
    if (ping_host.empty()) ping_host = "8.8.8.8";
    if (dns_host.empty()) dns_host = "www.google.com";
    if (ping_command.empty()) ping_command = "fping";

    clamp_setting("pings", pings, 1, 100);
    clamp_setting("interval", interval, 1, 86400);
    clamp_setting("trigger", trigger, 1, 10000);
    clamp_setting("latency_trigger", latency_trigger, 1, 10000);
    clamp_setting("dns_trigger", dns_trigger, 1, 10000);
    clamp_setting("loss_trigger", loss_trigger, 1, 10000);
    clamp_setting("loss_threshold_percent", loss_threshold_percent, 0, 99);
    clamp_setting("notify_timeout_seconds", notify_timeout_seconds, 1, 300);
    clamp_setting("web_port", web_port, 1, 65535);
    clamp_setting("web_log_lines", web_log_lines, 1, 100000);

    if (latency_threshold_ms <= 0.0) {
        spdlog::warn("latency_threshold_ms must be positive, using 1000");
        latency_threshold_ms = 1000.0;
    }

    // fping sends one echo per second, so a batch needs about `pings` seconds
    if (interval <= pings) {
        spdlog::warn("interval={} is too short for {} pings, using interval={}", interval, pings, pings + 1);
        interval = pings + 1;
    }

    // A hung ping or DNS lookup must never stall the loop past one interval
    int max_timeout = std::max(1, interval - 1);
    clamp_setting("probe_timeout_seconds", probe_timeout_seconds, pings, max_timeout);
    clamp_setting("dns_timeout_seconds", dns_timeout_seconds, 1, max_timeout);

    if (log_path.empty()) log_path = "/var/log/connection.log";
    if (status_path.empty()) {
        auto dir = std::filesystem::path(log_path).parent_path();
        status_path = (dir / "connection_status.json").string();
    }
}
