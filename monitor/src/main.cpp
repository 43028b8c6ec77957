#include "config.hpp"
#include "monitor_service.hpp"
#include "pushover_notifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

// For graceful shutdown
std::unique_ptr<MonitorService> service;

void signal_handler(int) {
    if (service) {
        service->stop();
    }
}

std::unique_ptr<Notifier> make_notifier(const Config& config) {
    if (config.credentials_path.empty()) {
        spdlog::info("No Pushover credentials configured, notifications are logged only");
        return std::make_unique<LogOnlyNotifier>();
    }

    auto credentials = PushoverNotifier::load_credentials(config.credentials_path);
    if (!credentials) {
        spdlog::warn("Pushover disabled, notifications are logged only");
        return std::make_unique<LogOnlyNotifier>();
    }
    return std::make_unique<PushoverNotifier>(*credentials, config.notify_timeout_seconds);
}

int main(int argc, char* argv[]) {
    util::setup_logging("info", "monitor");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        Config config = Config::from_env(argc > 1 ? argv[1] : "");
        util::setup_logging(config.verbose ? "debug" : config.log_level, "monitor");
        util::apply_display_timezone(config.display_tz);

        spdlog::info("Configuration loaded. Log: {}, status: {}", config.log_path, config.status_path);

        service = std::make_unique<MonitorService>(config,
                                                   std::make_unique<PingSampler>(config),
                                                   make_notifier(config));
        service->run();

        spdlog::info("Monitor service has shut down. Exiting.");
    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
