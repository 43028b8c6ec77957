#include "config.hpp"
#include "util.hpp"
#include "viewer_server.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

// For graceful shutdown
std::unique_ptr<ViewerServer> server;

void signal_handler(int) {
    if (server) {
        server->stop();
    }
}

int main(int argc, char* argv[]) {
    util::setup_logging("info", "viewer");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        Config config = Config::from_env(argc > 1 ? argv[1] : "");
        util::setup_logging(config.verbose ? "debug" : config.log_level, "viewer");
        util::apply_display_timezone(config.display_tz);

        spdlog::info("Serving {} (status {}, max age {}s)", config.log_path, config.status_path,
                     config.status_max_age);

        server = std::make_unique<ViewerServer>(config);
        if (!server->listen()) {
            return 1;
        }

        spdlog::info("Log viewer has shut down. Exiting.");
    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
