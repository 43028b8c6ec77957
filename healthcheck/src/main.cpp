#include "config.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>

// Container healthcheck: exit 0 when the viewer answers /health with 200
int main(int argc, char* argv[]) {
    util::setup_logging("warn", "healthcheck");

    try {
        Config config = Config::from_env(argc > 1 ? argv[1] : "");
        std::string url = fmt::format("http://127.0.0.1:{}/health", config.web_port);

        cpr::Response response = cpr::Get(cpr::Url{url}, cpr::Timeout{std::chrono::milliseconds(5000)});
        if (response.error) {
            spdlog::error("Healthcheck failed for {}: {}", url, response.error.message);
            return 1;
        }
        if (response.status_code != 200) {
            spdlog::error("Healthcheck bad status {} from {}", response.status_code, url);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::critical("Healthcheck failed: {}", e.what());
        return 1;
    }

    return 0;
}
