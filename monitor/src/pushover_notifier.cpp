#include "pushover_notifier.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <sstream>

namespace {
const char* kPushoverUrl = "https://api.pushover.net/1/messages.json";
}

PushoverNotifier::PushoverNotifier(PushoverCredentials credentials, int timeout_seconds)
    : credentials_(std::move(credentials)), timeout_seconds_(timeout_seconds) {}

bool PushoverNotifier::send(const std::string& message, const std::string& title) {
    try {
        cpr::Response response = cpr::Post(
            cpr::Url{kPushoverUrl},
            cpr::Payload{
                {"token", credentials_.app_key},
                {"user", credentials_.user_key},
                {"message", message},
                {"title", title}
            },
            cpr::Timeout{std::chrono::milliseconds(timeout_seconds_ * 1000)}
        );

        if (response.error) {
            spdlog::error("Pushover request failed: {}", response.error.message);
            return false;
        }
        if (response.status_code != 200) {
            spdlog::error("Pushover HTTP error {}: {}", response.status_code, response.text);
            return false;
        }

        auto body = nlohmann::json::parse(response.text, nullptr, false);
        if (body.is_discarded() || body.value("status", 0) != 1) {
            spdlog::error("Pushover rejected the message: {}", response.text);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Pushover request failed: {}", e.what());
        return false;
    }
}

std::optional<PushoverCredentials> PushoverNotifier::parse_credentials(const std::string& text) {
    PushoverCredentials creds;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = util::trim(line.substr(0, eq));
        std::string value = util::trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "app_key" || key == "token") {
            creds.app_key = value;
        } else if (key == "user_key" || key == "user") {
            creds.user_key = value;
        }
    }

    if (creds.app_key.empty() || creds.user_key.empty()) {
        return std::nullopt;
    }
    return creds;
}

std::optional<PushoverCredentials> PushoverNotifier::load_credentials(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Unable to read Pushover credentials from {}", path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto creds = parse_credentials(buffer.str());
    if (!creds) {
        spdlog::error("Pushover credentials in {} need both app_key and user_key", path);
    }
    return creds;
}
