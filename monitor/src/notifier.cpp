#include "notifier.hpp"
#include <spdlog/spdlog.h>

bool LogOnlyNotifier::send(const std::string& message, const std::string& title) {
    spdlog::info("Notification [{}]: {}", title, message);
    return true;
}
