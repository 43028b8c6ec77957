#include "status_publisher.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

StatusPublisher::StatusPublisher(const std::string& path) : path_(path) {}

bool StatusPublisher::publish(const StatusSnapshot& snapshot) {
    const std::filesystem::path target(path_);
    const std::filesystem::path tmp(path_ + ".tmp");

    try {
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc);
            if (!out) {
                spdlog::error("Unable to open {} for writing", tmp.string());
                return false;
            }
            out << snapshot.to_json().dump();
            out.flush();
            if (!out) {
                spdlog::error("Failed to write status snapshot to {}", tmp.string());
                return false;
            }
        }

        std::filesystem::rename(tmp, target);
        spdlog::debug("Status published to {}", path_);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish status to {}: {}", path_, e.what());
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return false;
    }
}
