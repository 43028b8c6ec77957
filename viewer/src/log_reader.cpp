#include "log_reader.hpp"
#include <spdlog/spdlog.h>
#include <deque>
#include <filesystem>
#include <fstream>

LogReader::LogReader(const std::string& path) : path_(path) {}

std::vector<std::string> LogReader::tail(std::size_t limit) const {
    std::ifstream file(path_);
    if (!file || limit == 0) {
        return {};
    }

    std::deque<std::string> window;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        window.push_back(std::move(line));
        if (window.size() > limit) {
            window.pop_front();
        }
    }
    return {window.begin(), window.end()};
}

bool LogReader::clear() const {
    try {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        std::ofstream file(path_, std::ios::out | std::ios::trunc);
        if (!file) {
            spdlog::error("Unable to truncate log {}", path_);
            return false;
        }
        spdlog::info("Connection log {} cleared", path_);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Unable to clear log {}: {}", path_, e.what());
        return false;
    }
}
