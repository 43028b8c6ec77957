#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

// Append-only, human readable record of connectivity transitions:
// "2025-12-07 12:34:56 (+) message" for good news, "(-)" for bad news, UTC.
class ConnectionLog {
public:
    explicit ConnectionLog(const std::string& path);
    ~ConnectionLog();

    void append(bool ok, const std::string& message);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::shared_ptr<spdlog::logger> logger_;
};
