#pragma once

#include "config.hpp"
#include <memory>
#include <string>
#include <vector>

// Web UI over the connection log and the monitor's status file
class ViewerServer {
public:
    explicit ViewerServer(const Config& config);
    ~ViewerServer();

    // Blocks until stop() is called; false when the socket cannot be bound
    bool listen();
    void stop();

    // Empty allow-list admits every address
    static bool is_allowed(const std::vector<std::string>& allowed_hosts, const std::string& remote_addr);

    // Non-copyable
    ViewerServer(const ViewerServer&) = delete;
    ViewerServer& operator=(const ViewerServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
