#pragma once

#include <chrono>
#include <string>

class DnsResolver {
public:
    // True when the OS resolver returns at least one address within the timeout.
    // A lookup that overruns is abandoned on a detached thread and counts as a failure.
    static bool resolve(const std::string& host, std::chrono::milliseconds timeout);
};
