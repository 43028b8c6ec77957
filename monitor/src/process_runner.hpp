#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
    bool started = false;       // false: the child could not be created at all
    bool timed_out = false;     // killed after the deadline
    int exit_code = -1;         // 128 + signal number when terminated by a signal
    std::string stdout_text;
    std::string stderr_text;
    std::string error;          // reason when !started
};

// Runs a command without a shell and captures both output streams. The child
// is killed with SIGKILL once the timeout elapses.
class ProcessRunner {
public:
    static ProcessResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);
};
