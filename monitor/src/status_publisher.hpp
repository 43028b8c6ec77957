#pragma once

#include "status_types.hpp"
#include <string>

// Writes the latest snapshot for the viewer. The file is replaced with a
// rename, so readers only ever see a complete record.
class StatusPublisher {
public:
    explicit StatusPublisher(const std::string& path);

    bool publish(const StatusSnapshot& snapshot);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
