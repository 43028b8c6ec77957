#pragma once

#include <cstddef>
#include <string>
#include <vector>

class LogReader {
public:
    explicit LogReader(const std::string& path);

    // Last `limit` lines, oldest first; a missing file is empty
    std::vector<std::string> tail(std::size_t limit) const;

    // Truncates the log, creating it (and its directory) if missing
    bool clear() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
