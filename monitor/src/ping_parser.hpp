#pragma once

#include <optional>
#include <string>

struct PingReport {
    std::optional<int> loss_percent;
    std::optional<double> avg_latency_ms;
};

// Extracts loss and average round-trip time from a ping tool's summary.
// Understands fping ("xmt/rcv/%loss = 5/5/0%, min/avg/max = 1.1/2.2/3.3") and
// iputils ping ("0% packet loss", "rtt min/avg/max/mdev = ..."). Anything it
// cannot find stays empty.
class PingParser {
public:
    static PingReport parse(const std::string& output);

private:
    static std::optional<int> parse_loss(const std::string& output);
    static std::optional<double> parse_avg_latency(const std::string& output);
};
