#pragma once

#include "config.hpp"
#include "process_runner.hpp"
#include "types.hpp"

// Produces one SampleResult per call. Implementations never throw; every
// failure ends up in the result.
class Sampler {
public:
    virtual ~Sampler() = default;
    virtual SampleResult probe() = 0;
};

// Batch ping through an external tool (fping by default) plus a DNS lookup
class PingSampler : public Sampler {
public:
    explicit PingSampler(const Config& config);

    SampleResult probe() override;

    std::vector<std::string> ping_command_line() const;

    // Maps a finished ping run onto reachability, loss and latency
    static SampleResult classify(const ProcessResult& run);

private:
    Config config_;
};
