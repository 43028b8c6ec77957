#include "sampler.hpp"
#include "dns_resolver.hpp"
#include "ping_parser.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

PingSampler::PingSampler(const Config& config) : config_(config) {}

std::vector<std::string> PingSampler::ping_command_line() const {
    return {config_.ping_command, "-q", "-c", std::to_string(config_.pings), config_.ping_host};
}

SampleResult PingSampler::probe() {
    auto sampled_at = std::chrono::system_clock::now();

    auto run = ProcessRunner::run(ping_command_line(), std::chrono::seconds(config_.probe_timeout_seconds));
    SampleResult sample = classify(run);
    sample.sampled_at = sampled_at;

    // Without reachability a DNS failure says nothing about DNS
    if (sample.is_up()) {
        sample.dns_checked = true;
        sample.dns_resolved = DnsResolver::resolve(config_.dns_host,
                                                   std::chrono::seconds(config_.dns_timeout_seconds));
    }

    spdlog::debug("Sample: reachable={} loss={} avg={} dns={}",
                  sample.reachable ? (*sample.reachable ? "up" : "down") : "unknown",
                  sample.loss_percent ? std::to_string(*sample.loss_percent) : "unknown",
                  sample.avg_latency_ms ? fmt::format("{:.3f}", *sample.avg_latency_ms) : "unknown",
                  sample.dns_checked ? (sample.dns_resolved ? "ok" : "failed") : "skipped");
    return sample;
}

SampleResult PingSampler::classify(const ProcessResult& run) {
    SampleResult sample;

    if (!run.started) {
        sample.probe_error = fmt::format("Unable to run ping: {}", run.error);
        return sample;
    }

    if (run.timed_out) {
        sample.reachable = false;
        sample.probe_error = "Ping timed out and was killed";
        return sample;
    }

    auto report = PingParser::parse(run.stderr_text + "\n" + run.stdout_text);
    sample.loss_percent = report.loss_percent;
    sample.avg_latency_ms = report.avg_latency_ms;

    if (run.exit_code != 0) {
        sample.reachable = false;
        if (run.exit_code == 127) {
            sample.probe_error = "Ping command not found";
        } else {
            std::string detail = util::trim(run.stderr_text);
            sample.probe_error = detail.empty()
                ? fmt::format("Ping exited with status {}", run.exit_code)
                : fmt::format("Ping exited with status {}: {}", run.exit_code, detail);
        }
        return sample;
    }

    if (!report.loss_percent) {
        sample.probe_error = "Unable to parse ping output to get packet loss";
        return sample;
    }

    sample.reachable = *report.loss_percent < 100;
    if (*sample.reachable && !report.avg_latency_ms) {
        sample.probe_error = "Unable to parse ping output to get ping time";
    }
    return sample;
}
