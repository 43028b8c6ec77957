#include "ping_parser.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <regex>

PingReport PingParser::parse(const std::string& output) {
    PingReport report;
    report.loss_percent = parse_loss(output);
    report.avg_latency_ms = parse_avg_latency(output);
    return report;
}

std::optional<int> PingParser::parse_loss(const std::string& output) {
    static const std::regex fping_loss(R"(xmt/rcv/%loss\s*=\s*\d+/\d+/(\d+(?:\.\d+)?)%)");
    static const std::regex iputils_loss(R"((\d+(?:\.\d+)?)%\s+packet\s+loss)");
    static const std::regex generic_loss(R"((\d+(?:\.\d+)?)%\s*loss)");
    // fping prints the return rate instead of the loss once duplicates push rcv above xmt
    static const std::regex fping_return(R"(xmt/rcv/%return\s*=\s*\d+/\d+/(\d+(?:\.\d+)?)%)");

    std::smatch match;
    std::string raw;
    if (std::regex_search(output, match, fping_return)) {
        auto returned = util::parse_double(match[1].str());
        if (!returned || *returned < 0.0) {
            return std::nullopt;
        }
        return static_cast<int>(std::ceil(std::max(0.0, 100.0 - *returned)));
    }
    if (std::regex_search(output, match, fping_loss) ||
        std::regex_search(output, match, iputils_loss) ||
        std::regex_search(output, match, generic_loss)) {
        raw = match[1].str();
    } else {
        return std::nullopt;
    }

    auto value = util::parse_double(raw);
    if (!value || *value < 0.0 || *value > 100.0) {
        return std::nullopt;
    }
    // Round up so a fractional loss is never reported as none
    return static_cast<int>(std::ceil(*value));
}

std::optional<double> PingParser::parse_avg_latency(const std::string& output) {
    static const std::regex labelled(
        R"(min/avg/max(?:/(?:mdev|stddev))?\s*=\s*(\d+(?:\.\d+)?)/(\d+(?:\.\d+)?)/(\d+(?:\.\d+)?))");
    static const std::regex bare_triple(R"((\d+\.\d+)/(\d+\.\d+)/(\d+\.\d+))");

    std::smatch match;
    if (!std::regex_search(output, match, labelled) &&
        !std::regex_search(output, match, bare_triple)) {
        return std::nullopt;
    }

    auto avg = util::parse_double(match[2].str());
    if (!avg || *avg < 0.0) {
        return std::nullopt;
    }
    return avg;
}
