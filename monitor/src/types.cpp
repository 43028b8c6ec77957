#include "types.hpp"

std::string to_string(Signal signal) {
    switch (signal) {
        case Signal::Reachability: return "reachability";
        case Signal::Latency: return "latency";
        case Signal::Dns: return "dns";
        case Signal::PacketLoss: return "packet_loss";
    }
    return "unknown";
}

std::string to_string(EventKind kind) {
    return kind == EventKind::Triggered ? "triggered" : "recovered";
}
