#include "dns_resolver.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <memory>
#include <thread>
#include <netdb.h>
#include <sys/socket.h>

bool DnsResolver::resolve(const std::string& host, std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();

    try {
        std::thread([host, promise]() {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo* res = nullptr;
            int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
            if (rc != 0) {
                spdlog::debug("getaddrinfo({}) failed: {}", host, gai_strerror(rc));
            }
            if (res) {
                ::freeaddrinfo(res);
            }
            promise->set_value(rc == 0);
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("Could not start DNS lookup for {}: {}", host, e.what());
        return false;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("DNS lookup for {} timed out after {} ms", host, timeout.count());
        return false;
    }
    return future.get();
}
