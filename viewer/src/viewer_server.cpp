#include "viewer_server.hpp"
#include "log_reader.hpp"
#include "page_renderer.hpp"
#include "status_reader.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

class ViewerServer::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config),
          log_reader_(config.log_path),
          status_reader_(config.status_path, config.status_max_age) {
        register_routes();
    }

    bool listen() {
        spdlog::info("Log viewer listening on {}:{}", config_.web_listen_addr, config_.web_port);
        if (!server_.listen(config_.web_listen_addr.c_str(), config_.web_port)) {
            spdlog::error("Failed to start log viewer on {}:{}", config_.web_listen_addr, config_.web_port);
            return false;
        }
        spdlog::info("Log viewer stopped");
        return true;
    }

    void stop() {
        if (server_.is_running()) {
            server_.stop();
        }
    }

private:
    void register_routes() {
        server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
            if (ViewerServer::is_allowed(config_.allowed_hosts, req.remote_addr)) {
                return httplib::Server::HandlerResponse::Unhandled;
            }
            spdlog::warn("Rejected request for {} from {}", req.path, req.remote_addr);
            res.status = 403;
            res.set_content("You're not allowed to access this resource", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        });

        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        server_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            auto status = status_reader_.load();
            nlohmann::json body = {
                {"internet", status.internet.to_json()},
                {"dns", status.dns.to_json()}
            };
            res.set_content(body.dump(), "application/json");
        });

        server_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
            PageModel model;
            model.title = config_.web_title;
            model.log_lines = log_reader_.tail(static_cast<std::size_t>(config_.web_log_lines));
            model.log_line_limit = config_.web_log_lines;
            model.log_path = config_.log_path;
            model.status = status_reader_.load();
            model.refresh_seconds = config_.interval;
            res.set_content(render_index_page(model), "text/html; charset=utf-8");
        });

        server_.Post("/clear-log", [this](const httplib::Request& req, httplib::Response& res) {
            if (!log_reader_.clear()) {
                spdlog::warn("Clear log requested by {} failed", req.remote_addr);
            }
            res.set_redirect("/", 303);
        });
    }

    Config config_;
    LogReader log_reader_;
    StatusReader status_reader_;
    httplib::Server server_;
};

ViewerServer::ViewerServer(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

ViewerServer::~ViewerServer() = default;

bool ViewerServer::listen() {
    return pImpl_->listen();
}

void ViewerServer::stop() {
    pImpl_->stop();
}

bool ViewerServer::is_allowed(const std::vector<std::string>& allowed_hosts, const std::string& remote_addr) {
    if (allowed_hosts.empty()) {
        return true;
    }
    return std::find(allowed_hosts.begin(), allowed_hosts.end(), remote_addr) != allowed_hosts.end();
}
