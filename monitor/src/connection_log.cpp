#include "connection_log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <filesystem>

ConnectionLog::ConnectionLog(const std::string& path) : path_(path) {
    spdlog::sink_ptr sink;
    try {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_, false);
    } catch (const std::exception& e) {
        spdlog::error("Unable to open connection log {}: {}", path_, e.what());
        sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    }

    // Not registered globally so several instances may share a name
    logger_ = std::make_shared<spdlog::logger>("connection", sink);
    logger_->set_pattern("%Y-%m-%d %H:%M:%S %v", spdlog::pattern_time_type::utc);
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);
    logger_->set_error_handler([path = path_](const std::string& msg) {
        spdlog::error("Unable to write connection log {}: {}", path, msg);
    });
}

ConnectionLog::~ConnectionLog() {
    if (logger_) {
        logger_->flush();
    }
}

void ConnectionLog::append(bool ok, const std::string& message) {
    logger_->info("{} {}", ok ? "(+)" : "(-)", message);
}
