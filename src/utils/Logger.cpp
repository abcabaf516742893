#include "utils/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <vector>

namespace ZenFeed {

std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::init(const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            // 5MB per file, 3 rotated files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "Log file %s unavailable: %s\n", logFile.c_str(), ex.what());
        }
    }

    s_Logger = std::make_shared<spdlog::logger>("zenfeed", sinks.begin(), sinks.end());
    s_Logger->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");
    s_Logger->set_level(spdlog::level::warn);
    s_Logger->flush_on(spdlog::level::warn);
}

void Log::shutdown() {
    if (s_Logger) s_Logger->flush();
    s_Logger.reset();
}

spdlog::level::level_enum Log::parseLevel(const std::string& name) {
    if (name == "trace" || name == "TRACE") return spdlog::level::trace;
    if (name == "debug" || name == "DEBUG") return spdlog::level::debug;
    if (name == "info" || name == "INFO") return spdlog::level::info;
    if (name == "error" || name == "ERROR") return spdlog::level::err;
    return spdlog::level::warn;
}

}
