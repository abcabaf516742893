#pragma once
#include <memory>
#include <string>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ZenFeed {

class Log {
public:
    // Until init() runs every LOG_* call is a no-op.
    static void init(const std::string& logFile = "");
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get() { return s_Logger; }

    static void setLevel(spdlog::level::level_enum level) {
        if (s_Logger) s_Logger->set_level(level);
    }

    // trace|debug|info|warn|error; anything else maps to warn.
    static spdlog::level::level_enum parseLevel(const std::string& name);

    template <typename... Args>
    static void write(spdlog::level::level_enum level, const std::string& cat,
                      const std::string& f, Args&&... args) {
        if (s_Logger && s_Logger->should_log(level)) {
            s_Logger->log(level, "[{}] {}", cat,
                          fmt::vformat(f, fmt::make_format_args(args...)));
        }
    }

private:
    static std::shared_ptr<spdlog::logger> s_Logger;
};

}

#define LOG_T(cat, f, ...) ::ZenFeed::Log::write(spdlog::level::trace, cat, f, ##__VA_ARGS__)
#define LOG_D(cat, f, ...) ::ZenFeed::Log::write(spdlog::level::debug, cat, f, ##__VA_ARGS__)
#define LOG_I(cat, f, ...) ::ZenFeed::Log::write(spdlog::level::info, cat, f, ##__VA_ARGS__)
#define LOG_W(cat, f, ...) ::ZenFeed::Log::write(spdlog::level::warn, cat, f, ##__VA_ARGS__)
#define LOG_E(cat, f, ...) ::ZenFeed::Log::write(spdlog::level::err, cat, f, ##__VA_ARGS__)
