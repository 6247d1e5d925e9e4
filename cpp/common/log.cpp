#include "ncaplay/log.hpp"
#include <mutex>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ncaplay {

namespace {
constexpr const char* kLoggerName = "ncaplay";
std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;
    return spdlog::stdout_color_mt(kLoggerName);
}

void init_logging(const std::string& level, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sinks.push_back(console_sink);
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    }

    auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    lg->set_level(spdlog::level::from_str(level));
    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(lg);
}

}
