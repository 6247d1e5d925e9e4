#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace ncaplay {

// Library logger "ncaplay". Created on first use with a stdout color sink.
std::shared_ptr<spdlog::logger> logger();

// Replaces the library logger with console + optional file sinks and makes it the
// spdlog default. level is an spdlog level name ("debug", "info", ...).
void init_logging(const std::string& level, const std::string& log_file = "");

}
