#pragma once

#include <memory>

#include <spdlog/spdlog.h>

struct ProxyConfig;

inline constexpr const char* LOGGER_NAME = "proxy";

// console always, daily rotated file when log_file is set
std::shared_ptr<spdlog::logger> init_logging(const ProxyConfig& cfg);

// registered logger, or the default one when init_logging has not run (tests)
std::shared_ptr<spdlog::logger> proxy_logger();
