#include "Logging.hpp"
#include "ProxyConfig.hpp"

#include <vector>
#include <limits>
#include <algorithm>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>

std::shared_ptr<spdlog::logger> init_logging(const ProxyConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.log_file.empty()) {
        auto retention = static_cast<uint16_t>(std::min<unsigned>(cfg.log_retention_days, std::numeric_limits<uint16_t>::max()));

        // rotate at midnight, keep one file per retained day
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(cfg.log_file, 0, 0, false, retention));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    logger->set_level(spdlog::level::from_str(cfg.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);

    return logger;
}

std::shared_ptr<spdlog::logger> proxy_logger() {
    auto logger = spdlog::get(LOGGER_NAME);
    return logger ? logger : spdlog::default_logger();
}
