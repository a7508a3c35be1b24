#include "ProxyConfig.hpp"
#include "ProxyErrors.hpp"
#include "Utils.hpp"

#include <fstream>
#include <format>
#include <limits>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

namespace po = boost::program_options;

namespace {

std::string key(const char* name) { return std::string("DEFAULT.") + name; }

// lexical_cast would wrap "-1" around, so unsigned keys take plain digits only
template <class T>
po::typed_value<std::string>* unsigned_value(const char* name, T* target) {
    return po::value<std::string>()
        ->default_value(std::to_string(*target))
        ->notifier([name, target](const std::string& text) {
            auto parsed = parse_u64(text);
            if (!parsed || *parsed > std::numeric_limits<T>::max())
                throw ConfigInvalid(std::format("{} must be an integer in [0, {}], got '{}'", name, std::numeric_limits<T>::max(), text));

            *target = static_cast<T>(*parsed);
        });
}

po::options_description make_description(ProxyConfig& cfg) {
    po::options_description desc("config file");

    desc.add_options()
        (key("listen_address").c_str(), po::value<std::string>(&cfg.listen_address)->default_value(cfg.listen_address))
        (key("listen_port").c_str(), unsigned_value("listen_port", &cfg.listen_port))
        (key("worker_threads").c_str(), unsigned_value("worker_threads", &cfg.worker_threads))
        (key("max_upload_multiplier").c_str(), po::value<double>(&cfg.max_upload_multiplier)->default_value(cfg.max_upload_multiplier))
        (key("seeding_multiplier").c_str(), po::value<double>(&cfg.seeding_multiplier)->default_value(cfg.seeding_multiplier))
        (key("ramp_up_seconds").c_str(), unsigned_value("ramp_up_seconds", &cfg.ramp_up_seconds))
        (key("randomization_factor").c_str(), po::value<double>(&cfg.randomization_factor)->default_value(cfg.randomization_factor))
        (key("max_simulated_speed_mbps").c_str(), po::value<double>(&cfg.max_simulated_speed_mbps)->default_value(cfg.max_simulated_speed_mbps))
        (key("global_ratio_limit").c_str(), po::value<double>(&cfg.global_ratio_limit)->default_value(cfg.global_ratio_limit))
        (key("cooldown_duration_minutes").c_str(), unsigned_value("cooldown_duration_minutes", &cfg.cooldown_duration_minutes))
        (key("upstream_timeout_seconds").c_str(), unsigned_value("upstream_timeout_seconds", &cfg.upstream_timeout_seconds))
        (key("max_tracked_torrents").c_str(), unsigned_value("max_tracked_torrents", &cfg.max_tracked_torrents))
        (key("log_file").c_str(), po::value<std::string>(&cfg.log_file)->default_value(cfg.log_file))
        (key("log_retention_days").c_str(), unsigned_value("log_retention_days", &cfg.log_retention_days))
        (key("log_level").c_str(), po::value<std::string>(&cfg.log_level)->default_value(cfg.log_level))
        (key("update_check_url").c_str(), po::value<std::string>(&cfg.update_check_url)->default_value(cfg.update_check_url));

    return desc;
}

} // namespace

ProxyConfig parse_config(std::istream& in) {
    ProxyConfig cfg;
    auto desc = make_description(cfg);

    try {
        po::variables_map vm;
        po::store(po::parse_config_file(in, desc, true), vm);
        po::notify(vm);
    }
    catch (const po::error& ex) {
        throw ConfigInvalid(ex.what());
    }

    validate_config(cfg);
    return cfg;
}

ProxyConfig load_config(const std::string& path) {
    std::ifstream file(path);

    if (!file.is_open()) {
        spdlog::warn("config file {} not found, using defaults", path);
        ProxyConfig cfg;
        validate_config(cfg);
        return cfg;
    }

    return parse_config(file);
}

void validate_config(const ProxyConfig& cfg) {
    if (cfg.listen_port == 0)
        throw ConfigInvalid("listen_port must be non-zero");

    if (cfg.max_upload_multiplier < 1.0)
        throw ConfigInvalid(std::format("max_upload_multiplier must be >= 1.0, got {}", cfg.max_upload_multiplier));

    if (cfg.seeding_multiplier < 1.0)
        throw ConfigInvalid(std::format("seeding_multiplier must be >= 1.0, got {}", cfg.seeding_multiplier));

    if (cfg.ramp_up_seconds == 0)
        throw ConfigInvalid("ramp_up_seconds must be positive");

    if (cfg.randomization_factor < 0.0 || cfg.randomization_factor >= 1.0)
        throw ConfigInvalid(std::format("randomization_factor must be in [0, 1), got {}", cfg.randomization_factor));

    if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off")
        throw ConfigInvalid("unknown log_level: " + cfg.log_level);
}
