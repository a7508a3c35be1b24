#include "ProxyApp.hpp"
#include "UpdateChecker.hpp"
#include "Logging.hpp"

#include <print>
#include <algorithm>
#include <thread>
#include <vector>

#ifndef GREEDY_PROXY_VERSION
#define GREEDY_PROXY_VERSION "0.0.0"
#endif

ProxyApp::ProxyApp(ProxyConfig cfg):
    _cfg(std::move(cfg)),
    _processor(_ioc.get_executor(), MultiplierPolicy::from_config(_cfg), _cfg.max_tracked_torrents),
    _server(_ioc, _cfg, _processor)
    {}

void ProxyApp::run() {
    print_banner();

    _server.run();
    install_signal_handlers();
    start_update_check();

    auto n = thread_count();
    std::vector<std::jthread> workers;
    workers.reserve(n - 1);

    // slow trackers must not stall other clients, so the context runs on a pool
    for (unsigned i = 1; i < n; ++i) workers.emplace_back([this] { _ioc.run(); });
    _ioc.run();

    proxy_logger()->info("proxy stopped");
}

void ProxyApp::print_banner() const {
    std::println("--- greedy-proxy {} ---", GREEDY_PROXY_VERSION);
    std::println("Listening on: {}:{}", _cfg.listen_address, _cfg.listen_port);
    std::println("Max upload multiplier: x{} (ramp-up {} s), seeding x{}", _cfg.max_upload_multiplier, _cfg.ramp_up_seconds, _cfg.seeding_multiplier);
    std::println("Ratio limit: {}, cooldown {} min, speed cap {} Mbps", _cfg.global_ratio_limit, _cfg.cooldown_duration_minutes, _cfg.max_simulated_speed_mbps);
    std::println("Logging to: {}", _cfg.log_file.empty() ? "console only" : _cfg.log_file);
}

void ProxyApp::start_update_check() {
    if (_cfg.update_check_url.empty()) return;

    auto checker = std::make_shared<UpdateChecker>(_ioc.get_executor(), _cfg.update_check_url, GREEDY_PROXY_VERSION);

    boost::asio::co_spawn(_ioc,
        [checker]() -> boost::asio::awaitable<void> {
            co_await checker->check();
        },
        boost::asio::detached
    );
}

void ProxyApp::install_signal_handlers() {
    _signals.async_wait([this](const boost::system::error_code& ec, int signal) {
        if (ec) return;

        proxy_logger()->info("signal {} received, shutting down", signal);
        _server.stop();
        _ioc.stop();
    });
}

unsigned ProxyApp::thread_count() const {
    if (_cfg.worker_threads > 0) return _cfg.worker_threads;
    return std::max(1u, std::thread::hardware_concurrency());
}
