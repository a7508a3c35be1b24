#pragma once

#include "server.hpp"
#include "ProxyConfig.hpp"
#include "AnnounceProcessor.hpp"

#include <string>
#include <memory>
#include <csignal>

#include <boost/asio.hpp>

class ProxyApp {
public:
    explicit ProxyApp(ProxyConfig cfg);
    void run();

private:
    void print_banner() const;
    void start_update_check();
    void install_signal_handlers();
    unsigned thread_count() const;

    ProxyConfig _cfg;

    boost::asio::io_context _ioc;
    boost::asio::signal_set _signals{_ioc, SIGINT, SIGTERM};

    AnnounceProcessor _processor;
    ProxyServer _server;
};
