#pragma once

#include <string>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "Forwarder.hpp"

namespace http = boost::beast::http;

struct ProxyConfig;
class AnnounceProcessor;

class ProxyServer {
public:
    ProxyServer(boost::asio::io_context& ioc, const ProxyConfig& cfg, AnnounceProcessor& processor);

    void run(); // bind and start accepting connections asynchronously
    void stop();

    // bound port, differs from the configured one when that was 0
    unsigned short port() const;

    // recognizer -> state -> rewriter, falls back to the untouched target on any announce problem
    [[nodiscard]] boost::asio::awaitable<std::string> apply_announce_policy(http::verb method, std::string target);

private:
    // connection handler coroutine
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(boost::asio::ip::tcp::socket socket);

    boost::asio::awaitable<void> send_error(boost::asio::ip::tcp::socket& socket, http::status status, unsigned version, std::string_view message);

    boost::asio::io_context& _ioc;
    std::string _address;
    unsigned short _port;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> _acceptor;

    AnnounceProcessor& _processor;
    Forwarder _forwarder;

    static constexpr uint64_t REQUEST_BODY_LIMIT = 1024 * 1024;
};
